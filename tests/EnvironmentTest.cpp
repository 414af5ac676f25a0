#include "Environment.hpp"
#include "Errors.hpp"
#include <gtest/gtest.h>

TEST(EnvironmentTest, StartsEmpty) {
  Environment env;
  EXPECT_EQ(env.size(), 0u);
  EXPECT_FALSE(env.contains("x"));
}

TEST(EnvironmentTest, AssignThenLookup) {
  Environment env;
  env.assign("x", 5);
  EXPECT_TRUE(env.contains("x"));
  EXPECT_EQ(env.lookup("x"), 5);
}

TEST(EnvironmentTest, AssignOverwrites) {
  Environment env;
  env.assign("x", 5);
  env.assign("x", -2);
  EXPECT_EQ(env.lookup("x"), -2);
  EXPECT_EQ(env.size(), 1u);
}

TEST(EnvironmentTest, UnboundLookupThrows) {
  Environment env;
  env.assign("x", 1);
  try {
    env.lookup("y");
    FAIL() << "expected UnboundVariable";
  } catch (const UnboundVariable& e) {
    EXPECT_EQ(e.name, "y");
  }
  EXPECT_EQ(env.size(), 1u);
}
