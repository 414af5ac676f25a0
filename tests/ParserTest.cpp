#include "Errors.hpp"
#include "Format.hpp"
#include "Lexer.hpp"
#include "Parser.hpp"
#include <gtest/gtest.h>
#include <string>

namespace {
std::string render(std::string_view line, ParseLimits limits = {}) {
  return fmt::format("{}", *parse(tokenize(line), limits));
}

std::string nested(std::size_t depth) {
  return std::string(depth, '(') + "1" + std::string(depth, ')');
}
} // namespace

TEST(ParserTest, BareTerms) {
  EXPECT_EQ(render("42"), "NumberLiteral(42)");
  EXPECT_EQ(render("x"), R"(VariableReference("x"))");
  EXPECT_EQ(render("((7))"), "NumberLiteral(7)");
}

TEST(ParserTest, BinaryOperators) {
  EXPECT_EQ(render("1 + 2"), "BinaryOp(Add, NumberLiteral(1), NumberLiteral(2))");
  EXPECT_EQ(
    render("a - 2"),
    R"(BinaryOp(Subtract, VariableReference("a"), NumberLiteral(2)))"
  );
  EXPECT_EQ(
    render("3*b"), R"(BinaryOp(Multiply, NumberLiteral(3), VariableReference("b")))"
  );
}

TEST(ParserTest, Assignment) {
  EXPECT_EQ(
    render("x = 5"), R"(Assignment(VariableReference("x"), NumberLiteral(5)))"
  );
}

TEST(ParserTest, AssignmentChainsToTheRight) {
  EXPECT_EQ(
    render("a = b = 3"),
    R"(Assignment(VariableReference("a"), Assignment(VariableReference("b"), NumberLiteral(3))))"
  );
}

TEST(ParserTest, AssignmentTargetIsNotCheckedWhileParsing) {
  EXPECT_EQ(render("2 = 3"), "Assignment(NumberLiteral(2), NumberLiteral(3))");
}

TEST(ParserTest, ParenthesizedLeftOperand) {
  auto tree = parse(tokenize("(1 + 2) * 3"));
  const auto* mul = std::get_if<BinaryOp>(&tree->v);
  ASSERT_NE(mul, nullptr);
  EXPECT_EQ(mul->op, BinaryOperator::Multiply);
  const auto* add = std::get_if<BinaryOp>(&mul->left->v);
  ASSERT_NE(add, nullptr);
  EXPECT_EQ(add->op, BinaryOperator::Add);
  EXPECT_EQ(std::get<NumberLiteral>(mul->right->v).value, 3);
}

TEST(ParserTest, BinaryOperatorsDoNotChain) {
  EXPECT_THROW(parse(tokenize("1 + 2 + 3")), TrailingTokens);
  EXPECT_THROW(parse(tokenize("2 * 3 + 4")), TrailingTokens);
}

TEST(ParserTest, TrailingTokensNameLastConsumedToken) {
  try {
    parse(tokenize("1 + 2 + 3"));
    FAIL() << "expected TrailingTokens";
  } catch (const TrailingTokens& e) {
    EXPECT_NE(std::string(e.what()).find(R"(Number("2"))"), std::string::npos);
  }
}

TEST(ParserTest, UnclosedParenthesis) {
  try {
    parse(tokenize("(1 + 2"));
    FAIL() << "expected UnclosedParenthesis";
  } catch (const UnclosedParenthesis& e) {
    EXPECT_NE(
      std::string(e.what()).find(
        "BinaryOp(Add, NumberLiteral(1), NumberLiteral(2))"
      ),
      std::string::npos
    );
  }
}

TEST(ParserTest, MissingTerm) {
  EXPECT_THROW(parse(tokenize(")")), UnexpectedToken);
  EXPECT_THROW(parse(tokenize("1 +")), UnexpectedToken);
  EXPECT_THROW(parse(tokenize("-1")), UnexpectedToken);
  EXPECT_THROW(parse({}), UnexpectedToken);
}

TEST(ParserTest, NumberOutOfRange) {
  EXPECT_EQ(render("2147483647"), "NumberLiteral(2147483647)");
  EXPECT_THROW(parse(tokenize("99999999999")), InvalidNumber);
}

TEST(ParserTest, NestingLimit) {
  EXPECT_EQ(render(nested(3), {.max_depth = 3}), "NumberLiteral(1)");
  EXPECT_THROW(parse(tokenize(nested(4)), {.max_depth = 3}), NestingTooDeep);
  EXPECT_THROW(parse(tokenize(nested(300))), NestingTooDeep);
}

TEST(ParserTest, AssignmentChainCountsTowardsNesting) {
  EXPECT_THROW(
    parse(tokenize("a = b = c = d = 1"), {.max_depth = 3}), NestingTooDeep
  );
}

TEST(ParserTest, AllErrorsAreParseErrors) {
  EXPECT_THROW(parse(tokenize("(")), ParseError);
  EXPECT_THROW(parse(tokenize("x y")), ParseError);
}
