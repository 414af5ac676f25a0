#pragma once

#include <cstddef>
#include <map>
#include <string>

class Environment {
  std::map<std::string, int> bindings;

public:
  void assign(const std::string& name, int value);
  // Throws UnboundVariable if `name` was never assigned.
  int lookup(const std::string& name) const;
  bool contains(const std::string& name) const;
  std::size_t size() const;
};
