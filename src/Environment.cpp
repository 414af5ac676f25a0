#include "Environment.hpp"
#include "Errors.hpp"

void Environment::assign(const std::string& name, int value) {
  bindings.insert_or_assign(name, value);
}
int Environment::lookup(const std::string& name) const {
  if (auto it = bindings.find(name); it != bindings.end())
    return it->second;
  throw UnboundVariable(name);
}
bool Environment::contains(const std::string& name) const {
  return bindings.contains(name);
}
std::size_t Environment::size() const {
  return bindings.size();
}
