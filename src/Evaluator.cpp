#include "Evaluator.hpp"
#include "Errors.hpp"
#include "Format.hpp"
#include <cstdint>
#include <functional>
#include <limits>
#include <type_traits>

namespace {
using sv = std::string_view;

template <class>
constexpr bool dependent_false = false;

template <class F>
int checked(int lhs, int rhs, sv op_name) {
  const std::int64_t wide = F{}(std::int64_t{lhs}, std::int64_t{rhs});
  if (wide < std::numeric_limits<int>::min() ||
      wide > std::numeric_limits<int>::max())
    throw ArithmeticOverflow(lhs, op_name, rhs);
  return static_cast<int>(wide);
}

int apply(BinaryOperator op, int lhs, int rhs) {
  switch (op) {
    case BinaryOperator::Add:
      return checked<std::plus<>>(lhs, rhs, "+");
    case BinaryOperator::Subtract:
      return checked<std::minus<>>(lhs, rhs, "-");
    case BinaryOperator::Multiply:
      return checked<std::multiplies<>>(lhs, rhs, "*");
  }
  throw EvalError(fmt::format("Unknown operator {}", static_cast<int>(op)));
}
} // namespace

int evaluate(const Expr& expr, Environment& env) {
  return std::visit(
    [&env]<class T>(const T& node) -> int {
      if constexpr (std::is_same_v<T, NumberLiteral>) {
        return node.value;
      } else if constexpr (std::is_same_v<T, VariableReference>) {
        return env.lookup(node.name);
      } else if constexpr (std::is_same_v<T, Assignment>) {
        int value = evaluate(*node.value, env);
        const auto* target = std::get_if<VariableReference>(&node.target->v);
        if (!target)
          throw InvalidAssignment(
            fmt::format("{}", *node.target), fmt::format("{}", *node.value)
          );
        env.assign(target->name, value);
        return env.lookup(target->name);
      } else if constexpr (std::is_same_v<T, BinaryOp>) {
        int lhs = evaluate(*node.left, env);
        int rhs = evaluate(*node.right, env);
        return apply(node.op, lhs, rhs);
      } else {
        static_assert(dependent_false<T>, "unhandled expression node");
      }
    },
    expr.v
  );
}
