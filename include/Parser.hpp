#pragma once

#include "Lexer.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

struct Expr;
using ExprPtr = std::unique_ptr<Expr>;

enum class BinaryOperator {
  Add,
  Subtract,
  Multiply,
};

struct NumberLiteral {
  int value;
};
struct VariableReference {
  std::string name;
};
// The target is only checked to be a VariableReference when evaluated.
struct Assignment {
  ExprPtr target;
  ExprPtr value;
};
struct BinaryOp {
  BinaryOperator op;
  ExprPtr left;
  ExprPtr right;
};

struct Expr {
  std::variant<NumberLiteral, VariableReference, Assignment, BinaryOp> v;
  template <class T>
  Expr(T&& arg) : v(std::forward<T>(arg)) {}
};

struct ParseLimits {
  // Parenthesized terms and assignment right-hand sides each add one level.
  std::size_t max_depth = 256;
};

/*
 * term       := Number | Identifier | '(' expression ')'
 * expression := term ( '+' term | '-' term | '*' term | '=' expression )?
 *
 * Binary operators do not chain, so "1 + 2 + 3" is rejected because
 * "+ 3" is left over. Throws ParseError.
 */
ExprPtr parse(const std::vector<Token>& tokens, ParseLimits limits = {});
