#pragma once

#include <cstddef>
#include <fmt/format.h>
#include <stdexcept>
#include <string>
#include <string_view>

struct LexError : std::runtime_error {
  const std::string character;
  const std::size_t position;

  LexError(std::string_view _character, std::size_t _position) :
    std::runtime_error(
      fmt::format(
        "Couldn't parse '{}' at position {} to a token",
        _character,
        _position
      )
    ),
    character(_character),
    position(_position) {}
};

struct ParseError : std::runtime_error {
  ParseError(const std::string& what) : std::runtime_error(what) {}
};
struct UnexpectedToken : ParseError {
  UnexpectedToken(std::string_view found) :
    ParseError(
      fmt::format("Expected a number, a variable or '(', found {}", found)
    ) {}
};
struct UnclosedParenthesis : ParseError {
  UnclosedParenthesis(std::string_view inner) :
    ParseError(fmt::format("'(' not closed by a ')'. Found ( {}", inner)) {}
};
struct TrailingTokens : ParseError {
  TrailingTokens(std::string_view last, std::string_view next) :
    ParseError(
      fmt::format(
        "Unprocessed tokens remain. Last processed: {}, next: {}",
        last,
        next
      )
    ) {}
};
struct InvalidNumber : ParseError {
  InvalidNumber(std::string_view digits) :
    ParseError(
      fmt::format("Number literal '{}' does not fit in an integer", digits)
    ) {}
};
struct NestingTooDeep : ParseError {
  NestingTooDeep(std::size_t limit) :
    ParseError(fmt::format("Expression nested deeper than {} levels", limit)) {
  }
};

struct EvalError : std::runtime_error {
  EvalError(const std::string& what) : std::runtime_error(what) {}
};
struct UnboundVariable : EvalError {
  const std::string name;

  UnboundVariable(std::string_view _name) :
    EvalError(fmt::format("'{}' was never assigned", _name)),
    name(_name) {}
};
struct InvalidAssignment : EvalError {
  InvalidAssignment(std::string_view target, std::string_view value) :
    EvalError(
      fmt::format(
        "Cannot assign {} to {}, the target is not a variable",
        value,
        target
      )
    ) {}
};
struct ArithmeticOverflow : EvalError {
  ArithmeticOverflow(int lhs, std::string_view op_name, int rhs) :
    EvalError(
      fmt::format("Integer overflow in '{} {} {}'", lhs, op_name, rhs)
    ) {}
};
