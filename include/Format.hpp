#pragma once

#include "Lexer.hpp"
#include "Parser.hpp"
#include <fmt/format.h>
#include <string_view>
#include <type_traits>
#include <variant>

template <>
struct fmt::formatter<TokenKind> {
  constexpr auto parse(fmt::format_parse_context& ctx) {
    return ctx.begin();
  }
  auto format(TokenKind kind, fmt::format_context& ctx) const {
    std::string_view name = "?";
    switch (kind) {
      case TokenKind::Number: name = "Number"; break;
      case TokenKind::Identifier: name = "Identifier"; break;
      case TokenKind::Plus: name = "Plus"; break;
      case TokenKind::Minus: name = "Minus"; break;
      case TokenKind::Times: name = "Times"; break;
      case TokenKind::LeftParen: name = "LeftParen"; break;
      case TokenKind::RightParen: name = "RightParen"; break;
      case TokenKind::Assign: name = "Assign"; break;
    }
    return fmt::format_to(ctx.out(), "{}", name);
  }
};

template <>
struct fmt::formatter<Token> {
  constexpr auto parse(fmt::format_parse_context& ctx) {
    return ctx.begin();
  }
  auto format(const Token& token, fmt::format_context& ctx) const {
    if (token.kind == TokenKind::Number || token.kind == TokenKind::Identifier)
      return fmt::format_to(ctx.out(), "{}(\"{}\")", token.kind, token.text);
    return fmt::format_to(ctx.out(), "{}", token.kind);
  }
};

template <>
struct fmt::formatter<BinaryOperator> {
  constexpr auto parse(fmt::format_parse_context& ctx) {
    return ctx.begin();
  }
  auto format(BinaryOperator op, fmt::format_context& ctx) const {
    std::string_view name = "?";
    switch (op) {
      case BinaryOperator::Add: name = "Add"; break;
      case BinaryOperator::Subtract: name = "Subtract"; break;
      case BinaryOperator::Multiply: name = "Multiply"; break;
    }
    return fmt::format_to(ctx.out(), "{}", name);
  }
};

template <>
struct fmt::formatter<Expr> {
  constexpr auto parse(fmt::format_parse_context& ctx) {
    return ctx.begin();
  }
  auto format(const Expr& expr, fmt::format_context& ctx) const {
    return std::visit(
      [&ctx]<class T>(const T& node) {
        if constexpr (std::is_same_v<T, NumberLiteral>)
          return fmt::format_to(ctx.out(), "NumberLiteral({})", node.value);
        else if constexpr (std::is_same_v<T, VariableReference>)
          return fmt::format_to(
            ctx.out(), "VariableReference(\"{}\")", node.name
          );
        else if constexpr (std::is_same_v<T, Assignment>)
          return fmt::format_to(
            ctx.out(), "Assignment({}, {})", *node.target, *node.value
          );
        else
          return fmt::format_to(
            ctx.out(), "BinaryOp({}, {}, {})", node.op, *node.left, *node.right
          );
      },
      expr.v
    );
  }
};
