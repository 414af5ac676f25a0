#include "Parser.hpp"
#include "Errors.hpp"
#include "Format.hpp"
#include <charconv>
#include <system_error>

namespace {
class Parser {
  const std::vector<Token>& tokens;
  const ParseLimits limits;
  std::size_t n = 0;
  std::size_t depth = 0;

  struct Nesting {
    std::size_t& depth;
    Nesting(std::size_t& _depth, std::size_t max_depth) : depth(_depth) {
      if (depth >= max_depth)
        throw NestingTooDeep(max_depth);
      ++depth;
    }
    ~Nesting() {
      --depth;
    }
  };

  bool accept(TokenKind kind) {
    if (n < tokens.size() && tokens[n].kind == kind) {
      ++n;
      return true;
    }
    return false;
  }
  const Token& last() const {
    return tokens[n - 1];
  }
  std::string describe_next() const {
    if (n < tokens.size())
      return fmt::format("{}", tokens[n]);
    return "end of input";
  }

  ExprPtr parse_number() {
    const auto& digits = last().text;
    int value{};
    const auto [ptr, ec] =
      std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc() || ptr != digits.data() + digits.size())
      throw InvalidNumber(digits);
    return std::make_unique<Expr>(NumberLiteral{value});
  }

  ExprPtr parse_term() {
    if (accept(TokenKind::Number))
      return parse_number();
    if (accept(TokenKind::Identifier))
      return std::make_unique<Expr>(VariableReference{last().text});
    if (accept(TokenKind::LeftParen)) {
      Nesting nesting(depth, limits.max_depth);
      auto inner = parse_expression();
      if (!accept(TokenKind::RightParen))
        throw UnclosedParenthesis(fmt::format("{}", *inner));
      return inner;
    }
    throw UnexpectedToken(describe_next());
  }

  ExprPtr parse_binary(BinaryOperator op, ExprPtr left) {
    auto right = parse_term();
    return std::make_unique<Expr>(
      BinaryOp{op, std::move(left), std::move(right)}
    );
  }

public:
  Parser(const std::vector<Token>& _tokens, ParseLimits _limits) :
    tokens(_tokens), limits(_limits) {}

  ExprPtr parse_expression() {
    auto left = parse_term();
    if (accept(TokenKind::Plus))
      return parse_binary(BinaryOperator::Add, std::move(left));
    if (accept(TokenKind::Minus))
      return parse_binary(BinaryOperator::Subtract, std::move(left));
    if (accept(TokenKind::Times))
      return parse_binary(BinaryOperator::Multiply, std::move(left));
    if (accept(TokenKind::Assign)) {
      Nesting nesting(depth, limits.max_depth);
      auto value = parse_expression();
      return std::make_unique<Expr>(
        Assignment{std::move(left), std::move(value)}
      );
    }
    return left;
  }

  void expect_end() const {
    if (n < tokens.size())
      throw TrailingTokens(fmt::format("{}", last()), describe_next());
  }
};
} // namespace

ExprPtr parse(const std::vector<Token>& tokens, ParseLimits limits) {
  Parser parser(tokens, limits);
  auto expr = parser.parse_expression();
  parser.expect_end();
  return expr;
}
