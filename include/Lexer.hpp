#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

enum class TokenKind {
  Number,
  Identifier,
  Plus,
  Minus,
  Times,
  LeftParen,
  RightParen,
  Assign,
};

struct Token {
  TokenKind kind;
  std::string text;
  // Index of the first character, counted in characters rather than bytes.
  std::size_t position;
};

// Throws LexError on the first character that starts no token.
std::vector<Token> tokenize(std::string_view source);

// Byte length of the whitespace character (ASCII or Unicode White_Space)
// that starts `text`, or 0 if it does not start with one.
std::size_t whitespace_length(std::string_view text);
bool is_blank(std::string_view text);
