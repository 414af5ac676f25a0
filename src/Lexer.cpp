#include "Lexer.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace {
using sv = std::string_view;

struct SymbolInfo {
  char symbol;
  TokenKind kind;
};

static constexpr std::array symbols = {
  SymbolInfo{'+', TokenKind::Plus},
  SymbolInfo{'-', TokenKind::Minus},
  SymbolInfo{'*', TokenKind::Times},
  SymbolInfo{'(', TokenKind::LeftParen},
  SymbolInfo{')', TokenKind::RightParen},
  SymbolInfo{'=', TokenKind::Assign},
};

constexpr auto is_alpha = [](unsigned char c) { return std::isalpha(c); };
constexpr auto is_digit = [](unsigned char c) { return std::isdigit(c); };
constexpr auto is_space = [](unsigned char c) { return std::isspace(c); };

// Non-ASCII code points with the Unicode White_Space property.
static constexpr std::array<char32_t, 19> unicode_spaces = {
  0x0085, 0x00A0, 0x1680, 0x2000, 0x2001, 0x2002, 0x2003,
  0x2004, 0x2005, 0x2006, 0x2007, 0x2008, 0x2009, 0x200A,
  0x2028, 0x2029, 0x202F, 0x205F, 0x3000,
};

// Length in bytes of the UTF-8 sequence introduced by `lead`.
std::size_t sequence_length(unsigned char lead) {
  if ((lead & 0xE0) == 0xC0)
    return 2;
  if ((lead & 0xF0) == 0xE0)
    return 3;
  if ((lead & 0xF8) == 0xF0)
    return 4;
  return 1;
}

// Code point of a complete, well-formed sequence; malformed input yields
// U+FFFD, which is never whitespace.
char32_t decode(sv sequence) {
  auto lead = static_cast<unsigned char>(sequence.front());
  if (sequence.size() != sequence_length(lead) || sequence.size() == 1)
    return 0xFFFD;
  char32_t code = lead & (0x7F >> sequence.size());
  for (unsigned char c : sequence.substr(1)) {
    if ((c & 0xC0) != 0x80)
      return 0xFFFD;
    code = (code << 6) | (c & 0x3F);
  }
  return code;
}

template <class Pred>
std::size_t scan_run(sv source, std::size_t start, Pred pred) {
  auto rest = source.substr(start);
  auto end = std::ranges::find_if_not(rest, pred);
  return end - rest.begin();
}
} // namespace

std::size_t whitespace_length(sv text) {
  if (text.empty())
    return 0;
  unsigned char lead = text.front();
  if (lead < 0x80)
    return is_space(lead) ? 1 : 0;
  auto sequence = text.substr(0, sequence_length(lead));
  if (std::ranges::find(unicode_spaces, decode(sequence)) ==
      unicode_spaces.end())
    return 0;
  return sequence.size();
}

bool is_blank(sv text) {
  while (auto length = whitespace_length(text))
    text.remove_prefix(length);
  return text.empty();
}

std::vector<Token> tokenize(sv source) {
  std::vector<Token> tokens;
  std::size_t n = 0;
  std::size_t position = 0;

  while (n < source.size()) {
    unsigned char c = source[n];
    if (auto length = whitespace_length(source.substr(n))) {
      n += length;
      ++position;
      continue;
    }

    if (is_digit(c) || is_alpha(c)) {
      auto kind = is_digit(c) ? TokenKind::Number : TokenKind::Identifier;
      auto length = kind == TokenKind::Number ? scan_run(source, n, is_digit)
                                              : scan_run(source, n, is_alpha);
      tokens.push_back({kind, std::string(source.substr(n, length)), position});
      n += length;
      position += length;
      continue;
    }

    auto it = std::ranges::find(symbols, source[n], &SymbolInfo::symbol);
    if (it == symbols.end())
      throw LexError(source.substr(n, sequence_length(c)), position);
    tokens.push_back({it->kind, std::string(1, it->symbol), position});
    ++n;
    ++position;
  }
  return tokens;
}
