#include "Repl.hpp"
#include "Errors.hpp"
#include "Evaluator.hpp"
#include "Format.hpp"
#include "Lexer.hpp"
#include "Parser.hpp"
#include <fmt/ostream.h>
#include <fmt/ranges.h>
#include <string>

int interpret(std::string_view line, Environment& env, std::ostream& out) {
  auto tokens = tokenize(line);
  fmt::print(out, "tokens: [{}]\n", fmt::join(tokens, ", "));

  auto tree = parse(tokens);
  fmt::print(out, "parsed: {}\n", *tree);

  int result = evaluate(*tree, env);
  fmt::print(out, "{}\n", result);
  return result;
}

int run_repl(std::istream& in, std::ostream& out, std::ostream& log) {
  Environment env;
  std::string line;
  while (true) {
    fmt::print(log, "{}", prompt);
    log.flush();
    if (!std::getline(in, line)) {
      fmt::print(log, "^D Quitting\n");
      return 0;
    }
    if (line.ends_with('\r'))
      line.pop_back();
    if (is_blank(line))
      return 0;

    try {
      interpret(line, env, out);
    } catch (const LexError& e) {
      fmt::print(log, "lex error: {}\n", e.what());
    } catch (const ParseError& e) {
      fmt::print(log, "parse error: {}\n", e.what());
    } catch (const EvalError& e) {
      fmt::print(log, "eval error: {}\n", e.what());
    }
  }
}
