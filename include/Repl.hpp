#pragma once

#include "Environment.hpp"
#include <istream>
#include <ostream>
#include <string_view>

inline constexpr std::string_view prompt = "calc > ";

// Runs one line through tokenize, parse and evaluate, echoing the tokens,
// the tree and the result to `out`. Errors propagate to the caller.
int interpret(std::string_view line, Environment& env, std::ostream& out);

// Reads lines until a blank one or end of input. Errors are reported to
// `log` and never end the loop. Returns the process exit code.
int run_repl(std::istream& in, std::ostream& out, std::ostream& log);
