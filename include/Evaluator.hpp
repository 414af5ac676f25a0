#pragma once

#include "Environment.hpp"
#include "Parser.hpp"

// Only assignments modify `env`. Bindings made before a failure are kept.
int evaluate(const Expr& expr, Environment& env);
