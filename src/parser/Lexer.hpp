#pragma once

#include "common/Status.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace LX {
// Splits a command line into tokens. Whitespace separates tokens, double
// quotes group them ("" is an empty token) and a backslash inside quotes
// escapes the next character. A trailing ';' is dropped.
class Lexer {
  std::string_view line_;

public:
  explicit Lexer(std::string_view line) : line_(line) {}

  Status Tokenize(std::vector<std::string> &tokens);
};
} // namespace LX
