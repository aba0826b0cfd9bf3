#pragma once

#include "common/Status.hpp"
#include "parser/Command.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace LX {
class Parser {
  Status CheckArgs(size_t min_args, size_t max_args);

  Status CheckWordLength();

public:
  Parser() = default;

  Status Parse(std::string_view line);

  Command command_;
};
} // namespace LX
