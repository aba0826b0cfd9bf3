#pragma once

#include "common/EnumClass.hpp"

#include <string>
#include <vector>

namespace LX {
struct Command {
  StatementType type{StatementType::Empty};
  std::string keyword;
  std::vector<std::string> args;
};
} // namespace LX
