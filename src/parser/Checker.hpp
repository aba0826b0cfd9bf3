#pragma once

#include "common/EnumClass.hpp"
#include "storage/Trie.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace LX {
// The Checker keeps a trie of registered command keywords
class Checker {
  static Trie keywords_;
  static std::map<std::string, StatementType> statement_types_;

public:
  static void RegisterKeyWord(std::string_view keyword, StatementType type);

  static bool IsKeyWord(std::string &str);

  static StatementType GetStatementType(const std::string &keyword);

  // registered keywords starting with prefix, case insensitive
  static std::vector<std::string> KeyWordsWithPrefix(std::string prefix);
};

void CheckerRegister();
} // namespace LX
