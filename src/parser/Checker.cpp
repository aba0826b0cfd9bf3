#include "parser/Checker.hpp"
#include "common/util/StringUtil.hpp"

namespace LX {
// static member need define on cpp file
Trie Checker::keywords_;
std::map<std::string, StatementType> Checker::statement_types_;

void Checker::RegisterKeyWord(std::string_view keyword, StatementType type) {
  std::string word{keyword};
  StringUtil::ToUpper(word);
  keywords_.Insert(word);
  statement_types_[word] = type;
}

bool Checker::IsKeyWord(std::string &str) {
  StringUtil::ToUpper(str);
  return keywords_.IsValid(str);
}

StatementType Checker::GetStatementType(const std::string &keyword) {
  if (auto ite = statement_types_.find(keyword);
      ite != statement_types_.end()) {
    return ite->second;
  }
  return StatementType::Empty;
}

std::vector<std::string> Checker::KeyWordsWithPrefix(std::string prefix) {
  StringUtil::ToUpper(prefix);
  return keywords_.WordsWithPrefix(prefix);
}

void CheckerRegister() {
  static bool registered = false;
  if (registered) {
    return;
  }
  registered = true;
  Checker::RegisterKeyWord("ADD", StatementType::Add);
  Checker::RegisterKeyWord("REMOVE", StatementType::Remove);
  Checker::RegisterKeyWord("CLEAR", StatementType::Clear);
  Checker::RegisterKeyWord("CONTAINS", StatementType::Contains);
  Checker::RegisterKeyWord("VALID", StatementType::Valid);
  Checker::RegisterKeyWord("FREQ", StatementType::Freq);
  Checker::RegisterKeyWord("PREFIX", StatementType::Prefix);
  Checker::RegisterKeyWord("COMPLETE", StatementType::Complete);
  Checker::RegisterKeyWord("FORCE", StatementType::Force);
  Checker::RegisterKeyWord("WORDS", StatementType::Words);
  Checker::RegisterKeyWord("DUMP", StatementType::Dump);
  Checker::RegisterKeyWord("LOAD", StatementType::Load);
  Checker::RegisterKeyWord("HELP", StatementType::Help);
}
} // namespace LX
