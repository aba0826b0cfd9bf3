#include "common/Lexis.hpp"
#include "common/Config.hpp"
#include "common/EnumClass.hpp"
#include "common/Logger.hpp"
#include "common/Status.hpp"
#include "common/util/StringUtil.hpp"
#include "parser/Checker.hpp"
#include "parser/Parser.hpp"

#include "fmt/format.h"

#include <fstream>
#include <string>
#include <vector>

namespace LX {

Lexis::Lexis() { CheckerRegister(); }

Status Lexis::ExecuteCommand(std::string_view line, ResultSet &result_set) {
  Parser parser;
  auto status = parser.Parse(line);
  if (!status.ok()) {
    LOG_WARN("Parse failed: {}", status.GetMessage());
    return status;
  }

  auto &command = parser.command_;
  switch (command.type) {
  case StatementType::Empty:
    break;
  case StatementType::Add:
    LOG_INFO("Execute: ADD command");
    status = HandleAdd(command, result_set);
    break;
  case StatementType::Remove:
    LOG_INFO("Execute: REMOVE command");
    status = HandleRemove(command, result_set);
    break;
  case StatementType::Clear:
    LOG_INFO("Execute: CLEAR command");
    trie_.Clear();
    result_set.AddRow("OK");
    break;
  case StatementType::Contains:
  case StatementType::Valid:
  case StatementType::Freq:
  case StatementType::Prefix:
  case StatementType::Complete:
  case StatementType::Force:
    LOG_DEBUG("Execute: {} command", command.keyword);
    status = HandleQuery(command, result_set);
    break;
  case StatementType::Words:
    LOG_DEBUG("Execute: WORDS command");
    status = HandleWords(command, result_set);
    break;
  case StatementType::Dump:
    LOG_DEBUG("Execute: DUMP command");
    result_set.AddRow(trie_.ToString());
    break;
  case StatementType::Load:
    LOG_INFO("Execute: LOAD command");
    status = HandleLoad(command, result_set);
    break;
  case StatementType::Help:
    HandleHelp(result_set);
    break;
  }
  if (!status.ok()) {
    LOG_ERROR("{} failed: {}", command.keyword, status.GetMessage());
  }
  return status;
}

Status Lexis::HandleAdd(const Command &command, ResultSet &result_set) {
  for (auto &word : command.args) {
    trie_.Insert(word);
  }
  result_set.AddRow(fmt::format("OK {}", command.args.size()));
  return Status::OK();
}

Status Lexis::HandleRemove(const Command &command, ResultSet &result_set) {
  size_t removed = 0;
  for (auto &word : command.args) {
    if (trie_.IsValid(word)) {
      removed++;
    }
    trie_.Remove(word);
  }
  result_set.AddRow(fmt::format("OK {}", removed));
  return Status::OK();
}

Status Lexis::HandleQuery(const Command &command, ResultSet &result_set) {
  const auto &word = command.args.front();
  std::optional<std::string> suggestion;
  switch (command.type) {
  case StatementType::Contains:
    result_set.AddRow(fmt::format("{}", trie_.Contains(word)));
    return Status::OK();
  case StatementType::Valid:
    result_set.AddRow(fmt::format("{}", trie_.IsValid(word)));
    return Status::OK();
  case StatementType::Freq:
    result_set.AddRow(std::to_string(trie_.Frequency(word)));
    return Status::OK();
  case StatementType::Prefix:
    result_set.AddRow(trie_.LongestPrefix(word));
    return Status::OK();
  case StatementType::Complete:
    suggestion = trie_.Completion(word);
    break;
  case StatementType::Force:
    suggestion = trie_.CompletionForced(word);
    break;
  default:
    return Status::Error(ErrorCode::SyntaxError,
                         fmt::format("{} is not a query", command.keyword));
  }
  // suggestions are quoted so that a stored "NULL" stays distinguishable
  result_set.AddRow(suggestion.has_value() ? fmt::format("{:?}", *suggestion)
                                           : std::string{null_marker});
  return Status::OK();
}

Status Lexis::HandleWords(const Command &command, ResultSet &result_set) {
  auto words = command.args.empty() ? trie_.Words()
                                    : trie_.WordsWithPrefix(command.args[0]);
  for (auto &word : words) {
    result_set.AddRow(std::move(word));
  }
  return Status::OK();
}

Status Lexis::HandleLoad(const Command &command, ResultSet &result_set) {
  size_t loaded = 0;
  auto status = LoadWords(command.args.front(), &loaded);
  if (status.ok()) {
    result_set.AddRow(fmt::format("OK {}", loaded));
  }
  return status;
}

void Lexis::HandleHelp(ResultSet &result_set) {
  result_set.AddRow("ADD w...       insert words");
  result_set.AddRow("REMOVE w...    remove words");
  result_set.AddRow("CLEAR          remove everything");
  result_set.AddRow("CONTAINS w     is w a stored prefix");
  result_set.AddRow("VALID w        is w a stored word");
  result_set.AddRow("FREQ w         insertions through w");
  result_set.AddRow("PREFIX w       longest word prefixing w");
  result_set.AddRow("COMPLETE w     most frequent completion of w");
  result_set.AddRow("FORCE w        completion even if w is a word");
  result_set.AddRow("WORDS [p]      words starting with p");
  result_set.AddRow("DUMP           edges in breadth first order");
  result_set.AddRow("LOAD path      insert a word list file");
  result_set.AddRow("HELP           this message");
}

Status Lexis::LoadWords(const std::filesystem::path &path, size_t *loaded) {
  *loaded = 0;
  std::ifstream file(path);
  if (!file.is_open()) {
    return Status::Error(ErrorCode::FileNotOpen,
                         fmt::format("Failed to open file: {}", path.string()));
  }

  // validate the whole file first so a bad line leaves the trie untouched
  std::vector<std::string> words;
  std::string line;
  size_t line_num = 0;
  while (std::getline(file, line)) {
    line_num++;
    StringUtil::Trim(line);
    if (line.empty() || line.front() == '#') {
      continue;
    }
    if (line.size() > MAX_WORD_LENGTH) {
      return Status::Error(
          ErrorCode::DataTooLarge,
          fmt::format("{}:{}: word of {} bytes exceeds the limit of {} bytes",
                      path.string(), line_num, line.size(), MAX_WORD_LENGTH));
    }
    words.push_back(std::move(line));
  }
  if (file.bad()) {
    return Status::Error(ErrorCode::IOError,
                         fmt::format("Failed to read file: {}", path.string()));
  }
  for (auto &word : words) {
    trie_.Insert(word);
  }
  *loaded = words.size();
  LOG_INFO("Loaded {} words from {}", *loaded, path.string());
  return Status::OK();
}
} // namespace LX
