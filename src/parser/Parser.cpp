#include "parser/Parser.hpp"
#include "common/Config.hpp"
#include "common/EnumClass.hpp"
#include "common/Status.hpp"
#include "parser/Checker.hpp"
#include "parser/Lexer.hpp"

#include "fmt/format.h"

#include <iterator>
#include <limits>

namespace LX {

Status Parser::Parse(std::string_view line) {
  command_ = Command{};
  auto first = line.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos || line[first] == '#') {
    return Status::OK();
  }
  std::vector<std::string> tokens;
  Lexer lexer(line);
  if (auto status = lexer.Tokenize(tokens); !status.ok()) {
    return status;
  }
  if (tokens.empty()) {
    return Status::OK();
  }

  auto keyword = tokens.front();
  if (!Checker::IsKeyWord(keyword)) {
    return Status::Error(ErrorCode::SyntaxError,
                         fmt::format("Unknown command '{}', try HELP",
                                     tokens.front()));
  }
  command_.type = Checker::GetStatementType(keyword);
  command_.keyword = std::move(keyword);
  command_.args.assign(std::make_move_iterator(tokens.begin() + 1),
                       std::make_move_iterator(tokens.end()));

  constexpr auto unbounded = std::numeric_limits<size_t>::max();
  Status status;
  switch (command_.type) {
  case StatementType::Add:
  case StatementType::Remove:
    status = CheckArgs(1, unbounded);
    break;
  case StatementType::Contains:
  case StatementType::Valid:
  case StatementType::Freq:
  case StatementType::Prefix:
  case StatementType::Complete:
  case StatementType::Force:
  case StatementType::Load:
    status = CheckArgs(1, 1);
    break;
  case StatementType::Words:
    status = CheckArgs(0, 1);
    break;
  case StatementType::Clear:
  case StatementType::Dump:
  case StatementType::Help:
  case StatementType::Empty:
    status = CheckArgs(0, 0);
    break;
  }
  if (!status.ok()) {
    return status;
  }
  if (command_.type == StatementType::Load) {
    return Status::OK();
  }
  return CheckWordLength();
}

Status Parser::CheckArgs(size_t min_args, size_t max_args) {
  auto n = command_.args.size();
  if (n >= min_args && n <= max_args) {
    return Status::OK();
  }
  if (min_args == max_args) {
    return Status::Error(ErrorCode::SyntaxError,
                         fmt::format("{} expects {} argument(s), got {}",
                                     command_.keyword, min_args, n));
  }
  if (max_args == std::numeric_limits<size_t>::max()) {
    return Status::Error(ErrorCode::SyntaxError,
                         fmt::format("{} expects at least {} argument(s)",
                                     command_.keyword, min_args));
  }
  return Status::Error(ErrorCode::SyntaxError,
                       fmt::format("{} expects {} to {} argument(s), got {}",
                                   command_.keyword, min_args, max_args, n));
}

Status Parser::CheckWordLength() {
  for (auto &arg : command_.args) {
    if (arg.size() > MAX_WORD_LENGTH) {
      return Status::Error(
          ErrorCode::DataTooLarge,
          fmt::format("Word of {} bytes exceeds the limit of {} bytes",
                      arg.size(), MAX_WORD_LENGTH));
    }
  }
  return Status::OK();
}
} // namespace LX
