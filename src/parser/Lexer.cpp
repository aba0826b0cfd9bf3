#include "parser/Lexer.hpp"
#include "common/util/StringUtil.hpp"

#include "fmt/format.h"

namespace LX {

Status Lexer::Tokenize(std::vector<std::string> &tokens) {
  auto line = line_;
  while (!line.empty() && StringUtil::IsSpace(line.back())) {
    line.remove_suffix(1);
  }
  if (StringUtil::EndsWith(line, ";")) {
    line.remove_suffix(1);
  }

  size_t pos = 0;
  while (pos < line.size()) {
    if (StringUtil::IsSpace(line[pos])) {
      pos++;
      continue;
    }
    std::string token;
    if (line[pos] != '"') {
      while (pos < line.size() && !StringUtil::IsSpace(line[pos])) {
        token.push_back(line[pos++]);
      }
      tokens.push_back(std::move(token));
      continue;
    }
    auto quote = pos++;
    bool closed = false;
    while (pos < line.size()) {
      auto c = line[pos++];
      if (c == '"') {
        closed = true;
        break;
      }
      if (c == '\\' && pos < line.size()) {
        c = line[pos++];
      }
      token.push_back(c);
    }
    if (!closed) {
      return Status::Error(ErrorCode::SyntaxError,
                           fmt::format("Unterminated quote at column {}",
                                       quote + 1));
    }
    if (pos < line.size() && !StringUtil::IsSpace(line[pos])) {
      return Status::Error(
          ErrorCode::SyntaxError,
          fmt::format("Expect whitespace after quote at column {}", pos));
    }
    tokens.push_back(std::move(token));
  }
  return Status::OK();
}
} // namespace LX
