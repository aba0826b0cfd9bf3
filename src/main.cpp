#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>

#include "common/Config.hpp"
#include "common/Lexis.hpp"
#include "common/Logger.hpp"
#include "common/ResultSet.hpp"
#include "common/Status.hpp"
#include "parser/Checker.hpp"
#include "linenoise.h"

namespace {
// linenoise callbacks are plain function pointers
LX::Lexis *g_lexis = nullptr;
std::string g_hint;

// max candidates offered for one tab press
constexpr size_t max_completions = 32;

void CompletionCallback(const char *buf, linenoiseCompletions *lc) {
  std::string line{buf};
  auto split = line.find_last_of(' ');
  if (split == std::string::npos) {
    for (auto &keyword : LX::Checker::KeyWordsWithPrefix(line)) {
      linenoiseAddCompletion(lc, keyword.c_str());
    }
    return;
  }
  auto head = line.substr(0, split + 1);
  auto words = g_lexis->GetTrie().WordsWithPrefix(line.substr(split + 1));
  for (size_t i = 0; i < words.size() && i < max_completions; i++) {
    linenoiseAddCompletion(lc, (head + words[i]).c_str());
  }
}

char *HintsCallback(const char *buf, int *color, int *bold) {
  std::string line{buf};
  auto split = line.find_last_of(' ');
  if (split == std::string::npos || split + 1 == line.size()) {
    return nullptr;
  }
  auto suggestion = g_lexis->GetTrie().Completion(line.substr(split + 1));
  if (!suggestion.has_value()) {
    return nullptr;
  }
  g_hint = *suggestion;
  *color = 90;
  *bold = 0;
  return g_hint.data();
}
} // namespace

int main(int argc, char *argv[]) {
  const char *level = std::getenv(log_level_env);
  LX::Logger::Init(default_log_file, level == nullptr ? "info" : level);

  LX::Lexis lexis;
  g_lexis = &lexis;

  for (int i = 1; i < argc; i++) {
    size_t loaded = 0;
    if (LX::Status status = lexis.LoadWords(argv[i], &loaded); !status.ok()) {
      std::cerr << status.GetMessage() << "\n";
      LX::Logger::Shutdown();
      return 1;
    }
    std::cout << "Loaded " << loaded << " words from " << argv[i] << "\n";
  }

  linenoiseHistorySetMaxLen(HISTORY_MAX_LEN);
  linenoiseSetCompletionCallback(CompletionCallback);
  linenoiseSetHintsCallback(HintsCallback);

  std::cout << "Welcome to Lexis! Type HELP for commands.\n\n";

  while (true) {
    char *line_c_str = linenoise(prompt);
    if (line_c_str == nullptr) {
      break;
    }
    std::string line{line_c_str};
    linenoiseFree(line_c_str);
    if (line == "quit" || line == "exit") {
      break;
    }
    if (line.empty()) {
      continue;
    }

    linenoiseHistoryAdd(line.c_str());

    LX::ResultSet res;
    const auto start = std::chrono::steady_clock::now();
    if (LX::Status status = lexis.ExecuteCommand(line, res); !status.ok()) {
      std::cout << status.GetMessage() << "\n";
    }
    const auto end = std::chrono::steady_clock::now();
    if (!res.Empty()) {
      res.PrintResult(line);
    }
    const std::chrono::duration<double> diff = end - start;
    std::cout << "\nTime : " << std::fixed << std::setprecision(9)
              << diff.count() << "s\n\n";
  }

  std::cout << "Bye.\n";
  LX::Logger::Shutdown();
  return 0;
}
