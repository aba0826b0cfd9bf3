#pragma once

#include <cstddef>

constexpr auto default_log_file = "./logs/lexis.log";
constexpr auto log_level_env = "LEXIS_LOG_LEVEL";

constexpr auto prompt = "lexis > ";
constexpr int HISTORY_MAX_LEN = 1024;

// Remove and word enumeration recurse once per character, longer words are
// rejected before they reach the trie
constexpr size_t MAX_WORD_LENGTH = 4096;

// printed for a completion that has no suggestion, real ones are quoted
constexpr auto null_marker = "NULL";
