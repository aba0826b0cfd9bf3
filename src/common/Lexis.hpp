#pragma once

#include "common/ResultSet.hpp"
#include "common/Status.hpp"
#include "parser/Command.hpp"
#include "storage/Trie.hpp"

#include <filesystem>
#include <string_view>

namespace LX {

// Executes command lines against a single trie.
class Lexis {
  Trie trie_;

  Status HandleAdd(const Command &command, ResultSet &result_set);

  Status HandleRemove(const Command &command, ResultSet &result_set);

  Status HandleQuery(const Command &command, ResultSet &result_set);

  Status HandleWords(const Command &command, ResultSet &result_set);

  Status HandleLoad(const Command &command, ResultSet &result_set);

  static void HandleHelp(ResultSet &result_set);

public:
  Lexis();

  Status ExecuteCommand(std::string_view line, ResultSet &result_set);

  // Inserts every non blank line of a word list, '#' starts a comment line.
  // loaded receives the number of words inserted.
  Status LoadWords(const std::filesystem::path &path, size_t *loaded);

  const Trie &GetTrie() const { return trie_; }
};
} // namespace LX
