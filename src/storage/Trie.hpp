#pragma once

#include "storage/Slice.hpp"
#include "storage/TrieNode.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace LX {

// Prefix tree over bytes that counts how often each path was inserted.
// Every operation accepts a null Slice and treats it as an absent key: a
// no-op for updates, false / 0 / empty / nullopt for queries.
// Not thread safe.
class Trie {
  std::shared_ptr<TrieNode> root_;

  std::shared_ptr<TrieNode> FindNodeHelper(Slice source) const;

  std::shared_ptr<TrieNode> RemoveHelper(std::shared_ptr<TrieNode> node,
                                         Slice source, size_t index);

  void CollectHelper(const std::shared_ptr<TrieNode> &node,
                     std::string &prefix,
                     std::vector<std::string> &words) const;

  std::optional<std::string> CompletionHelper(Slice source, bool force) const;

public:
  Trie() : root_(std::make_shared<TrieNode>()) {}

  void Insert(Slice source);

  // Clears the word and prunes every node left without a word below it.
  // Frequencies of surviving nodes are kept.
  void Remove(Slice source);

  void Clear();

  // true for any stored prefix, not only whole words
  bool Contains(Slice source) const;

  bool IsValid(Slice source) const;

  size_t Frequency(Slice source) const;

  // longest prefix of source that is a whole word, "" if none
  std::string LongestPrefix(Slice source) const;

  // Suffix obtained by following the most frequent child until a word ends.
  // nullopt if source is missing, has no children, or is already a word.
  std::optional<std::string> Completion(Slice source) const;

  // same as Completion but also extends a source that is already a word
  std::optional<std::string> CompletionForced(Slice source) const;

  // depth first, children in insertion order
  std::vector<std::string> Words() const;

  std::vector<std::string> WordsWithPrefix(Slice prefix) const;

  // every edge character in breadth first order
  std::string ToString() const;
};
} // namespace LX
