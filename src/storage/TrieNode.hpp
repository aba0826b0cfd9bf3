#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace LX {

struct TrieNode {
  // A valid value of true means that the current string exists.
  // Note that valid only means that the string from the root node to the
  // current node is valid. For example, if you insert the strings: "cart",
  // "ca", then only t and a are valid.
  bool valid{};
  // how many insertions walked the edge arriving at this node
  size_t frequency{};
  // parent's update_count at the moment frequency last changed, a smaller
  // stamp among equal frequencies means that value was reached first
  size_t frequency_stamp{};
  // key of the child with the highest frequency, the first child reaching
  // a frequency keeps the slot until another child strictly exceeds it
  std::optional<char> most_frequent;
  // bumped each time a child's frequency changes
  size_t update_count{};
  // children in insertion order
  std::vector<std::pair<char, std::shared_ptr<TrieNode>>> next_level_;

  std::shared_ptr<TrieNode> GetChild(char c) const;

  std::shared_ptr<TrieNode> GetOrCreateChild(char c);

  // bump the child's frequency and refresh most_frequent
  void UpdateFrequency(char c);

  // erase the child and pick a new most_frequent among the survivors
  void RemoveChild(char c);

  bool IsLeaf() const { return next_level_.empty(); }

  void Clear();
};
} // namespace LX
