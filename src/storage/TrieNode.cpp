#include "storage/TrieNode.hpp"

#include <algorithm>

namespace LX {

std::shared_ptr<TrieNode> TrieNode::GetChild(char c) const {
  if (auto ite = std::ranges::find_if(
          next_level_, [&](const auto &pair) { return pair.first == c; });
      ite != next_level_.end()) {
    return ite->second;
  }
  return nullptr;
}

std::shared_ptr<TrieNode> TrieNode::GetOrCreateChild(char c) {
  if (auto child = GetChild(c); child != nullptr) {
    return child;
  }
  auto &[_, ptr] = next_level_.emplace_back(c, std::make_shared<TrieNode>());
  return ptr;
}

void TrieNode::UpdateFrequency(char c) {
  auto child = GetChild(c);
  if (child == nullptr) {
    return;
  }
  child->frequency++;
  child->frequency_stamp = ++update_count;
  if (!most_frequent.has_value()) {
    most_frequent = c;
    return;
  }
  auto best = GetChild(*most_frequent);
  if (best == nullptr || best->frequency < child->frequency) {
    most_frequent = c;
  }
}

void TrieNode::RemoveChild(char c) {
  auto ite = std::ranges::find_if(
      next_level_, [&](const auto &pair) { return pair.first == c; });
  if (ite == next_level_.end()) {
    return;
  }
  next_level_.erase(ite);
  if (most_frequent != c) {
    return;
  }
  most_frequent.reset();
  std::shared_ptr<TrieNode> best;
  for (auto &[key, child] : next_level_) {
    if (best == nullptr || child->frequency > best->frequency ||
        (child->frequency == best->frequency &&
         child->frequency_stamp < best->frequency_stamp)) {
      most_frequent = key;
      best = child;
    }
  }
}

void TrieNode::Clear() {
  valid = false;
  most_frequent.reset();
  update_count = 0;
  next_level_.clear();
}
} // namespace LX
