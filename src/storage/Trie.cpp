#include "storage/Trie.hpp"

#include <queue>

namespace LX {

void Trie::Insert(Slice source) {
  if (source.IsNull()) {
    return;
  }
  std::shared_ptr<TrieNode> node = root_;
  for (size_t i = 0; i < source.Size(); i++) {
    auto c = source[i];
    auto child = node->GetOrCreateChild(c);
    node->UpdateFrequency(c);
    node = std::move(child);
  }
  node->valid = true;
}

void Trie::Remove(Slice source) {
  if (source.IsNull()) {
    return;
  }
  // the root survives even when it reports itself as removable
  RemoveHelper(root_, source, 0);
}

void Trie::Clear() { root_->Clear(); }

bool Trie::Contains(Slice source) const {
  return FindNodeHelper(source) != nullptr;
}

bool Trie::IsValid(Slice source) const {
  auto node = FindNodeHelper(source);
  if (node == nullptr) {
    return false;
  }
  return node->valid;
}

size_t Trie::Frequency(Slice source) const {
  auto node = FindNodeHelper(source);
  if (node == nullptr) {
    return 0;
  }
  return node->frequency;
}

std::string Trie::LongestPrefix(Slice source) const {
  if (source.IsNull()) {
    return {};
  }
  std::shared_ptr<TrieNode> node = root_;
  size_t length = 0;
  size_t i = 0;
  while (true) {
    if (node->valid) {
      length = i;
    }
    if (i == source.Size()) {
      break;
    }
    node = node->GetChild(source[i]);
    if (node == nullptr) {
      break;
    }
    i++;
  }
  return std::string(source.GetData(), length);
}

std::optional<std::string> Trie::Completion(Slice source) const {
  return CompletionHelper(source, false);
}

std::optional<std::string> Trie::CompletionForced(Slice source) const {
  return CompletionHelper(source, true);
}

std::vector<std::string> Trie::Words() const {
  std::vector<std::string> words;
  std::string prefix;
  CollectHelper(root_, prefix, words);
  return words;
}

std::vector<std::string> Trie::WordsWithPrefix(Slice prefix) const {
  std::vector<std::string> words;
  auto node = FindNodeHelper(prefix);
  if (node == nullptr) {
    return words;
  }
  std::string path = prefix.ToString();
  CollectHelper(node, path, words);
  return words;
}

std::string Trie::ToString() const {
  std::string edges;
  std::queue<std::shared_ptr<TrieNode>> queue;
  queue.push(root_);
  while (!queue.empty()) {
    auto node = std::move(queue.front());
    queue.pop();
    for (auto &[c, child] : node->next_level_) {
      edges.push_back(c);
      queue.push(child);
    }
  }
  return edges;
}

std::shared_ptr<TrieNode> Trie::FindNodeHelper(Slice source) const {
  if (source.IsNull()) {
    return nullptr;
  }
  std::shared_ptr<TrieNode> node = root_;
  for (size_t i = 0; i < source.Size(); i++) {
    node = node->GetChild(source[i]);
    if (node == nullptr) {
      return nullptr;
    }
  }
  return node;
}

// returns node when it must stay, nullptr when the parent should drop it
std::shared_ptr<TrieNode> Trie::RemoveHelper(std::shared_ptr<TrieNode> node,
                                             Slice source, size_t index) {
  if (index == source.Size()) {
    if (!node->valid) {
      return node;
    }
    node->valid = false;
    return node->IsLeaf() ? nullptr : node;
  }
  auto c = source[index];
  auto child = node->GetChild(c);
  if (child == nullptr) {
    return node;
  }
  if (RemoveHelper(std::move(child), source, index + 1) == nullptr) {
    node->RemoveChild(c);
  }
  if (!node->valid && node->IsLeaf()) {
    return nullptr;
  }
  return node;
}

void Trie::CollectHelper(const std::shared_ptr<TrieNode> &node,
                         std::string &prefix,
                         std::vector<std::string> &words) const {
  if (node->valid) {
    words.push_back(prefix);
  }
  for (auto &[c, child] : node->next_level_) {
    prefix.push_back(c);
    CollectHelper(child, prefix, words);
    prefix.pop_back();
  }
}

std::optional<std::string> Trie::CompletionHelper(Slice source,
                                                  bool force) const {
  auto node = FindNodeHelper(source);
  if (node == nullptr) {
    return std::nullopt;
  }
  if ((node->valid && !force) || !node->most_frequent.has_value()) {
    return std::nullopt;
  }
  std::string suffix;
  do {
    auto c = *node->most_frequent;
    suffix.push_back(c);
    node = node->GetChild(c);
  } while (node != nullptr && !node->valid &&
           node->most_frequent.has_value());
  return suffix;
}
} // namespace LX
