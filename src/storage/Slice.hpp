#pragma once

#include <cstddef>
#include <cstring>
#include <string>
#include <string_view>

namespace LX {
// A non-owning view over the bytes of a key. A Slice built from nullptr is
// null, which the trie treats as an absent key. That is different from an
// empty key "", which is a real zero-length word.
class Slice {
  const char *data_;
  size_t size_;

public:
  Slice() : data_(nullptr), size_(0) {}

  Slice(std::nullptr_t) : Slice() {}

  Slice(const char *s) : data_(s), size_(s == nullptr ? 0 : strlen(s)) {}

  Slice(const char *data, size_t size) : data_(data), size_(size) {}

  Slice(const std::string &str) : data_(str.data()), size_(str.size()) {}

  Slice(std::string_view str) : data_(str.data()), size_(str.size()) {
    // a default constructed string_view has a null data pointer
    if (data_ == nullptr) {
      data_ = "";
    }
  }

  size_t Size() const { return size_; }

  const char *GetData() const { return data_; }

  bool IsNull() const { return data_ == nullptr; }

  bool IsEmpty() const { return size_ == 0; }

  char operator[](size_t n) const { return data_[n]; }

  std::string_view ToStringView() const {
    return IsNull() ? std::string_view{} : std::string_view(data_, size_);
  }

  std::string ToString() const {
    return IsNull() ? std::string{} : std::string(data_, size_);
  }
};
} // namespace LX
