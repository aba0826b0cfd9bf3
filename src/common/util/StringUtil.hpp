#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace LX {
struct StringUtil {

  static bool EndsWith(std::string_view str, std::string_view suffix) {
    return str.ends_with(suffix);
  }

  static void ToUpper(std::string &str) {
    std::for_each(str.begin(), str.end(), [](char &c) {
      c = static_cast<char>(toupper(static_cast<unsigned char>(c)));
    });
  }

  static bool IsSpace(char c) {
    return static_cast<bool>(isspace(static_cast<unsigned char>(c)));
  }

  // strip leading and trailing whitespace in place
  static void Trim(std::string &str) {
    auto begin = std::find_if_not(str.begin(), str.end(), IsSpace);
    auto end = std::find_if_not(str.rbegin(), str.rend(), IsSpace).base();
    if (begin >= end) {
      str.clear();
      return;
    }
    str = std::string(begin, end);
  }
};

} // namespace LX
