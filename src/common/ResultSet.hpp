#pragma once

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace LX {
class ResultSet {
public:
  struct Row {
    std::string message;
  };

  std::vector<Row> rows_;

  void AddRow(std::string message) { rows_.push_back({std::move(message)}); }

  bool Empty() const { return rows_.empty(); }

  std::vector<std::string> GetMessages() const {
    std::vector<std::string> messages;
    messages.reserve(rows_.size());
    for (const auto &row : rows_) {
      messages.push_back(row.message);
    }
    return messages;
  }

  static size_t CalculateMaxWidth(const std::vector<Row> &rows,
                                  std::string_view column_name) {
    size_t max_width = column_name.length();
    for (const auto &row : rows) {
      max_width = std::max(max_width, row.message.length());
    }
    return max_width;
  }

  void PrintResult(std::string_view command,
                   std::ostream &os = std::cout) const {
    size_t max_width = CalculateMaxWidth(rows_, command);

    os << "+" << std::string(max_width + 2, '-') << "+\n";
    os << "| " << std::left << std::setw(max_width) << command << " |\n";
    os << "+" << std::string(max_width + 2, '-') << "+\n";

    for (const auto &row : rows_) {
      os << "| " << std::left << std::setw(max_width) << row.message
         << " |\n";
    }

    os << "+" << std::string(max_width + 2, '-') << "+" << std::endl;
  }
};
} // namespace LX
