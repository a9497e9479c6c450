#pragma once

#include <chrono>
#include <cstddef>
#include <exception>
#include <string>
#include <string_view>
#include <vector>

namespace gimba::core {

// Line log of one tool pass. The host decides where the text ends up
// (GIMBA.log, viewer log pane).
class PassLog {
 public:
  // Starts a new pass: separator line plus "Pass of {name}, timestamp {ts}".
  void Begin(std::string_view pass_name, std::string_view timestamp);
  void Line(std::string_view text = "");
  void Lines(const std::vector<std::string>& lines);
  // Blank line plus "Pass complete".
  void End();
  void Clear() { lines_.clear(); }

  [[nodiscard]] const std::vector<std::string>& lines() const { return lines_; }
  [[nodiscard]] std::size_t size() const { return lines_.size(); }
  [[nodiscard]] bool empty() const { return lines_.empty(); }
  // Lines joined with '\n', trailing newline included.
  [[nodiscard]] std::string text() const;
  [[nodiscard]] bool contains(std::string_view fragment) const;

 private:
  std::vector<std::string> lines_{};
};

// "yyyyMMdd-HHmmss" in local time.
[[nodiscard]] std::string make_pass_timestamp(std::chrono::system_clock::time_point when);

// what() of the exception followed by one "  caused by: ..." line per nested
// std::exception.
[[nodiscard]] std::vector<std::string> DescribeException(const std::exception& error);

}  // namespace gimba::core
