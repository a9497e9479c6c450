#include "gimba/core/pass_log.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace gimba::core {

namespace {

constexpr std::string_view kSeparator =
    "-------------------------------------------------------------------------------";

void append_nested(const std::exception& error, int depth, std::vector<std::string>& out) {
  try {
    std::rethrow_if_nested(error);
  } catch (const std::exception& nested) {
    out.push_back(std::string(static_cast<std::size_t>(depth) * 2, ' ') + "caused by: " + nested.what());
    append_nested(nested, depth + 1, out);
  } catch (...) {
    // Cause is not a std::exception; its chain ends here.
    out.push_back(std::string(static_cast<std::size_t>(depth) * 2, ' ') + "caused by: unknown exception");
  }
}

}  // namespace

void PassLog::Begin(std::string_view pass_name, std::string_view timestamp) {
  lines_.emplace_back(kSeparator);
  lines_.push_back("Pass of " + std::string(pass_name) + ", timestamp " + std::string(timestamp));
}

void PassLog::Line(std::string_view text) {
  lines_.emplace_back(text);
}

void PassLog::Lines(const std::vector<std::string>& lines) {
  lines_.insert(lines_.end(), lines.begin(), lines.end());
}

void PassLog::End() {
  Line();
  Line("Pass complete");
}

std::string PassLog::text() const {
  std::string out;
  for (const std::string& line : lines_) {
    out += line;
    out += '\n';
  }
  return out;
}

bool PassLog::contains(std::string_view fragment) const {
  for (const std::string& line : lines_) {
    if (line.find(fragment) != std::string::npos) {
      return true;
    }
  }
  return false;
}

std::string make_pass_timestamp(std::chrono::system_clock::time_point when) {
  const std::time_t time = std::chrono::system_clock::to_time_t(when);
  std::tm local{};
#if defined(_WIN32)
  localtime_s(&local, &time);
#else
  localtime_r(&time, &local);
#endif
  std::ostringstream oss;
  oss << std::put_time(&local, "%Y%m%d-%H%M%S");
  return oss.str();
}

std::vector<std::string> DescribeException(const std::exception& error) {
  std::vector<std::string> out;
  out.emplace_back(error.what());
  append_nested(error, 1, out);
  return out;
}

}  // namespace gimba::core
