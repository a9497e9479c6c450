#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "gimba/core/artifact_store.hpp"

namespace gimba::core {

inline constexpr const char* kToolSettingsFile = "gimba.ini";

struct ToolSettings {
  std::string output_directory = ".";
  std::vector<std::string> materials{"Steel galvanized"};
  char delimiter = ',';
  bool overwrite_existing = false;
  std::string log_file = "GIMBA.log";
  std::string name_prefix = "GIMBA";
};

// key=value lines. Unknown keys and malformed values are ignored and leave
// the default in place.
[[nodiscard]] ToolSettings ParseToolSettings(std::string_view text);
[[nodiscard]] std::string SerializeToolSettings(const ToolSettings& settings);

// Defaults when the file does not exist or cannot be read.
[[nodiscard]] ToolSettings LoadToolSettings(const std::string& path);
FileWriteResult SaveToolSettings(TextFileSink& sink, const std::string& path, const ToolSettings& settings);

// '|'-separated material names, trimmed, empty entries dropped.
[[nodiscard]] std::vector<std::string> ParseMaterialList(std::string_view value);

[[nodiscard]] bool parse_bool(std::string_view value, bool fallback);

}  // namespace gimba::core
