#include "gimba/core/settings.hpp"

#include <fstream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace gimba::core {

namespace {

std::string trim(std::string_view value) {
  const std::size_t first = value.find_first_not_of(" \t\r");
  if (first == std::string_view::npos) {
    return {};
  }
  const std::size_t last = value.find_last_not_of(" \t\r");
  return std::string(value.substr(first, last - first + 1));
}

}  // namespace

std::vector<std::string> ParseMaterialList(std::string_view value) {
  std::vector<std::string> materials;
  std::size_t begin = 0;
  while (begin <= value.size()) {
    const std::size_t end = value.find('|', begin);
    const std::string item = trim(value.substr(begin, end == std::string_view::npos ? std::string_view::npos
                                                                                   : end - begin));
    if (!item.empty()) {
      materials.push_back(item);
    }
    if (end == std::string_view::npos) {
      break;
    }
    begin = end + 1;
  }
  return materials;
}

bool parse_bool(std::string_view value, bool fallback) {
  if (value == "1" || value == "true" || value == "True") {
    return true;
  }
  if (value == "0" || value == "false" || value == "False") {
    return false;
  }
  return fallback;
}

ToolSettings ParseToolSettings(std::string_view text) {
  ToolSettings settings{};
  std::istringstream iss{std::string(text)};
  std::string line;
  while (std::getline(iss, line)) {
    if (line.empty() || line.front() == '#') {
      continue;
    }
    const std::size_t eq = line.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 >= line.size()) {
      continue;
    }
    const std::string key = trim(std::string_view(line).substr(0, eq));
    const std::string value = trim(std::string_view(line).substr(eq + 1));
    if (value.empty()) {
      continue;
    }

    if (key == "output_directory") {
      settings.output_directory = value;
    } else if (key == "materials") {
      std::vector<std::string> materials = ParseMaterialList(value);
      if (!materials.empty()) {
        settings.materials = std::move(materials);
      }
    } else if (key == "delimiter") {
      if (value == "," || value == ";") {
        settings.delimiter = value.front();
      }
    } else if (key == "overwrite_existing") {
      settings.overwrite_existing = parse_bool(value, settings.overwrite_existing);
    } else if (key == "log_file") {
      settings.log_file = value;
    } else if (key == "name_prefix") {
      settings.name_prefix = value;
    }
  }
  return settings;
}

std::string SerializeToolSettings(const ToolSettings& settings) {
  std::ostringstream oss;
  oss << "output_directory=" << settings.output_directory << "\n";
  oss << "materials=";
  for (std::size_t i = 0; i < settings.materials.size(); ++i) {
    oss << (i > 0 ? "|" : "") << settings.materials[i];
  }
  oss << "\n";
  oss << "delimiter=" << settings.delimiter << "\n";
  oss << "overwrite_existing=" << (settings.overwrite_existing ? 1 : 0) << "\n";
  oss << "log_file=" << settings.log_file << "\n";
  oss << "name_prefix=" << settings.name_prefix << "\n";
  return oss.str();
}

ToolSettings LoadToolSettings(const std::string& path) {
  std::ifstream ifs(path);
  if (!ifs.is_open()) {
    return ToolSettings{};
  }
  std::ostringstream content;
  content << ifs.rdbuf();
  return ParseToolSettings(content.str());
}

FileWriteResult SaveToolSettings(TextFileSink& sink, const std::string& path, const ToolSettings& settings) {
  return sink.Write(path, SerializeToolSettings(settings), true);
}

}  // namespace gimba::core
