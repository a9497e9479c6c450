#include "gimba/core/name_codec.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace gimba::core {

namespace {

std::string escape_regex(std::string_view text) {
  static constexpr std::string_view kSpecial = R"(\^$.|?*+()[]{})";
  std::string out;
  out.reserve(text.size() * 2);
  for (const char c : text) {
    if (kSpecial.find(c) != std::string_view::npos) {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  return out;
}

}  // namespace

NameCodec::NameCodec(std::string prefix) : prefix_(std::move(prefix)) {
  if (prefix_.empty()) {
    throw std::invalid_argument("NameCodec: prefix must not be empty");
  }
  const std::string p = escape_regex(prefix_);
  plain_pattern_ = std::regex("^" + p + " - (.+)$");
  template_pattern_ = std::regex("^" + p + " - (.+) - Thread template$");
  derived_pattern_ = std::regex("^" + p + R"( - (.+) - M(\d+) thread$)");
}

std::string NameCodec::EncodePlain(std::string_view category) const {
  return prefix_ + " - " + std::string(category);
}

std::string NameCodec::EncodeTemplate(std::string_view category) const {
  return prefix_ + " - " + std::string(category) + " - Thread template";
}

std::string NameCodec::EncodeDerived(std::string_view category, int nominal_diameter) const {
  return prefix_ + " - " + std::string(category) + " - M" + std::to_string(nominal_diameter) + " thread";
}

std::optional<std::string> NameCodec::DecodeCategory(std::string_view template_name) const {
  const std::string name(template_name);
  std::smatch match;
  if (!std::regex_match(name, match, template_pattern_)) {
    return std::nullopt;
  }
  return match[1].str();
}

std::optional<DesiredArtifactKey> NameCodec::DecodeDerived(std::string_view name) const {
  const std::string text(name);
  std::smatch match;
  if (!std::regex_match(text, match, derived_pattern_)) {
    return std::nullopt;
  }
  DesiredArtifactKey key{};
  key.category = match[1].str();
  try {
    key.nominal_diameter = std::stoi(match[2].str());
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
  return key;
}

std::optional<std::string> NameCodec::DecodePlain(std::string_view name) const {
  const std::string text(name);
  std::smatch match;
  if (!std::regex_match(text, match, plain_pattern_) || IsTemplateName(text) || IsDerivedName(text)) {
    return std::nullopt;
  }
  return match[1].str();
}

bool NameCodec::IsTemplateName(std::string_view name) const {
  return std::regex_match(std::string(name), template_pattern_);
}

bool NameCodec::IsDerivedName(std::string_view name) const {
  return std::regex_match(std::string(name), derived_pattern_);
}

std::string NameCodec::template_name_hint() const {
  return EncodeTemplate("<plain material name>");
}

}  // namespace gimba::core
