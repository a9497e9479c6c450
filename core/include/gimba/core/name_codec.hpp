#pragma once

#include <optional>
#include <regex>
#include <string>
#include <string_view>

namespace gimba::core {

// (category, D) identity of a derived artifact.
struct DesiredArtifactKey {
  std::string category{};
  int nominal_diameter = 0;

  bool operator==(const DesiredArtifactKey&) const = default;
};

// Store naming convention:
//   plain material    "GIMBA - {category}"
//   thread template   "GIMBA - {category} - Thread template"
//   derived artifact  "GIMBA - {category} - M{D} thread"
class NameCodec {
 public:
  explicit NameCodec(std::string prefix = "GIMBA");

  [[nodiscard]] const std::string& prefix() const { return prefix_; }

  [[nodiscard]] std::string EncodePlain(std::string_view category) const;
  [[nodiscard]] std::string EncodeTemplate(std::string_view category) const;
  [[nodiscard]] std::string EncodeDerived(std::string_view category, int nominal_diameter) const;

  // Full-match decoders. A non-conforming name yields std::nullopt.
  [[nodiscard]] std::optional<std::string> DecodeCategory(std::string_view template_name) const;
  [[nodiscard]] std::optional<DesiredArtifactKey> DecodeDerived(std::string_view name) const;
  // Template and derived names are not plain names.
  [[nodiscard]] std::optional<std::string> DecodePlain(std::string_view name) const;

  [[nodiscard]] bool IsTemplateName(std::string_view name) const;
  [[nodiscard]] bool IsDerivedName(std::string_view name) const;

  [[nodiscard]] const std::regex& template_pattern() const { return template_pattern_; }
  [[nodiscard]] const std::regex& derived_pattern() const { return derived_pattern_; }

  // Template name with a placeholder category, used in diagnostics.
  [[nodiscard]] std::string template_name_hint() const;

 private:
  std::string prefix_;
  std::regex plain_pattern_;
  std::regex template_pattern_;
  std::regex derived_pattern_;
};

}  // namespace gimba::core
