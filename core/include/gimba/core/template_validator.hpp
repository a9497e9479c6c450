#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "gimba/core/asset.hpp"
#include "gimba/core/name_codec.hpp"

namespace gimba::core {

enum class TemplateCheckCode : std::uint8_t {
  kOk = 0,
  kNullCandidate,
  kNoDocument,
  kInvalidName,
  kNoAppearanceAsset,
  kNoBumpGradientMap,
  kUnreadable,
};

[[nodiscard]] std::string_view to_string(TemplateCheckCode code);

struct TemplateCheck {
  TemplateCheckCode code = TemplateCheckCode::kOk;
  std::string category{};
  std::string reason{};
  // "  - Material ..." / "    - ... -> OK|FAILED" lines, one per check run.
  std::vector<std::string> trace{};

  [[nodiscard]] bool ok() const { return code == TemplateCheckCode::kOk; }
};

// Checks whether a material can serve as thread template. Stops at the first
// failed check; never mutates the candidate.
class TemplateValidator {
 public:
  explicit TemplateValidator(const NameCodec& codec) : codec_(codec) {}

  [[nodiscard]] TemplateCheck Validate(const MaterialRecord* candidate) const;

 private:
  const NameCodec& codec_;
};

}  // namespace gimba::core
