#include "gimba/core/template_validator.hpp"

#include <optional>
#include <string>

namespace gimba::core {

std::string_view to_string(TemplateCheckCode code) {
  switch (code) {
    case TemplateCheckCode::kOk:
      return "ok";
    case TemplateCheckCode::kNullCandidate:
      return "null_candidate";
    case TemplateCheckCode::kNoDocument:
      return "no_document";
    case TemplateCheckCode::kInvalidName:
      return "invalid_name";
    case TemplateCheckCode::kNoAppearanceAsset:
      return "no_appearance_asset";
    case TemplateCheckCode::kNoBumpGradientMap:
      return "no_bump_gradient_map";
    case TemplateCheckCode::kUnreadable:
      return "unreadable";
  }
  return "unknown";
}

TemplateCheck TemplateValidator::Validate(const MaterialRecord* candidate) const {
  TemplateCheck check;
  if (candidate == nullptr) {
    check.code = TemplateCheckCode::kNullCandidate;
    check.reason = "Material is <null>";
    return check;
  }

  const std::string long_name = "Material \"" + candidate->name + "\"";
  const std::string prefix = "    - ";
  check.trace.push_back("  - " + long_name);

  auto fail = [&](TemplateCheckCode code, const std::string& trace_text, const std::string& reason) {
    check.code = code;
    check.reason = reason;
    check.trace.push_back(prefix + trace_text + " -> FAILED");
    return check;
  };

  if (candidate->document_id == kInvalidElementId) {
    return fail(TemplateCheckCode::kNoDocument, "Material does not reside in a document",
                long_name + " does not reside in a document");
  }
  check.trace.push_back(prefix + "Material resides in document " + format_element_label("DOC", candidate->document_id) +
                        " -> OK");

  const std::string hint = codec_.template_name_hint();
  const std::optional<std::string> category = codec_.DecodeCategory(candidate->name);
  if (!category.has_value()) {
    return fail(TemplateCheckCode::kInvalidName, "Material has an invalid name, should be \"" + hint + "\"",
                long_name + " has an invalid name, should be \"" + hint + "\"");
  }
  check.category = *category;
  check.trace.push_back(prefix + "Material name matches \"" + hint + "\" -> OK");

  if (!candidate->appearance.has_value() || candidate->appearance->kind != AssetKind::kAppearance) {
    return fail(TemplateCheckCode::kNoAppearanceAsset,
                "Material has no appearance asset or the asset is not an appearance asset",
                long_name + " has no appearance asset or the asset is not an appearance asset");
  }
  check.trace.push_back(prefix + "Material has an appearance asset -> OK");

  if (!FindBumpGradientMap(*candidate->appearance)) {
    return fail(TemplateCheckCode::kNoBumpGradientMap, "Appearance asset has no bump gradient map",
                long_name + ": Appearance asset has no bump gradient map");
  }
  check.trace.push_back(prefix + "Appearance asset has a bump gradient map -> OK");
  return check;
}

}  // namespace gimba::core
