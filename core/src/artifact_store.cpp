#include "gimba/core/artifact_store.hpp"

#include <memory>
#include <string>

namespace gimba::core {

DerivedArtifactEdits make_derived_artifact_edits(std::string_view category, const ThreadGeometry& thread) {
  const std::string diameter = std::to_string(thread.nominal_diameter);

  DerivedArtifactEdits edits{};
  edits.manufacturer = std::string(kToolAuthor);
  edits.url = std::string(kToolRepositoryUrl);
  edits.description =
      "Generic ISO metric bolt assembly: " + std::string(category) + " with M" + diameter + " thread";
  edits.comments = "Rendering material for M" + diameter +
                   " thread. Use the thread materials pass of GIMBA to manage thread materials. See " +
                   std::string(kToolHelpUrl) + " for further instructions.";
  edits.keyword_suffix = ":M" + diameter;
  edits.scale_x_in = thread.pitch / 25.4;
  edits.scale_y_in = thread.circumference / 25.4;
  edits.rotation_deg = 90.0 - thread.helix_angle_deg;
  edits.scale_lock = false;
  edits.u_repeat = true;
  edits.v_repeat = true;
  return edits;
}

EditResult<bool> apply_derived_artifact_edits(Asset& appearance, const DerivedArtifactEdits& edits) {
  EditResult<bool> result;
  const std::shared_ptr<Asset> bump_map = FindBumpGradientMap(appearance);
  if (!bump_map) {
    result.error = "No bump gradient map found in appearance asset \"" + appearance.name + "\"";
    return result;
  }

  const std::string* keyword = appearance.find_string("keyword");
  const std::string old_keyword = keyword != nullptr ? *keyword : std::string{};
  appearance.set("description", edits.description);
  appearance.set("keyword", old_keyword + edits.keyword_suffix);

  bump_map->set("texture_RealWorldScaleX", edits.scale_x_in);
  bump_map->set("texture_RealWorldScaleY", edits.scale_y_in);
  bump_map->set("texture_WAngle", edits.rotation_deg);
  bump_map->set("texture_ScaleLock", edits.scale_lock);
  bump_map->set("texture_URepeat", edits.u_repeat);
  bump_map->set("texture_VRepeat", edits.v_repeat);

  result.ok = true;
  result.value = true;
  return result;
}

std::string_view to_string(FileWriteOutcome outcome) {
  switch (outcome) {
    case FileWriteOutcome::kCreated:
      return "created";
    case FileWriteOutcome::kOverwritten:
      return "overwritten";
    case FileWriteOutcome::kSkipped:
      return "skipped";
    case FileWriteOutcome::kFailed:
      return "ERROR";
  }
  return "unknown";
}

}  // namespace gimba::core
