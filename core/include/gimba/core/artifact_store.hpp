#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "gimba/core/asset.hpp"
#include "gimba/core/geometry.hpp"
#include "gimba/core/id.hpp"

namespace gimba::core {

inline constexpr std::string_view kToolAuthor = "Matthias Wolff";
inline constexpr std::string_view kToolRepositoryUrl =
    "https://github.com/matthias-wolff/Revit-Generic-ISO-Metric-Bolt-Assembly";
inline constexpr std::string_view kToolHelpUrl =
    "https://matthias-wolff.github.io/Revit-Generic-ISO-Metric-Bolt-Assembly/GIMBA.html";

template <typename TValue>
struct EditResult {
  bool ok = false;
  TValue value{};
  std::string error{};
};

struct ArtifactRef {
  ElementId id = kInvalidElementId;
  std::string name{};

  bool operator==(const ArtifactRef&) const = default;
};

// Edits applied to the duplicate of a template material.
struct DerivedArtifactEdits {
  std::string manufacturer{};
  std::string comments{};
  std::string url{};
  std::string description{};

  // Appended to the appearance asset "keyword" property (":M12").
  std::string keyword_suffix{};

  // Bump gradient map. Real world scales in inches.
  double scale_x_in = 0.0;      // P / 25.4
  double scale_y_in = 0.0;      // C / 25.4
  double rotation_deg = 0.0;    // 90 - beta
  bool scale_lock = false;
  bool u_repeat = true;
  bool v_repeat = true;
};

[[nodiscard]] DerivedArtifactEdits make_derived_artifact_edits(std::string_view category,
                                                               const ThreadGeometry& thread);

// Writes the edits into a copied appearance asset. Fails when the asset has
// no bump gradient map.
EditResult<bool> apply_derived_artifact_edits(Asset& appearance, const DerivedArtifactEdits& edits);

// Material records of one host document. Implementations may report a
// failure through EditResult or by throwing a std::exception.
class ArtifactStore {
 public:
  virtual ~ArtifactStore() = default;

  [[nodiscard]] virtual std::string document_name() const = 0;

  // All records whose name fully matches the pattern, in document order.
  [[nodiscard]] virtual std::vector<ArtifactRef> Find(const std::regex& pattern) const = 0;
  [[nodiscard]] virtual std::optional<ArtifactRef> FindNamed(std::string_view name) const = 0;
  [[nodiscard]] virtual const MaterialRecord* Load(const ArtifactRef& ref) const = 0;

  // Duplicates the template (material and appearance asset) under a new name
  // and applies the edits to the duplicate.
  virtual EditResult<ArtifactRef> Create(const ArtifactRef& template_ref, const std::string& name,
                                         const DerivedArtifactEdits& edits) = 0;
  virtual EditResult<bool> Delete(const ArtifactRef& ref) = 0;
};

// Commit when body returns, roll back and rethrow when it throws.
class TransactionScope {
 public:
  virtual ~TransactionScope() = default;

  virtual void Run(std::string_view name, const std::function<void()>& body) = 0;
};

enum class FileWriteOutcome : std::uint8_t {
  kCreated = 0,
  kOverwritten = 1,
  kSkipped = 2,
  kFailed = 3,
};

[[nodiscard]] std::string_view to_string(FileWriteOutcome outcome);

struct FileWriteResult {
  FileWriteOutcome outcome = FileWriteOutcome::kFailed;
  std::string error{};

  [[nodiscard]] bool ok() const { return outcome != FileWriteOutcome::kFailed; }
};

class TextFileSink {
 public:
  virtual ~TextFileSink() = default;

  [[nodiscard]] virtual bool Exists(const std::string& path) const = 0;
  // An existing file is left alone unless overwrite is set.
  virtual FileWriteResult Write(const std::string& path, const std::string& content, bool overwrite) = 0;
};

enum class PromptAction : std::uint8_t {
  kCreate = 0,
  kDelete = 1,
  kCancel = 2,
};

struct PromptChoice {
  PromptAction action = PromptAction::kCancel;
  bool overwrite_existing = false;
};

// Welcome dialog content derived from a discovery.
struct PromptContext {
  bool ready = false;
  std::string title{};
  std::string instruction{};
  std::string content{};
  std::vector<std::string> details{};
  std::string create_label{};
  std::string create_hint{};
  bool delete_available = false;
  std::string delete_label{};
  std::string delete_hint{};
  bool overwrite_available = false;
  std::string overwrite_label{};
};

class InteractionPrompt {
 public:
  virtual ~InteractionPrompt() = default;

  virtual PromptChoice Choose(const PromptContext& context) = 0;
};

}  // namespace gimba::core
