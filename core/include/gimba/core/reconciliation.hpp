#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "gimba/core/artifact_store.hpp"
#include "gimba/core/geometry.hpp"
#include "gimba/core/name_codec.hpp"
#include "gimba/core/pass_log.hpp"
#include "gimba/core/template_validator.hpp"

namespace gimba::core {

// Pass-local tallies. Discovery fills the first four, Execute the rest.
struct OutcomeCounters {
  std::size_t geometries = 0;
  std::size_t valid_templates = 0;
  std::size_t invalid_templates = 0;
  std::size_t existing_artifacts = 0;
  std::size_t skipped = 0;
  std::size_t deleted = 0;
  std::size_t overwritten = 0;
  std::size_t created = 0;
  std::size_t delete_failed = 0;
  std::size_t overwrite_failed = 0;
  std::size_t create_failed = 0;

  [[nodiscard]] bool has_failures() const { return delete_failed + overwrite_failed + create_failed > 0; }
  [[nodiscard]] std::size_t desired_artifacts() const { return geometries * valid_templates; }

  bool operator==(const OutcomeCounters&) const = default;
};

struct TemplateCandidate {
  ArtifactRef ref{};
  TemplateCheck check{};
};

struct DiscoveryResult {
  std::vector<ThreadGeometry> geometries{};
  std::vector<ArtifactRef> existing{};
  std::vector<TemplateCandidate> valid_templates{};
  std::vector<TemplateCandidate> invalid_templates{};
  OutcomeCounters counters{};

  [[nodiscard]] bool ready() const { return counters.valid_templates > 0 && counters.geometries > 0; }
};

enum class PassMode : std::uint8_t {
  kCreate = 0,
  kDelete = 1,
};

[[nodiscard]] std::string_view to_string(PassMode mode);

struct ReconcileRequest {
  PassMode mode = PassMode::kCreate;
  bool overwrite_existing = false;
};

enum class PassOutcome : std::uint8_t {
  kCompleted = 0,
  kNothingToDo = 1,
  kPreconditionFailed = 2,
  kCancelled = 3,
};

[[nodiscard]] std::string_view to_string(PassOutcome outcome);

struct PassReport {
  PassOutcome outcome = PassOutcome::kCancelled;
  PassMode mode = PassMode::kCreate;
  OutcomeCounters counters{};
  std::string title{};
  std::string instruction{};
  std::string content{};
  std::vector<std::string> details{};
  bool warning = false;
};

// Brings the derived thread materials of a document in line with its valid
// templates and the geometry table.
class ReconciliationEngine {
 public:
  ReconciliationEngine(ArtifactStore& store, TransactionScope& transactions, const GeometryTable& geometries,
                       const NameCodec& codec);

  // A template that cannot be loaded counts as invalid. A failing search
  // propagates.
  [[nodiscard]] DiscoveryResult Discover(PassLog& log) const;

  // Mutates the store inside one transaction. A discovery that is not ready
  // yields a kPreconditionFailed report without touching the store. Per-item
  // store failures are counted; an exception escaping the transaction body
  // propagates after rollback.
  PassReport Execute(const DiscoveryResult& discovery, const ReconcileRequest& request, PassLog& log);

  // Discover, gate, ask the prompt, execute.
  PassReport Run(InteractionPrompt& prompt, PassLog& log);

  [[nodiscard]] static PromptContext BuildPromptContext(const DiscoveryResult& discovery,
                                                        std::string_view document_name);
  [[nodiscard]] static PassReport MakePreconditionReport(const DiscoveryResult& discovery);

 private:
  void ExecuteCreate(const DiscoveryResult& discovery, bool overwrite, OutcomeCounters& counters, PassLog& log);
  void ExecuteDelete(const DiscoveryResult& discovery, OutcomeCounters& counters, PassLog& log);

  bool TryCreate(const TemplateCandidate& source, const ThreadGeometry& thread, const std::string& name,
                 PassLog& log);
  bool TryDelete(const ArtifactRef& ref, std::string_view failure_line, PassLog& log);

  ArtifactStore& store_;
  TransactionScope& transactions_;
  const GeometryTable& geometries_;
  const NameCodec& codec_;
  TemplateValidator validator_;
};

}  // namespace gimba::core
