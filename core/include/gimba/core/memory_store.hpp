#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "gimba/core/artifact_store.hpp"
#include "gimba/core/asset.hpp"
#include "gimba/core/element_table.hpp"
#include "gimba/core/id.hpp"
#include "gimba/core/name_codec.hpp"

namespace gimba::core {

// Material document kept in memory. Serves as its own transaction scope: Run
// snapshots the records and restores them when the body throws.
class MemoryMaterialStore final : public ArtifactStore, public TransactionScope {
 public:
  explicit MemoryMaterialStore(std::string document_name = "GIMBA.rfa", NameCodec codec = NameCodec{});

  // in_document=false models a record detached from its document.
  EditResult<ElementId> AddMaterial(std::string_view name, std::optional<Asset> appearance = std::nullopt,
                                   bool in_document = true);

  [[nodiscard]] std::string document_name() const override { return document_name_; }
  [[nodiscard]] ElementId document_id() const { return document_id_; }

  [[nodiscard]] std::vector<ArtifactRef> Find(const std::regex& pattern) const override;
  [[nodiscard]] std::optional<ArtifactRef> FindNamed(std::string_view name) const override;
  [[nodiscard]] const MaterialRecord* Load(const ArtifactRef& ref) const override;

  EditResult<ArtifactRef> Create(const ArtifactRef& template_ref, const std::string& name,
                                 const DerivedArtifactEdits& edits) override;
  // Refuses records whose name is not a derived artifact name under the
  // store's codec.
  EditResult<bool> Delete(const ArtifactRef& ref) override;

  // Not re-entrant: a nested Run throws std::logic_error.
  void Run(std::string_view name, const std::function<void()>& body) override;

  [[nodiscard]] const ElementTable<MaterialRecord>& materials() const { return materials_; }
  [[nodiscard]] std::size_t size() const { return materials_.size(); }
  [[nodiscard]] std::size_t committed_transactions() const { return committed_transactions_; }
  [[nodiscard]] std::size_t rolled_back_transactions() const { return rolled_back_transactions_; }
  [[nodiscard]] const std::string& last_transaction_name() const { return last_transaction_name_; }
  [[nodiscard]] bool in_transaction() const { return in_transaction_; }

 private:
  std::string document_name_;
  ElementId document_id_ = 1;
  NameCodec codec_;
  ElementIdAllocator ids_{};
  ElementTable<MaterialRecord> materials_{};

  bool in_transaction_ = false;
  std::size_t committed_transactions_ = 0;
  std::size_t rolled_back_transactions_ = 0;
  std::string last_transaction_name_{};
};

// Appearance asset usable as thread template: generic schema with a gradient
// "generic_bump_map", or metal schema with a gradient "metal_pattern_shader".
[[nodiscard]] Asset MakeThreadTemplateAppearance(std::string_view name, bool metal_schema = false);

// Document with two valid templates, one template without bump map, one
// plain material and one unrelated material, all named under codec.
[[nodiscard]] MemoryMaterialStore MakeDemoStore(const NameCodec& codec = NameCodec{});

}  // namespace gimba::core
