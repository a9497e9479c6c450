#include "gimba/core/memory_store.hpp"

#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

namespace gimba::core {

namespace {

std::shared_ptr<Asset> make_gradient_map() {
  auto gradient = std::make_shared<Asset>();
  gradient->name = "Gradient";
  gradient->kind = AssetKind::kOther;
  gradient->schema = "GradientSchema";
  gradient->set("BaseSchema", std::string("GradientSchema"));
  gradient->set("texture_RealWorldScaleX", 1.0);
  gradient->set("texture_RealWorldScaleY", 1.0);
  gradient->set("texture_WAngle", 0.0);
  gradient->set("texture_ScaleLock", true);
  gradient->set("texture_URepeat", false);
  gradient->set("texture_VRepeat", false);
  AssetPropertyList colors;
  colors.push_back(AssetProperty{"gradient_color_0", std::string("0 0 0")});
  colors.push_back(AssetProperty{"gradient_color_1", std::string("1 1 1")});
  gradient->set("gradient_colors", std::move(colors));
  return gradient;
}

}  // namespace

MemoryMaterialStore::MemoryMaterialStore(std::string document_name, NameCodec codec)
    : document_name_(std::move(document_name)), codec_(std::move(codec)) {}

EditResult<ElementId> MemoryMaterialStore::AddMaterial(std::string_view name, std::optional<Asset> appearance,
                                                      bool in_document) {
  EditResult<ElementId> result;
  if (name.empty()) {
    result.error = "material name must not be empty";
    return result;
  }
  if (materials_.find_named(name) != nullptr) {
    result.error = "a material named \"" + std::string(name) + "\" already exists";
    return result;
  }

  MaterialRecord material{};
  material.id = ids_.next_id();
  material.display_id = ids_.next_label("MAT");
  material.name = std::string(name);
  material.document_id = in_document ? document_id_ : kInvalidElementId;
  material.appearance = std::move(appearance);
  const ElementId id = material.id;
  if (!materials_.insert(std::move(material))) {
    result.error = "material id " + format_element_label("E", id) + " is already taken";
    return result;
  }

  result.ok = true;
  result.value = id;
  return result;
}

std::vector<ArtifactRef> MemoryMaterialStore::Find(const std::regex& pattern) const {
  std::vector<ArtifactRef> refs;
  for (const MaterialRecord& material : materials_.items()) {
    if (std::regex_match(material.name, pattern)) {
      refs.push_back(ArtifactRef{material.id, material.name});
    }
  }
  return refs;
}

std::optional<ArtifactRef> MemoryMaterialStore::FindNamed(std::string_view name) const {
  const MaterialRecord* material = materials_.find_named(name);
  if (material == nullptr) {
    return std::nullopt;
  }
  return ArtifactRef{material->id, material->name};
}

const MaterialRecord* MemoryMaterialStore::Load(const ArtifactRef& ref) const {
  return materials_.find(ref.id);
}

EditResult<ArtifactRef> MemoryMaterialStore::Create(const ArtifactRef& template_ref, const std::string& name,
                                                    const DerivedArtifactEdits& edits) {
  EditResult<ArtifactRef> result;
  const MaterialRecord* source = materials_.find(template_ref.id);
  if (source == nullptr) {
    result.error = "template material " + format_element_label("E", template_ref.id) + " does not exist";
    return result;
  }
  if (materials_.find_named(name) != nullptr) {
    result.error = "a material named \"" + name + "\" already exists";
    return result;
  }
  if (!source->appearance.has_value()) {
    result.error = "template material \"" + source->name + "\" has no appearance asset";
    return result;
  }

  Asset appearance = clone_asset(*source->appearance);
  appearance.name = name;
  const EditResult<bool> edit_result = apply_derived_artifact_edits(appearance, edits);
  if (!edit_result.ok) {
    result.error = edit_result.error;
    return result;
  }

  MaterialRecord material{};
  material.id = ids_.next_id();
  material.display_id = ids_.next_label("MAT");
  material.name = name;
  material.document_id = document_id_;
  material.manufacturer = edits.manufacturer;
  material.comments = edits.comments;
  material.url = edits.url;
  material.description = edits.description;
  material.appearance = std::move(appearance);
  const ArtifactRef created{material.id, material.name};
  if (!materials_.insert(std::move(material))) {
    result.error = "material id " + format_element_label("E", created.id) + " is already taken";
    return result;
  }

  result.ok = true;
  result.value = created;
  return result;
}

EditResult<bool> MemoryMaterialStore::Delete(const ArtifactRef& ref) {
  EditResult<bool> result;
  const MaterialRecord* material = materials_.find(ref.id);
  if (material == nullptr) {
    result.error = "material " + format_element_label("E", ref.id) + " does not exist";
    return result;
  }
  if (!codec_.IsDerivedName(material->name)) {
    result.error = "refusing to delete \"" + material->name + "\": not a thread material";
    return result;
  }
  materials_.erase(ref.id);
  result.ok = true;
  result.value = true;
  return result;
}

void MemoryMaterialStore::Run(std::string_view name, const std::function<void()>& body) {
  if (in_transaction_) {
    throw std::logic_error("transaction \"" + std::string(name) + "\" started inside \"" + last_transaction_name_ +
                           "\"");
  }
  last_transaction_name_ = std::string(name);
  in_transaction_ = true;

  // Records are added or erased, never edited in place, so a copy of the
  // table and the allocator restores them.
  const ElementTable<MaterialRecord> snapshot = materials_;
  const ElementIdAllocator ids = ids_;
  try {
    body();
  } catch (...) {
    materials_ = snapshot;
    ids_ = ids;
    in_transaction_ = false;
    ++rolled_back_transactions_;
    throw;
  }
  in_transaction_ = false;
  ++committed_transactions_;
}

Asset MakeThreadTemplateAppearance(std::string_view name, bool metal_schema) {
  Asset appearance{};
  appearance.name = std::string(name);
  appearance.kind = AssetKind::kAppearance;
  appearance.schema = metal_schema ? "MetalSchema" : "GenericSchema";
  appearance.set("description", std::string("Thread template"));
  appearance.set("keyword", std::string("GIMBA:thread"));
  appearance.set(metal_schema ? "metal_pattern_shader" : "generic_bump_map", make_gradient_map());
  appearance.set(metal_schema ? "metal_pattern_height" : "generic_bump_amount", 0.3);
  appearance.set("common_Tint_toggle", false);
  appearance.set("texture_file", AssetReference{9001, "thread_gradient.png"});
  return appearance;
}

MemoryMaterialStore MakeDemoStore(const NameCodec& codec) {
  MemoryMaterialStore store("GIMBA.rfa", codec);

  Asset plain{};
  plain.name = codec.EncodePlain("Steel galvanized");
  plain.kind = AssetKind::kAppearance;
  plain.schema = "GenericSchema";
  plain.set("description", std::string("Galvanized steel"));
  plain.set("keyword", std::string("GIMBA"));

  Asset no_bump = MakeThreadTemplateAppearance(codec.EncodeTemplate("Brass"));
  std::erase_if(no_bump.properties, [](const AssetProperty& property) { return property.name == "generic_bump_map"; });

  auto add = [&store](std::string_view name, std::optional<Asset> appearance) {
    const EditResult<ElementId> result = store.AddMaterial(name, std::move(appearance));
    if (!result.ok) {
      throw std::logic_error("demo document: " + result.error);
    }
  };
  add(codec.EncodePlain("Steel galvanized"), std::move(plain));
  add(codec.EncodeTemplate("Steel galvanized"), MakeThreadTemplateAppearance(codec.EncodeTemplate("Steel galvanized")));
  add(codec.EncodeTemplate("Stainless steel"),
      MakeThreadTemplateAppearance(codec.EncodeTemplate("Stainless steel"), true));
  add(codec.EncodeTemplate("Brass"), std::move(no_bump));
  add("Concrete, Cast-in-Place gray", std::nullopt);
  return store;
}

}  // namespace gimba::core
