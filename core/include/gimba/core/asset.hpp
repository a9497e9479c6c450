#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "gimba/core/id.hpp"

namespace gimba::core {

enum class AssetKind : std::uint8_t {
  kAppearance = 0,
  kOther = 1,
};

struct Asset;
struct AssetProperty;

// Points at another document element (e.g. a texture file record).
struct AssetReference {
  ElementId target_id = kInvalidElementId;
  std::string target_name{};
};

using AssetPropertyList = std::vector<AssetProperty>;

using AssetValue =
    std::variant<std::string, double, bool, AssetReference, std::shared_ptr<Asset>, AssetPropertyList>;

struct AssetProperty {
  std::string name{};
  AssetValue value{};
};

// Rendering asset as exposed by the host store. Properties keep their
// document order; names are unique within one asset.
struct Asset {
  std::string name{};
  AssetKind kind = AssetKind::kOther;
  std::string schema{};
  std::vector<AssetProperty> properties{};

  [[nodiscard]] const AssetProperty* find(std::string_view property_name) const;
  [[nodiscard]] AssetProperty* find(std::string_view property_name);

  [[nodiscard]] const std::string* find_string(std::string_view property_name) const;
  [[nodiscard]] std::optional<double> find_double(std::string_view property_name) const;
  [[nodiscard]] std::optional<bool> find_bool(std::string_view property_name) const;

  // Nested asset held by the property, nullptr when the property is absent or
  // holds something else.
  [[nodiscard]] std::shared_ptr<Asset> connected_asset(std::string_view property_name) const;

  // Replaces the value of an existing property or appends a new one.
  void set(std::string_view property_name, AssetValue value);
};

// Deep copy: nested assets are duplicated, not shared.
[[nodiscard]] Asset clone_asset(const Asset& source);

// Bump gradient map of an appearance asset: the asset connected to
// "generic_bump_map" (generic schema) or "metal_pattern_shader" (metal schema)
// whose "BaseSchema" is "GradientSchema". nullptr when there is none or the
// asset is not an appearance asset.
[[nodiscard]] std::shared_ptr<Asset> FindBumpGradientMap(const Asset& appearance);

[[nodiscard]] std::string_view to_string(AssetKind kind);

// Indented human-readable dump, one property per line.
[[nodiscard]] std::vector<std::string> DumpAsset(const Asset& asset, int indent = 0);

struct MaterialRecord {
  ElementId id = kInvalidElementId;
  std::string display_id{};
  std::string name{};
  ElementId document_id = kInvalidElementId;  // 0: not owned by a document
  std::string manufacturer{};
  std::string comments{};
  std::string url{};
  std::string description{};
  std::optional<Asset> appearance{};
};

[[nodiscard]] std::vector<std::string> DumpMaterial(const MaterialRecord& material);

}  // namespace gimba::core
