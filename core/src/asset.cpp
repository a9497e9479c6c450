#include "gimba/core/asset.hpp"

#include <array>
#include <string>
#include <type_traits>
#include <utility>

#include "gimba/core/text_format.hpp"

namespace gimba::core {

namespace {

constexpr std::array<std::string_view, 2> kBumpMapProperties = {
    "generic_bump_map",      // generic schema
    "metal_pattern_shader",  // metal schema
};

AssetValue clone_value(const AssetValue& value);

AssetPropertyList clone_properties(const AssetPropertyList& source) {
  AssetPropertyList out;
  out.reserve(source.size());
  for (const AssetProperty& property : source) {
    out.push_back(AssetProperty{property.name, clone_value(property.value)});
  }
  return out;
}

AssetValue clone_value(const AssetValue& value) {
  return std::visit(
      [](const auto& v) -> AssetValue {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::shared_ptr<Asset>>) {
          if (!v) {
            return std::shared_ptr<Asset>{};
          }
          return std::make_shared<Asset>(clone_asset(*v));
        } else if constexpr (std::is_same_v<T, AssetPropertyList>) {
          return clone_properties(v);
        } else {
          return v;
        }
      },
      value);
}

std::string pad(int indent) {
  return std::string(static_cast<std::size_t>(indent) * 2, ' ');
}

void dump_properties(const AssetPropertyList& properties, int indent, std::vector<std::string>& out) {
  for (const AssetProperty& property : properties) {
    const std::string head = pad(indent) + "- " + property.name;
    std::visit(
        [&](const auto& v) {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::string>) {
            out.push_back(head + " (string) = \"" + v + "\"");
          } else if constexpr (std::is_same_v<T, double>) {
            out.push_back(head + " (double) = " + format_number(v));
          } else if constexpr (std::is_same_v<T, bool>) {
            out.push_back(head + " (boolean) = " + (v ? "true" : "false"));
          } else if constexpr (std::is_same_v<T, AssetReference>) {
            out.push_back(head + " (reference) -> " + format_element_label("E", v.target_id) + " \"" + v.target_name +
                          "\"");
          } else if constexpr (std::is_same_v<T, std::shared_ptr<Asset>>) {
            if (!v) {
              out.push_back(head + " (asset) = <null>");
              return;
            }
            out.push_back(head + " (asset)");
            const std::vector<std::string> nested = DumpAsset(*v, indent + 1);
            out.insert(out.end(), nested.begin(), nested.end());
          } else if constexpr (std::is_same_v<T, AssetPropertyList>) {
            out.push_back(head + " (list, " + std::to_string(v.size()) + " items)");
            dump_properties(v, indent + 1, out);
          }
        },
        property.value);
  }
}

}  // namespace

const AssetProperty* Asset::find(std::string_view property_name) const {
  for (const AssetProperty& property : properties) {
    if (property.name == property_name) {
      return &property;
    }
  }
  return nullptr;
}

AssetProperty* Asset::find(std::string_view property_name) {
  for (AssetProperty& property : properties) {
    if (property.name == property_name) {
      return &property;
    }
  }
  return nullptr;
}

const std::string* Asset::find_string(std::string_view property_name) const {
  const AssetProperty* property = find(property_name);
  if (property == nullptr) {
    return nullptr;
  }
  return std::get_if<std::string>(&property->value);
}

std::optional<double> Asset::find_double(std::string_view property_name) const {
  const AssetProperty* property = find(property_name);
  if (property == nullptr) {
    return std::nullopt;
  }
  if (const double* value = std::get_if<double>(&property->value)) {
    return *value;
  }
  return std::nullopt;
}

std::optional<bool> Asset::find_bool(std::string_view property_name) const {
  const AssetProperty* property = find(property_name);
  if (property == nullptr) {
    return std::nullopt;
  }
  if (const bool* value = std::get_if<bool>(&property->value)) {
    return *value;
  }
  return std::nullopt;
}

std::shared_ptr<Asset> Asset::connected_asset(std::string_view property_name) const {
  const AssetProperty* property = find(property_name);
  if (property == nullptr) {
    return nullptr;
  }
  if (const auto* nested = std::get_if<std::shared_ptr<Asset>>(&property->value)) {
    return *nested;
  }
  return nullptr;
}

void Asset::set(std::string_view property_name, AssetValue value) {
  if (AssetProperty* property = find(property_name)) {
    property->value = std::move(value);
    return;
  }
  properties.push_back(AssetProperty{std::string(property_name), std::move(value)});
}

Asset clone_asset(const Asset& source) {
  Asset copy{};
  copy.name = source.name;
  copy.kind = source.kind;
  copy.schema = source.schema;
  copy.properties = clone_properties(source.properties);
  return copy;
}

std::shared_ptr<Asset> FindBumpGradientMap(const Asset& appearance) {
  if (appearance.kind != AssetKind::kAppearance) {
    return nullptr;
  }
  for (const std::string_view property_name : kBumpMapProperties) {
    std::shared_ptr<Asset> bump_map = appearance.connected_asset(property_name);
    if (!bump_map) {
      continue;
    }
    const std::string* base_schema = bump_map->find_string("BaseSchema");
    if (base_schema != nullptr && *base_schema == "GradientSchema") {
      return bump_map;
    }
  }
  return nullptr;
}

std::string_view to_string(AssetKind kind) {
  switch (kind) {
    case AssetKind::kAppearance:
      return "appearance";
    case AssetKind::kOther:
      return "other";
  }
  return "unknown";
}

std::vector<std::string> DumpAsset(const Asset& asset, int indent) {
  std::vector<std::string> out;
  out.push_back(pad(indent) + "Asset \"" + asset.name + "\" (" + std::string(to_string(asset.kind)) +
                ", schema \"" + asset.schema + "\")");
  dump_properties(asset.properties, indent + 1, out);
  return out;
}

std::vector<std::string> DumpMaterial(const MaterialRecord& material) {
  std::vector<std::string> out;
  out.push_back("Material " + material.display_id + " \"" + material.name + "\"");
  out.push_back("  document: " + (material.document_id == kInvalidElementId
                                      ? std::string("<none>")
                                      : format_element_label("DOC", material.document_id)));
  out.push_back("  manufacturer: " + material.manufacturer);
  out.push_back("  description: " + material.description);
  out.push_back("  url: " + material.url);
  out.push_back("  comments: " + material.comments);
  if (!material.appearance.has_value()) {
    out.push_back("  appearance: <none>");
    return out;
  }
  const std::vector<std::string> asset_lines = DumpAsset(*material.appearance, 1);
  out.insert(out.end(), asset_lines.begin(), asset_lines.end());
  return out;
}

}  // namespace gimba::core
