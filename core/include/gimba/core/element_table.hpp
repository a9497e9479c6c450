#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "gimba/core/id.hpp"

namespace gimba::core {

template <typename T>
concept NamedElement = requires(T value) {
  { value.id } -> std::convertible_to<ElementId>;
  { value.name } -> std::convertible_to<std::string>;
};

// Elements of one document in creation order, indexed by id and by name.
// Names are unique within the table.
template <NamedElement T>
class ElementTable {
 public:
  [[nodiscard]] std::size_t size() const { return items_.size(); }

  [[nodiscard]] bool empty() const { return items_.empty(); }

  [[nodiscard]] const T* find(ElementId id) const {
    auto it = std::find_if(items_.begin(), items_.end(), [id](const T& item) { return item.id == id; });
    return it == items_.end() ? nullptr : &*it;
  }

  [[nodiscard]] const T* find_named(std::string_view name) const {
    auto it = id_by_name_.find(std::string(name));
    return it == id_by_name_.end() ? nullptr : find(it->second);
  }

  // Refuses an id or name already present.
  bool insert(T&& value) {
    if (value.id == kInvalidElementId || find(value.id) != nullptr || id_by_name_.contains(value.name)) {
      return false;
    }
    id_by_name_.emplace(value.name, value.id);
    items_.push_back(std::move(value));
    return true;
  }

  // Keeps the order of the remaining elements.
  bool erase(ElementId id) {
    auto it = std::find_if(items_.begin(), items_.end(), [id](const T& item) { return item.id == id; });
    if (it == items_.end()) {
      return false;
    }
    id_by_name_.erase(it->name);
    items_.erase(it);
    return true;
  }

  [[nodiscard]] const std::vector<T>& items() const { return items_; }

 private:
  std::vector<T> items_{};
  std::unordered_map<std::string, ElementId> id_by_name_{};
};

}  // namespace gimba::core
