#pragma once

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>

namespace gimba::core {

// Host element id inside one document. 0 never names an element.
using ElementId = std::uint64_t;
constexpr ElementId kInvalidElementId = 0;

// "E-009001", "MAT-000002", "DOC-000001".
inline std::string format_element_label(std::string_view category, ElementId id, int pad_width = 6) {
  std::ostringstream oss;
  oss << category << "-" << std::setw(pad_width) << std::setfill('0') << id;
  return oss.str();
}

// Hands out document-wide element ids and per-category label numbers. Copyable
// so a document snapshot restores both sequences.
class ElementIdAllocator {
 public:
  [[nodiscard]] ElementId next_id() { return next_id_++; }

  [[nodiscard]] std::string next_label(std::string_view category) {
    ElementId& counter = label_counters_[std::string(category)];
    return format_element_label(category, ++counter);
  }

 private:
  ElementId next_id_ = 1;
  std::unordered_map<std::string, ElementId> label_counters_{};
};

}  // namespace gimba::core
