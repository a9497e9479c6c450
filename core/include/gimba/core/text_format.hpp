#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace gimba::core {

// Invariant-culture number text: shortest form that reads back to the same
// double ("12", "1.75", "37.69911184307752").
[[nodiscard]] std::string format_number(double value);

// Fixed number of decimals, '.' as separator.
[[nodiscard]] std::string format_fixed(double value, int decimals);

void replace_all(std::string& text, std::string_view from, std::string_view to);

// Fills "{0}" with the count ("no" for zero) and "{1}" with the plural or
// singular suffix.
[[nodiscard]] std::string MakeCountMessage(std::size_t count, std::string_view format,
                                           std::string_view plural_suffix = "s",
                                           std::string_view singular_suffix = "");

// MakeCountMessage plus " --> ok" or " --> NOT OK".
[[nodiscard]] std::string MakeCountOkMessage(std::size_t count, bool ok, std::string_view format,
                                             std::string_view plural_suffix = "s",
                                             std::string_view singular_suffix = "");

}  // namespace gimba::core
