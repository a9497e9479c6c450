#include "gimba/core/text_format.hpp"

#include <array>
#include <charconv>
#include <iomanip>
#include <locale>
#include <sstream>
#include <system_error>

namespace gimba::core {

std::string format_number(double value) {
  if (value == 0.0) {
    return "0";
  }
  std::array<char, 64> buffer{};
  const auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
  if (ec != std::errc{}) {
    return format_fixed(value, 6);
  }
  return std::string(buffer.data(), end);
}

std::string format_fixed(double value, int decimals) {
  std::ostringstream oss;
  oss.imbue(std::locale::classic());
  oss << std::fixed << std::setprecision(decimals) << value;
  return oss.str();
}

void replace_all(std::string& text, std::string_view from, std::string_view to) {
  if (from.empty()) {
    return;
  }
  std::size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
}

std::string MakeCountMessage(std::size_t count, std::string_view format, std::string_view plural_suffix,
                             std::string_view singular_suffix) {
  std::string out(format);
  replace_all(out, "{0}", count != 0 ? std::to_string(count) : std::string("no"));
  replace_all(out, "{1}", count != 1 ? plural_suffix : singular_suffix);
  return out;
}

std::string MakeCountOkMessage(std::size_t count, bool ok, std::string_view format, std::string_view plural_suffix,
                               std::string_view singular_suffix) {
  return MakeCountMessage(count, format, plural_suffix, singular_suffix) + (ok ? " --> ok" : " --> NOT OK");
}

}  // namespace gimba::core
