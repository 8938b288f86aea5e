#ifndef UTILS_HPP
#define UTILS_HPP

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace Utils {
// ASCII whitespace only; dictionary text is trimmed with the Unicode-aware
// helpers in utf8.hpp.
std::string trim_copy(std::string_view sv);
std::string to_lower_ascii(std::string_view s);
bool starts_with(std::string_view s, std::string_view prefix);
std::string format_iso8601_utc(uint64_t epoch_ms);

// Whole-string parse; partial matches and empty input yield nullopt.
template <typename T> std::optional<T> string_to_number(std::string_view s) {
  if (s.empty())
    return std::nullopt;

  T value;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);

  if (ec == std::errc() && ptr == s.data() + s.size())
    return value;
  return std::nullopt;
}
} // namespace Utils

#endif // UTILS_HPP
