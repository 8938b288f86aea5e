#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace Utils {

std::string trim_copy(std::string_view sv) {
  const char *whitespace = " \t\n\r\f\v";
  size_t first = sv.find_first_not_of(whitespace);
  if (first == std::string_view::npos)
    return {};
  size_t last = sv.find_last_not_of(whitespace);
  return std::string(sv.substr(first, last - first + 1));
}

std::string to_lower_ascii(std::string_view s) {
  std::string out{s};
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

bool starts_with(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::string format_iso8601_utc(uint64_t epoch_ms) {
  std::time_t seconds = static_cast<std::time_t>(epoch_ms / 1000);
  std::tm tm_utc{};
  gmtime_r(&seconds, &tm_utc);

  std::ostringstream oss;
  oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
      << std::setfill('0') << (epoch_ms % 1000) << 'Z';
  return oss.str();
}

} // namespace Utils
