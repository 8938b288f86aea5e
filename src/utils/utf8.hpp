#ifndef UTF8_HPP
#define UTF8_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace Utils {

constexpr char32_t REPLACEMENT_CHARACTER = 0xFFFD;

// Text split into code points. offsets[i] is the byte offset of chars[i] in
// the source string; offsets has one trailing entry holding the source size.
// Each invalid byte decodes to its own REPLACEMENT_CHARACTER entry and is
// flagged in invalid.
struct DecodedText {
  std::u32string chars;
  std::vector<size_t> offsets;
  std::vector<bool> invalid;
  bool has_invalid = false;

  size_t size() const { return chars.size(); }
  std::string_view raw_slice(std::string_view source, size_t index) const {
    return source.substr(offsets[index], offsets[index + 1] - offsets[index]);
  }
};

DecodedText decode_utf8(std::string_view text);
bool is_valid_utf8(std::string_view text);
size_t count_code_points(std::string_view text);

std::u32string utf8_to_u32(std::string_view text);
std::string u32_to_utf8(std::u32string_view text);
void append_utf8(std::string &out, char32_t cp);

// Simple one-to-one lowercase mapping. Covers ASCII, Latin-1, Latin
// Extended-A, Greek and Cyrillic; everything else maps to itself.
char32_t fold_case(char32_t cp);
void fold_case_inplace(std::u32string &text);

bool is_unicode_space(char32_t cp);

} // namespace Utils

#endif // UTF8_HPP
