#include "utf8.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace Utils {

namespace {

// Decodes one code point starting at text[pos]. Returns the number of bytes
// consumed, or 0 if the sequence at pos is not well-formed UTF-8.
size_t decode_one(std::string_view text, size_t pos, char32_t &cp) {
  const auto byte = [&](size_t i) {
    return static_cast<unsigned char>(text[pos + i]);
  };
  const size_t remaining = text.size() - pos;
  const unsigned char lead = byte(0);

  if (lead < 0x80) {
    cp = lead;
    return 1;
  }

  size_t length;
  char32_t min_value;
  if ((lead & 0xE0) == 0xC0) {
    length = 2;
    cp = lead & 0x1F;
    min_value = 0x80;
  } else if ((lead & 0xF0) == 0xE0) {
    length = 3;
    cp = lead & 0x0F;
    min_value = 0x800;
  } else if ((lead & 0xF8) == 0xF0) {
    length = 4;
    cp = lead & 0x07;
    min_value = 0x10000;
  } else {
    return 0;
  }

  if (remaining < length)
    return 0;

  for (size_t i = 1; i < length; ++i) {
    if ((byte(i) & 0xC0) != 0x80)
      return 0;
    cp = (cp << 6) | (byte(i) & 0x3F);
  }

  // Overlong forms, UTF-16 surrogates and values past U+10FFFF
  if (cp < min_value || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
    return 0;

  return length;
}

} // namespace

DecodedText decode_utf8(std::string_view text) {
  DecodedText decoded;
  decoded.chars.reserve(text.size());
  decoded.offsets.reserve(text.size() + 1);
  decoded.invalid.reserve(text.size());

  size_t pos = 0;
  while (pos < text.size()) {
    char32_t cp = 0;
    size_t consumed = decode_one(text, pos, cp);
    decoded.offsets.push_back(pos);
    if (consumed == 0) {
      decoded.chars.push_back(REPLACEMENT_CHARACTER);
      decoded.invalid.push_back(true);
      decoded.has_invalid = true;
      pos += 1;
    } else {
      decoded.chars.push_back(cp);
      decoded.invalid.push_back(false);
      pos += consumed;
    }
  }
  decoded.offsets.push_back(text.size());
  return decoded;
}

bool is_valid_utf8(std::string_view text) {
  size_t pos = 0;
  while (pos < text.size()) {
    char32_t cp = 0;
    size_t consumed = decode_one(text, pos, cp);
    if (consumed == 0)
      return false;
    pos += consumed;
  }
  return true;
}

size_t count_code_points(std::string_view text) {
  size_t count = 0;
  size_t pos = 0;
  while (pos < text.size()) {
    char32_t cp = 0;
    size_t consumed = decode_one(text, pos, cp);
    pos += consumed == 0 ? 1 : consumed;
    ++count;
  }
  return count;
}

std::u32string utf8_to_u32(std::string_view text) {
  return decode_utf8(text).chars;
}

void append_utf8(std::string &out, char32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

std::string u32_to_utf8(std::u32string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char32_t cp : text)
    append_utf8(out, cp);
  return out;
}

char32_t fold_case(char32_t cp) {
  if (cp < 0x80) {
    if (cp >= U'A' && cp <= U'Z')
      return cp + 0x20;
    return cp;
  }

  // Latin-1 Supplement (0xD7 is the multiplication sign)
  if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7)
    return cp + 0x20;

  // Latin Extended-A
  if (cp >= 0x100 && cp <= 0x17F) {
    if (cp == 0x130)
      return U'i';
    if (cp == 0x178)
      return 0xFF;
    if ((cp >= 0x100 && cp <= 0x137) || (cp >= 0x14A && cp <= 0x177))
      return (cp % 2 == 0) ? cp + 1 : cp;
    if ((cp >= 0x139 && cp <= 0x148) || (cp >= 0x179 && cp <= 0x17E))
      return (cp % 2 == 1) ? cp + 1 : cp;
    return cp;
  }

  // Greek
  if (cp >= 0x370 && cp <= 0x3FF) {
    if (cp == 0x386)
      return 0x3AC;
    if (cp >= 0x388 && cp <= 0x38A)
      return cp + 0x25;
    if (cp == 0x38C)
      return 0x3CC;
    if (cp == 0x38E || cp == 0x38F)
      return cp + 0x3F;
    if ((cp >= 0x391 && cp <= 0x3A1) || (cp >= 0x3A3 && cp <= 0x3AB))
      return cp + 0x20;
    if (cp == 0x3C2) // final sigma
      return 0x3C3;
    return cp;
  }

  // Cyrillic
  if (cp >= 0x400 && cp <= 0x52F) {
    if (cp <= 0x40F)
      return cp + 0x50;
    if (cp <= 0x42F)
      return cp + 0x20;
    if ((cp >= 0x460 && cp <= 0x481) || (cp >= 0x48A && cp <= 0x4BF) ||
        (cp >= 0x4D0 && cp <= 0x52F))
      return (cp % 2 == 0) ? cp + 1 : cp;
    if (cp == 0x4C0)
      return 0x4CF;
    if (cp >= 0x4C1 && cp <= 0x4CE)
      return (cp % 2 == 1) ? cp + 1 : cp;
    return cp;
  }

  return cp;
}

void fold_case_inplace(std::u32string &text) {
  for (auto &cp : text)
    cp = fold_case(cp);
}

bool is_unicode_space(char32_t cp) {
  switch (cp) {
  case U' ':
  case U'\t':
  case U'\n':
  case U'\v':
  case U'\f':
  case U'\r':
  case 0x85:
  case 0xA0:
  case 0x1680:
  case 0x2028:
  case 0x2029:
  case 0x202F:
  case 0x205F:
  case 0x3000:
    return true;
  default:
    return cp >= 0x2000 && cp <= 0x200A;
  }
}

} // namespace Utils
