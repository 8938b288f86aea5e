#ifndef TEXT_FILTER_HPP
#define TEXT_FILTER_HPP

#include "dictionary_snapshot.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace Dictionary {

// A dictionary hit in the caller's text, located in code points.
struct TextMatch {
  size_t start = 0;
  size_t end = 0;
  std::string word; // dictionary form (folded), UTF-8
};

// True iff any dictionary word occurs in `text`, ignoring case.
bool exists(const DictionarySnapshot &snapshot, std::string_view text);

// Copy of `text` with every code point covered by a dictionary match replaced
// by one `mask_char`. Unmatched bytes, including invalid UTF-8, are copied
// through unchanged, so the code point count is preserved.
std::string filter(const DictionarySnapshot &snapshot, std::string_view text,
                   char32_t mask_char);

std::vector<TextMatch> find_matches(const DictionarySnapshot &snapshot,
                                    std::string_view text);

} // namespace Dictionary

#endif // TEXT_FILTER_HPP
