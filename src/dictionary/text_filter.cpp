#include "text_filter.hpp"
#include "utils/utf8.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace Dictionary {

namespace {

// Invalid input bytes become values past U+10FFFF so they can never match a
// dictionary word, not even one containing U+FFFD.
constexpr char32_t INVALID_BYTE_BASE = 0x110000;

Utils::DecodedText decode_for_scan(std::string_view text) {
  Utils::DecodedText decoded = Utils::decode_utf8(text);
  for (size_t i = 0; i < decoded.size(); ++i) {
    if (decoded.invalid[i])
      decoded.chars[i] = INVALID_BYTE_BASE +
                         static_cast<unsigned char>(text[decoded.offsets[i]]);
    else
      decoded.chars[i] = Utils::fold_case(decoded.chars[i]);
  }
  return decoded;
}

} // namespace

bool exists(const DictionarySnapshot &snapshot, std::string_view text) {
  if (!snapshot.automaton || snapshot.automaton->empty() || text.empty())
    return false;

  Utils::DecodedText decoded = decode_for_scan(text);
  return snapshot.automaton->contains_any(decoded.chars);
}

std::string filter(const DictionarySnapshot &snapshot, std::string_view text,
                   char32_t mask_char) {
  if (!snapshot.automaton || snapshot.automaton->empty() || text.empty())
    return std::string(text);

  Utils::DecodedText decoded = decode_for_scan(text);
  std::vector<Utils::MatchSpan> spans =
      snapshot.automaton->find_all(decoded.chars);
  if (spans.empty())
    return std::string(text);

  // Overlapping spans mask each offset once
  std::vector<bool> covered(decoded.size(), false);
  for (const auto &span : spans)
    for (size_t i = span.start; i < span.end; ++i)
      covered[i] = true;

  std::string mask;
  Utils::append_utf8(mask, mask_char);

  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < decoded.size(); ++i) {
    if (covered[i])
      out += mask;
    else
      out += decoded.raw_slice(text, i);
  }
  return out;
}

std::vector<TextMatch> find_matches(const DictionarySnapshot &snapshot,
                                    std::string_view text) {
  std::vector<TextMatch> matches;
  if (!snapshot.automaton || snapshot.automaton->empty() || text.empty())
    return matches;

  Utils::DecodedText decoded = decode_for_scan(text);
  for (const auto &span : snapshot.automaton->find_all(decoded.chars))
    matches.push_back(
        TextMatch{span.start, span.end, Utils::u32_to_utf8(span.word)});
  return matches;
}

} // namespace Dictionary
