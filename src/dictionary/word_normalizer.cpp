#include "word_normalizer.hpp"
#include "utils/utf8.hpp"

#include <cstddef>
#include <string>
#include <utility>

namespace Dictionary {

namespace {
constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";
}

WordNormalizer::WordNormalizer(std::string comment_prefix)
    : comment_prefix_(Utils::utf8_to_u32(comment_prefix)) {}

NormalizedLine WordNormalizer::classify(std::string_view raw_line) const {
  NormalizedLine result;

  if (raw_line.substr(0, UTF8_BOM.size()) == UTF8_BOM)
    raw_line.remove_prefix(UTF8_BOM.size());
  // Lines read from CRLF files keep their '\r'; trimming drops it below.

  if (!Utils::is_valid_utf8(raw_line)) {
    result.kind = LineKind::MALFORMED;
    return result;
  }

  std::u32string chars = Utils::utf8_to_u32(raw_line);
  size_t first = 0;
  size_t last = chars.size();
  while (first < last && Utils::is_unicode_space(chars[first]))
    ++first;
  while (last > first && Utils::is_unicode_space(chars[last - 1]))
    --last;

  if (first == last) {
    result.kind = LineKind::BLANK;
    return result;
  }

  std::u32string_view trimmed(chars.data() + first, last - first);
  if (!comment_prefix_.empty() &&
      trimmed.substr(0, comment_prefix_.size()) == comment_prefix_) {
    result.kind = LineKind::COMMENT;
    return result;
  }

  result.kind = LineKind::WORD;
  result.word = fold(trimmed);
  return result;
}

std::optional<Word> WordNormalizer::normalize(std::string_view raw_line) const {
  NormalizedLine line = classify(raw_line);
  if (line.kind != LineKind::WORD)
    return std::nullopt;
  return std::move(line.word);
}

Word WordNormalizer::fold(std::u32string_view text) {
  Word folded(text);
  Utils::fold_case_inplace(folded);
  return folded;
}

} // namespace Dictionary
