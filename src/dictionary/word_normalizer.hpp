#ifndef WORD_NORMALIZER_HPP
#define WORD_NORMALIZER_HPP

#include <optional>
#include <string>
#include <string_view>

namespace Dictionary {

// A trimmed, case-folded dictionary entry.
using Word = std::u32string;

enum class LineKind { WORD, BLANK, COMMENT, MALFORMED };

struct NormalizedLine {
  LineKind kind = LineKind::BLANK;
  Word word;
};

class WordNormalizer {
public:
  // An empty comment prefix disables comment detection.
  explicit WordNormalizer(std::string comment_prefix = "#");

  NormalizedLine classify(std::string_view raw_line) const;
  std::optional<Word> normalize(std::string_view raw_line) const;

  // Folds text the same way dictionary words are folded.
  static Word fold(std::u32string_view text);

private:
  std::u32string comment_prefix_;
};

} // namespace Dictionary

#endif // WORD_NORMALIZER_HPP
