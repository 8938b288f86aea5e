#ifndef DICTIONARY_LOADER_HPP
#define DICTIONARY_LOADER_HPP

#include "dictionary_snapshot.hpp"
#include "word_normalizer.hpp"

#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace Dictionary {

// Raised when a dictionary cannot be assembled at all. Individual unreadable
// files and bad lines are warnings, not LoadErrors.
class LoadError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct LoaderOptions {
  std::string comment_prefix = "#";
  // Words containing this character are dropped so masked output can never
  // produce a new match.
  char32_t mask_char = U'*';
  // Treat a pattern that matches no files as an error.
  bool require_files = true;
};

class DictionaryLoader {
public:
  explicit DictionaryLoader(LoaderOptions options = {});

  // Resolves the glob, reads every matching file and builds a new, unpublished
  // snapshot. Throws LoadError.
  std::shared_ptr<DictionarySnapshot> load(const std::string &pattern) const;

  std::vector<std::string> resolve_pattern(const std::string &pattern) const;

  const LoaderOptions &options() const { return options_; }

private:
  void read_source(const std::string &path, std::set<Word> &words,
                   DictionarySnapshot &snapshot) const;

  LoaderOptions options_;
  WordNormalizer normalizer_;
};

// Checks glob syntax: an unterminated bracket expression or a trailing
// backslash is rejected. Returns an error message, or empty if valid.
std::string validate_glob_pattern(const std::string &pattern);

} // namespace Dictionary

#endif // DICTIONARY_LOADER_HPP
