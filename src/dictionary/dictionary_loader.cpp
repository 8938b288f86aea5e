#include "dictionary_loader.hpp"
#include "core/logger.hpp"
#include "utils/utf8.hpp"

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <glob.h>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace Dictionary {

namespace {

// Releases glob(3) results on scope exit
struct GlobResults {
  glob_t value{};
  ~GlobResults() { globfree(&value); }
};

int on_glob_error(const char *epath, int eerrno) {
  LOG(LogLevel::WARN, LogComponent::DICT_LOADER,
      "Skipping unreadable path while resolving dictionary pattern: "
          << epath << " (" << std::strerror(eerrno) << ")");
  return 0; // Keep going, the load is best-effort
}

} // namespace

std::string validate_glob_pattern(const std::string &pattern) {
  for (size_t i = 0; i < pattern.size(); ++i) {
    char c = pattern[i];
    if (c == '\\') {
      if (i + 1 >= pattern.size())
        return "trailing escape character";
      ++i;
    } else if (c == '[') {
      size_t j = i + 1;
      if (j < pattern.size() && (pattern[j] == '!' || pattern[j] == '^'))
        ++j;
      // A ']' right after the opening bracket is a literal member
      if (j < pattern.size() && pattern[j] == ']')
        ++j;
      while (j < pattern.size() && pattern[j] != ']') {
        if (pattern[j] == '\\')
          ++j;
        ++j;
      }
      if (j >= pattern.size())
        return "unterminated character class starting at offset " +
               std::to_string(i);
      i = j;
    }
  }
  return {};
}

DictionaryLoader::DictionaryLoader(LoaderOptions options)
    : options_(std::move(options)), normalizer_(options_.comment_prefix) {}

std::vector<std::string>
DictionaryLoader::resolve_pattern(const std::string &pattern) const {
  if (pattern.empty())
    throw LoadError("Dictionary pattern is empty");

  std::string syntax_error = validate_glob_pattern(pattern);
  if (!syntax_error.empty())
    throw LoadError("Invalid dictionary pattern '" + pattern +
                    "': " + syntax_error);

  GlobResults results;
  int rc = glob(pattern.c_str(), 0, on_glob_error, &results.value);

  std::vector<std::string> files;
  switch (rc) {
  case 0:
    files.reserve(results.value.gl_pathc);
    for (size_t i = 0; i < results.value.gl_pathc; ++i)
      files.emplace_back(results.value.gl_pathv[i]);
    break;
  case GLOB_NOMATCH:
    break;
  case GLOB_NOSPACE:
    throw LoadError("Out of memory while resolving dictionary pattern '" +
                    pattern + "'");
  default:
    throw LoadError("Failed to resolve dictionary pattern '" + pattern + "'");
  }

  if (files.empty() && options_.require_files)
    throw LoadError("No dictionary files match pattern '" + pattern + "'");

  return files;
}

void DictionaryLoader::read_source(const std::string &path,
                                   std::set<Word> &words,
                                   DictionarySnapshot &snapshot) const {
  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    snapshot.warnings.push_back(path + ": is a directory, skipped");
    return;
  }

  std::ifstream source(path);
  if (!source.is_open()) {
    snapshot.warnings.push_back(path + ": could not be opened (" +
                                std::strerror(errno) + ")");
    return;
  }

  size_t line_number = 0;
  size_t added = 0;
  size_t malformed = 0;
  size_t first_malformed_line = 0;
  size_t masked = 0;
  // Words are stored folded, and so is the text they are matched against
  const char32_t folded_mask = Utils::fold_case(options_.mask_char);

  std::string line;
  while (std::getline(source, line)) {
    ++line_number;
    NormalizedLine normalized = normalizer_.classify(line);

    switch (normalized.kind) {
    case LineKind::BLANK:
    case LineKind::COMMENT:
      break;
    case LineKind::MALFORMED:
      if (malformed++ == 0)
        first_malformed_line = line_number;
      break;
    case LineKind::WORD:
      if (normalized.word.find(folded_mask) != Word::npos) {
        ++masked;
        break;
      }
      if (words.insert(std::move(normalized.word)).second)
        ++added;
      break;
    }
  }

  if (source.bad())
    snapshot.warnings.push_back(path + ": read error after line " +
                                std::to_string(line_number));
  if (malformed > 0)
    snapshot.warnings.push_back(
        path + ": skipped " + std::to_string(malformed) +
        " line(s) that are not valid UTF-8, first at line " +
        std::to_string(first_malformed_line));
  if (masked > 0)
    snapshot.warnings.push_back(path + ": skipped " + std::to_string(masked) +
                                " word(s) containing the mask character");

  snapshot.lines_read += line_number;
  snapshot.source_files.push_back(path);

  LOG(LogLevel::DEBUG, LogComponent::DICT_LOADER,
      "Read " << line_number << " lines from " << path << ", " << added
              << " new words");
}

std::shared_ptr<DictionarySnapshot>
DictionaryLoader::load(const std::string &pattern) const {
  auto start_time = std::chrono::steady_clock::now();
  std::vector<std::string> files = resolve_pattern(pattern);

  LOG(LogLevel::INFO, LogComponent::DICT_LOADER,
      "Loading dictionary from " << files.size() << " file(s) matching '"
                                 << pattern << "'");

  auto snapshot = std::make_shared<DictionarySnapshot>();
  snapshot->source_pattern = pattern;
  snapshot->mask_char = options_.mask_char;

  std::set<Word> words;
  for (const auto &path : files)
    read_source(path, words, *snapshot);

  for (const auto &warning : snapshot->warnings)
    LOG(LogLevel::WARN, LogComponent::DICT_LOADER, warning);

  std::vector<Word> word_list(words.begin(), words.end());
  words.clear();

  snapshot->automaton = std::make_shared<const Utils::AhoCorasick>(word_list);
  snapshot->word_count = snapshot->automaton->pattern_count();
  snapshot->built_at = std::chrono::system_clock::now();

  auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - start_time)
                        .count();
  LOG(LogLevel::DEBUG, LogComponent::DICT_AUTOMATON,
      "Automaton built with " << snapshot->automaton->node_count()
                              << " nodes for " << snapshot->word_count
                              << " words");
  LOG(LogLevel::INFO, LogComponent::DICT_LOADER,
      "Dictionary built: " << snapshot->word_count << " words from "
                           << snapshot->source_files.size() << " file(s), "
                           << snapshot->warnings.size() << " warning(s), took "
                           << elapsed_ms << "ms");
  return snapshot;
}

} // namespace Dictionary
