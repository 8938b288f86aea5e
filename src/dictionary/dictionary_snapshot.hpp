#ifndef DICTIONARY_SNAPSHOT_HPP
#define DICTIONARY_SNAPSHOT_HPP

#include "utils/aho_corasick.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace Dictionary {

// One immutable build of the dictionary. Readers hold it through a
// shared_ptr<const DictionarySnapshot>, so a superseded snapshot lives until
// the last in-flight lookup lets go of it.
struct DictionarySnapshot {
  std::shared_ptr<const Utils::AhoCorasick> automaton;
  size_t word_count = 0;
  // Mask the words were filtered against at build time. Filtering with any
  // other mask could produce a new match.
  char32_t mask_char = U'*';
  std::chrono::system_clock::time_point built_at;
  // Assigned by DictionaryStore::publish; 0 until published.
  uint64_t version = 0;

  std::string source_pattern;
  std::vector<std::string> source_files;
  std::vector<std::string> warnings;
  size_t lines_read = 0;
};

inline std::shared_ptr<DictionarySnapshot> make_empty_snapshot() {
  auto snapshot = std::make_shared<DictionarySnapshot>();
  snapshot->automaton = std::make_shared<const Utils::AhoCorasick>();
  snapshot->built_at = std::chrono::system_clock::now();
  return snapshot;
}

} // namespace Dictionary

#endif // DICTIONARY_SNAPSHOT_HPP
