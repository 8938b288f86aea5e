#ifndef AHO_CORASICK_HPP
#define AHO_CORASICK_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Utils {

// A located occurrence of one pattern. Offsets are code point indices into
// the scanned text, end is exclusive. `word` points into the automaton and is
// valid for as long as the automaton is.
struct MatchSpan {
  size_t start = 0;
  size_t end = 0;
  std::u32string_view word;
};

enum class ScanMode { EXISTENCE, ALL_SPANS };

struct ScanResult {
  bool found = false;
  std::vector<MatchSpan> spans;
};

// Multi-pattern matcher over Unicode code points. Immutable once constructed,
// so a single instance can be scanned from any number of threads.
class AhoCorasick {
public:
  AhoCorasick();
  explicit AhoCorasick(const std::vector<std::u32string> &patterns);

  // One left-to-right pass. EXISTENCE stops at the first match and leaves
  // `spans` empty; ALL_SPANS reports every match, including overlapping and
  // nested ones, ordered by end offset and then longest first.
  ScanResult scan(std::u32string_view text, ScanMode mode) const;

  bool contains_any(std::u32string_view text) const;
  std::vector<MatchSpan> find_all(std::u32string_view text) const;

  size_t pattern_count() const { return patterns_.size(); }
  size_t node_count() const { return trie_.size(); }
  bool empty() const { return patterns_.empty(); }
  const std::u32string &pattern(uint32_t id) const { return patterns_[id]; }

private:
  struct TrieNode {
    std::unordered_map<char32_t, uint32_t> children;
    uint32_t suffix_link = 0; // Default to root
    bool terminal = false;
    // Ids of every pattern ending here, own pattern first and then those
    // inherited along the suffix link chain.
    std::vector<uint32_t> outputs;
  };

  uint32_t child_of(uint32_t node, char32_t ch) const;
  uint32_t next_state(uint32_t node, char32_t ch) const;

  std::vector<TrieNode> trie_;
  std::vector<std::u32string> patterns_;
};

} // namespace Utils

#endif // AHO_CORASICK_HPP
