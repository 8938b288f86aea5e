#include "aho_corasick.hpp"

#include <cstddef>
#include <cstdint>
#include <queue>
#include <stdexcept>

namespace Utils {

AhoCorasick::AhoCorasick() { trie_.emplace_back(); }

AhoCorasick::AhoCorasick(const std::vector<std::u32string> &patterns) {
  trie_.emplace_back(); // Root node

  // 1. Build the basic trie structure
  for (const auto &pattern : patterns) {
    if (pattern.empty())
      continue;

    uint32_t node = 0;
    for (char32_t ch : pattern) {
      uint32_t next = child_of(node, ch);
      if (next == 0) {
        if (trie_.size() >= UINT32_MAX)
          throw std::length_error("AhoCorasick: too many trie nodes");
        next = static_cast<uint32_t>(trie_.size());
        trie_[node].children.emplace(ch, next);
        trie_.emplace_back();
      }
      node = next;
    }

    if (trie_[node].terminal)
      continue; // Duplicate pattern

    trie_[node].terminal = true;
    trie_[node].outputs.push_back(static_cast<uint32_t>(patterns_.size()));
    patterns_.push_back(pattern);
  }

  // 2. Build suffix links and merge outputs using BFS. A node's suffix link
  // is always shallower than the node itself, so its outputs are final by
  // the time they are merged.
  std::queue<uint32_t> q;
  for (auto const &[ch, child] : trie_[0].children) {
    trie_[child].suffix_link = 0;
    q.push(child);
  }

  while (!q.empty()) {
    uint32_t u = q.front();
    q.pop();

    for (auto const &[ch, v] : trie_[u].children) {
      uint32_t j = trie_[u].suffix_link;
      while (j > 0 && child_of(j, ch) == 0)
        j = trie_[j].suffix_link;
      uint32_t link = child_of(j, ch);
      trie_[v].suffix_link = link;

      const auto &inherited = trie_[link].outputs;
      trie_[v].outputs.insert(trie_[v].outputs.end(), inherited.begin(),
                              inherited.end());
      q.push(v);
    }
  }
}

uint32_t AhoCorasick::child_of(uint32_t node, char32_t ch) const {
  const auto &children = trie_[node].children;
  auto it = children.find(ch);
  return it == children.end() ? 0 : it->second;
}

uint32_t AhoCorasick::next_state(uint32_t node, char32_t ch) const {
  while (node > 0 && child_of(node, ch) == 0)
    node = trie_[node].suffix_link;
  return child_of(node, ch);
}

ScanResult AhoCorasick::scan(std::u32string_view text, ScanMode mode) const {
  ScanResult result;
  if (patterns_.empty())
    return result;

  uint32_t current_node = 0;
  for (size_t pos = 0; pos < text.size(); ++pos) {
    current_node = next_state(current_node, text[pos]);

    const auto &outputs = trie_[current_node].outputs;
    if (outputs.empty())
      continue;

    result.found = true;
    if (mode == ScanMode::EXISTENCE)
      return result;

    const size_t end = pos + 1;
    for (uint32_t id : outputs) {
      const std::u32string &word = patterns_[id];
      result.spans.push_back(MatchSpan{end - word.size(), end, word});
    }
  }
  return result;
}

bool AhoCorasick::contains_any(std::u32string_view text) const {
  return scan(text, ScanMode::EXISTENCE).found;
}

std::vector<MatchSpan> AhoCorasick::find_all(std::u32string_view text) const {
  return scan(text, ScanMode::ALL_SPANS).spans;
}

} // namespace Utils
