#include "aho_corasick.hpp"

#include <cctype>
#include <cstddef>
#include <queue>

namespace Utils {

namespace {
char fold(char ch) {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
}
} // namespace

AhoCorasick::AhoCorasick(const std::vector<std::string> &patterns) {
  trie_.emplace_back(); // Root node

  // 1. Build the basic trie structure
  for (const auto &raw_pattern : patterns) {
    if (raw_pattern.empty())
      continue;
    std::string pattern;
    for (char ch : raw_pattern)
      pattern.push_back(fold(ch));

    int node = 0;
    for (char ch : pattern) {
      auto it = trie_[node].children.find(ch);
      if (it == trie_[node].children.end()) {
        int next = static_cast<int>(trie_.size());
        trie_[node].children[ch] = next;
        trie_.emplace_back();
        node = next;
      } else
        node = it->second;
    }
    trie_[node].pattern_indices.push_back(static_cast<int>(patterns_.size()));
    patterns_.push_back(std::move(pattern));
  }

  // 2. Build suffix and output links using BFS
  std::queue<int> q;
  for (auto const &[key, val] : trie_[0].children)
    q.push(val);

  while (!q.empty()) {
    int u = q.front();
    q.pop();

    for (auto const &[ch, v] : trie_[u].children) {
      int j = trie_[u].suffix_link;
      while (j > 0 && trie_[j].children.find(ch) == trie_[j].children.end())
        j = trie_[j].suffix_link;
      auto link = trie_[j].children.find(ch);
      if (link != trie_[j].children.end() && link->second != v)
        trie_[v].suffix_link = link->second;
      q.push(v);
    }

    int suffix_node = trie_[u].suffix_link;
    if (!trie_[suffix_node].pattern_indices.empty())
      trie_[u].output_link = suffix_node;
    else
      trie_[u].output_link = trie_[suffix_node].output_link;
  }
}

int AhoCorasick::step(int node, char ch) const {
  while (node > 0 && trie_[node].children.find(ch) == trie_[node].children.end())
    node = trie_[node].suffix_link;
  auto it = trie_[node].children.find(ch);
  return it != trie_[node].children.end() ? it->second : 0;
}

std::vector<std::string> AhoCorasick::find_all(std::string_view text) const {
  std::vector<std::string> found_patterns;
  int current_node = 0;

  for (char ch : text) {
    current_node = step(current_node, fold(ch));

    int temp_node = current_node;
    while (temp_node > 0) {
      for (int pattern_idx : trie_[temp_node].pattern_indices)
        found_patterns.push_back(patterns_[pattern_idx]);
      temp_node = trie_[temp_node].output_link;
    }
  }
  return found_patterns;
}

std::optional<std::string> AhoCorasick::find_first(std::string_view text) const {
  if (patterns_.empty())
    return std::nullopt;

  int current_node = 0;
  for (char ch : text) {
    current_node = step(current_node, fold(ch));
    if (!trie_[current_node].pattern_indices.empty())
      return patterns_[trie_[current_node].pattern_indices.front()];
    int output = trie_[current_node].output_link;
    if (output > 0)
      return patterns_[trie_[output].pattern_indices.front()];
  }
  return std::nullopt;
}

} // namespace Utils
