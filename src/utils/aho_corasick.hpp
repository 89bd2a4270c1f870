#ifndef AHO_CORASICK_HPP
#define AHO_CORASICK_HPP

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Utils {

// Multi-pattern substring matcher. Patterns and text are compared
// case-insensitively (ASCII).
class AhoCorasick {
public:
  explicit AhoCorasick(const std::vector<std::string> &patterns);

  std::vector<std::string> find_all(std::string_view text) const;

  // Earliest-ending match in `text`, if any
  std::optional<std::string> find_first(std::string_view text) const;

  bool empty() const { return patterns_.empty(); }

private:
  struct TrieNode {
    std::unordered_map<char, int> children;
    int suffix_link = 0; // Default to root
    int output_link = 0; // Default to root
    std::vector<int> pattern_indices;
  };

  int step(int node, char ch) const;

  std::vector<TrieNode> trie_;
  std::vector<std::string> patterns_;
};

} // namespace Utils

#endif // AHO_CORASICK_HPP
