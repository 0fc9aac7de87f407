#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace noteweave::markdown {

struct ParseWarning {
  std::size_t line = 0;
  std::string message;
};

struct FrontmatterValue {
  std::string scalar;
  std::vector<std::string> list;
  bool is_list = false;
  // Source lines of the entry; re-emitted unchanged while the value is untouched.
  std::string raw;
};

/// Ordered key/value block at the top of a note. Keys keep file order.
class Frontmatter {
public:
  [[nodiscard]] bool empty() const { return entries_.empty(); }
  [[nodiscard]] std::size_t size() const { return entries_.size(); }
  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::optional<std::string> get_scalar(const std::string &key) const;
  /// List values as-is; a scalar is split on commas.
  [[nodiscard]] std::vector<std::string> get_list(const std::string &key) const;
  [[nodiscard]] std::vector<std::string> keys() const;
  [[nodiscard]] const std::vector<std::pair<std::string, FrontmatterValue>> &entries() const {
    return entries_;
  }

  void set_scalar(const std::string &key, std::string value);
  void set_list(const std::string &key, std::vector<std::string> values);
  /// Appends the entry, or replaces the existing one in place.
  void set_value(const std::string &key, FrontmatterValue value);
  bool erase(const std::string &key);

  /// Lines before the first key (comments); preserved on render.
  std::string preamble;

private:
  [[nodiscard]] FrontmatterValue *find(const std::string &key);
  [[nodiscard]] const FrontmatterValue *find(const std::string &key) const;

  std::vector<std::pair<std::string, FrontmatterValue>> entries_;
};

struct SplitDocument {
  std::optional<std::string> frontmatter;
  std::string body;
  // 1-based line number of the first frontmatter line, and of the first body line.
  std::size_t frontmatter_line = 0;
  std::size_t body_line = 1;
  std::vector<ParseWarning> warnings;
};

/// Separates a leading `---` fenced block from the body. The body is the exact
/// text after the closing fence line.
[[nodiscard]] SplitDocument split_frontmatter(const std::string &text);

/// Parses the YAML subset used in note headers: `key: value`, quoted scalars,
/// flow lists `[a, b]`, block lists, and `|` / `>` block scalars. Malformed
/// lines are skipped with a warning.
[[nodiscard]] Frontmatter parse_frontmatter(const std::string &block, std::size_t first_line,
                                            std::vector<ParseWarning> &warnings);

[[nodiscard]] std::string render_frontmatter(const Frontmatter &frontmatter);

/// Frontmatter fence plus body; the inverse of split_frontmatter.
[[nodiscard]] std::string render_document(const Frontmatter &frontmatter, const std::string &body);

} // namespace noteweave::markdown
