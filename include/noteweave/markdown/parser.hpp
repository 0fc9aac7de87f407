#pragma once

#include "noteweave/common/result.hpp"
#include "noteweave/markdown/frontmatter.hpp"

#include <optional>
#include <string>
#include <vector>

namespace noteweave::markdown {

inline constexpr const char *kDefaultCategory = "note";
inline constexpr const char *kDefaultEntityType = "note";
inline constexpr const char *kDefaultRelationType = "relates_to";
inline constexpr const char *kInlineLinkRelationType = "links_to";

struct ParsedObservation {
  std::string category = kDefaultCategory;
  std::string content;
  std::vector<std::string> tags;
  std::optional<std::string> context;
};

struct ParsedRelation {
  std::string relation_type = kDefaultRelationType;
  std::string target;
  std::optional<std::string> context;
};

struct ParsedDraft {
  std::string title;
  std::optional<std::string> permalink;
  std::string entity_type = kDefaultEntityType;
  std::vector<std::string> tags;
  Frontmatter frontmatter;
  bool has_frontmatter = false;
  std::string body;
  std::vector<ParsedObservation> observations;
  std::vector<ParsedRelation> relations;
  std::vector<ParseWarning> warnings;

  [[nodiscard]] bool degraded() const { return !warnings.empty(); }
};

/// Parses a note into its graph fragment. Fails only for bytes that are not
/// UTF-8 text; malformed lines become warnings.
[[nodiscard]] common::Result<ParsedDraft> parse(const std::string &raw,
                                                const std::string &filename_stem);

/// Normalizes a wiki-link target: strips `[[ ]]`, drops an `|alias`, trims.
[[nodiscard]] std::string normalize_link_target(const std::string &target);

/// Tags from a frontmatter value or an inline token, without a leading '#'.
[[nodiscard]] std::vector<std::string> normalize_tags(const std::vector<std::string> &raw);

} // namespace noteweave::markdown
