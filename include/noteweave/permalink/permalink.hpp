#pragma once

#include <functional>
#include <optional>
#include <string>

namespace noteweave::permalink {

inline constexpr const char *kFallbackSlug = "untitled";

/// URL-safe slug: diacritics folded, camelCase split, lowercase, words joined
/// by single hyphens. Letters outside Latin (CJK, Cyrillic, ...) are kept.
/// Returns an empty string when nothing usable remains.
[[nodiscard]] std::string slugify(const std::string &text, bool keep_slashes = false);

/// Slug for a project-relative file path: "docs/My Note.md" -> "docs/my-note".
/// Non-Markdown files keep their extension folded in: "img/a.png" -> "img/a-png".
[[nodiscard]] std::string permalink_for_path(const std::string &relative_path);

/// Safe file name (without extension) for a title.
[[nodiscard]] std::string sanitize_filename(const std::string &title);

using TakenPredicate = std::function<bool(const std::string &)>;

/// First free value of base, base-1, base-2, ...
[[nodiscard]] std::string unique_permalink(const std::string &base, const TakenPredicate &taken);

/// Picks the permalink for an entity. An existing permalink is kept while it is
/// free; otherwise the title slug is used. Collisions get a numeric suffix.
[[nodiscard]] std::string resolve(const std::string &title,
                                  const std::optional<std::string> &existing_permalink,
                                  const TakenPredicate &taken);

} // namespace noteweave::permalink
