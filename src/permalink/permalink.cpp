#include "noteweave/permalink/permalink.hpp"

#include "noteweave/common/fs.hpp"
#include "noteweave/common/utf8.hpp"
#include "noteweave/filter/ignore_policy.hpp"

#include <filesystem>

namespace noteweave::permalink {

namespace {

// ASCII folding for Latin-1 Supplement and Latin Extended-A letters.
const char *fold_latin(const char32_t cp) {
  if (cp >= 0xC0 && cp <= 0xFF) {
    static const char *latin1[] = {
        "a",  "a", "a", "a", "a", "a", "ae", "c", "e", "e", "e", "e", "i", "i", "i",  "i",
        "d",  "n", "o", "o", "o", "o", "o",  nullptr, "o", "u", "u", "u", "u", "y", "th", "ss",
        "a",  "a", "a", "a", "a", "a", "ae", "c", "e", "e", "e", "e", "i", "i", "i",  "i",
        "d",  "n", "o", "o", "o", "o", "o",  nullptr, "o", "u", "u", "u", "u", "y", "th", "y"};
    return latin1[cp - 0xC0];
  }
  if (cp < 0x100 || cp > 0x17F) {
    return nullptr;
  }
  struct Range {
    char32_t first;
    char32_t last;
    const char *ascii;
  };
  static const Range ranges[] = {
      {0x100, 0x105, "a"}, {0x106, 0x10D, "c"}, {0x10E, 0x111, "d"}, {0x112, 0x11B, "e"},
      {0x11C, 0x123, "g"}, {0x124, 0x127, "h"}, {0x128, 0x131, "i"}, {0x132, 0x133, "ij"},
      {0x134, 0x135, "j"}, {0x136, 0x138, "k"}, {0x139, 0x142, "l"}, {0x143, 0x14B, "n"},
      {0x14C, 0x151, "o"}, {0x152, 0x153, "oe"}, {0x154, 0x159, "r"}, {0x15A, 0x161, "s"},
      {0x162, 0x167, "t"}, {0x168, 0x173, "u"}, {0x174, 0x175, "w"}, {0x176, 0x178, "y"},
      {0x179, 0x17E, "z"}, {0x17F, 0x17F, "s"}};
  for (const auto &range : ranges) {
    if (cp >= range.first && cp <= range.last) {
      return range.ascii;
    }
  }
  return nullptr;
}

bool is_upper_ascii(const char32_t cp) { return cp >= 'A' && cp <= 'Z'; }
bool is_lower_ascii(const char32_t cp) { return cp >= 'a' && cp <= 'z'; }

char32_t lower(const char32_t cp) {
  if (is_upper_ascii(cp)) {
    return cp + 32;
  }
  if ((cp >= 0x391 && cp <= 0x3A9) || (cp >= 0x410 && cp <= 0x42F)) {
    return cp + 32;
  }
  if (cp >= 0x400 && cp <= 0x40F) {
    return cp + 80;
  }
  return cp;
}

bool is_dropped_symbol(const char32_t cp) {
  return (cp >= 0x80 && cp <= 0xBF) || cp == 0xD7 || cp == 0xF7 ||
         (cp >= 0x300 && cp <= 0x36F) ||   // combining marks
         (cp >= 0x2000 && cp <= 0x2BFF) || // punctuation, arrows, symbols, dingbats
         (cp >= 0x3000 && cp <= 0x303F) || // CJK punctuation
         (cp >= 0xFE00 && cp <= 0xFE0F) || (cp >= 0xFF00 && cp <= 0xFF0F) ||
         (cp >= 0xFF1A && cp <= 0xFF20) || (cp >= 0xFF3B && cp <= 0xFF40) ||
         (cp >= 0xFF5B && cp <= 0xFF65) || cp == 0xFFFD || (cp >= 0x1F000 && cp <= 0x1FAFF);
}

bool is_separator(const char32_t cp) {
  return cp == ' ' || cp == '_' || cp == '\t' || cp == '\n' || cp == '\r' || cp == '-' ||
         cp == 0xA0 || cp == 0x3000;
}

} // namespace

std::string slugify(const std::string &text, const bool keep_slashes) {
  std::u32string folded;
  for (const char32_t cp : common::utf8_decode(text)) {
    if (const char *ascii = fold_latin(cp); ascii != nullptr) {
      for (const char *p = ascii; *p != '\0'; ++p) {
        folded.push_back(static_cast<char32_t>(*p));
      }
      continue;
    }
    folded.push_back(cp == '\\' ? U'/' : cp);
  }

  std::u32string slug;
  char32_t previous = 0;
  for (const char32_t cp : folded) {
    if (is_upper_ascii(cp) && is_lower_ascii(previous)) {
      slug.push_back(U'-');
    }
    previous = cp;

    if (is_separator(cp)) {
      slug.push_back(U'-');
    } else if (cp == '/') {
      slug.push_back(keep_slashes ? U'/' : U'-');
    } else if (cp < 0x80) {
      if (is_lower_ascii(cp) || (cp >= '0' && cp <= '9') || is_upper_ascii(cp)) {
        slug.push_back(lower(cp));
      }
    } else if (!is_dropped_symbol(cp)) {
      slug.push_back(lower(cp));
    }
  }

  // Collapse hyphen runs and trim hyphens from every segment.
  std::string out;
  std::u32string segment;
  auto flush_segment = [&out, &segment]() {
    std::u32string cleaned;
    for (const char32_t cp : segment) {
      if (cp == U'-' && (cleaned.empty() || cleaned.back() == U'-')) {
        continue;
      }
      cleaned.push_back(cp);
    }
    while (!cleaned.empty() && cleaned.back() == U'-') {
      cleaned.pop_back();
    }
    if (!cleaned.empty()) {
      if (!out.empty()) {
        out.push_back('/');
      }
      out += common::utf8_encode(cleaned);
    }
    segment.clear();
  };
  for (const char32_t cp : slug) {
    if (cp == U'/') {
      flush_segment();
    } else {
      segment.push_back(cp);
    }
  }
  flush_segment();
  return out;
}

std::string permalink_for_path(const std::string &relative_path) {
  std::filesystem::path path(relative_path);
  std::string base;
  if (filter::is_markdown(path)) {
    base = (path.parent_path() / path.stem()).generic_string();
  } else {
    std::string extension = path.extension().string();
    if (!extension.empty()) {
      extension[0] = ' ';
    }
    base = (path.parent_path() / (path.stem().string() + extension)).generic_string();
  }
  std::string slug = slugify(base, true);
  return slug.empty() ? kFallbackSlug : slug;
}

std::string sanitize_filename(const std::string &title) {
  std::string out;
  out.reserve(title.size());
  for (const char ch : common::trim(title)) {
    const auto uch = static_cast<unsigned char>(ch);
    if (ch == ':') {
      out.push_back('-');
    } else if (ch == '.') {
      out.push_back('_');
    } else if (uch < 0x20 || std::string("<>\"/\\|?*").find(ch) != std::string::npos) {
      out.push_back('_');
    } else {
      out.push_back(ch);
    }
  }

  // Cut on a code point boundary.
  constexpr std::size_t kMaxLength = 100;
  if (out.size() > kMaxLength) {
    std::size_t cut = kMaxLength;
    while (cut > 0 && (static_cast<unsigned char>(out[cut]) & 0xC0) == 0x80) {
      --cut;
    }
    out.resize(cut);
  }

  out = common::trim(out);
  while (!out.empty() && (out.back() == '_' || out.back() == ' ')) {
    out.pop_back();
  }
  if (out.empty() || out.front() == '-' || out.front() == '#') {
    out = out.empty() ? kFallbackSlug : "_" + out;
  }
  return out;
}

std::string unique_permalink(const std::string &base, const TakenPredicate &taken) {
  if (!taken(base)) {
    return base;
  }
  for (std::size_t suffix = 1;; ++suffix) {
    std::string candidate = base + "-" + std::to_string(suffix);
    if (!taken(candidate)) {
      return candidate;
    }
  }
}

std::string resolve(const std::string &title, const std::optional<std::string> &existing_permalink,
                    const TakenPredicate &taken) {
  if (existing_permalink.has_value()) {
    std::string existing = common::trim(*existing_permalink);
    while (!existing.empty() && existing.front() == '/') {
      existing.erase(existing.begin());
    }
    while (!existing.empty() && existing.back() == '/') {
      existing.pop_back();
    }
    if (!existing.empty()) {
      return unique_permalink(existing, taken);
    }
  }

  std::string base = slugify(title);
  if (base.empty()) {
    base = kFallbackSlug;
  }
  return unique_permalink(base, taken);
}

} // namespace noteweave::permalink
