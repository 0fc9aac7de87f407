#include "noteweave/markdown/parser.hpp"

#include "noteweave/common/fs.hpp"
#include "noteweave/common/utf8.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>
#include <utility>

namespace noteweave::markdown {

namespace {

bool is_space(const char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; }

bool looks_binary(const std::string &raw) {
  return raw.find('\0') != std::string::npos || !common::is_valid_utf8(raw);
}

std::optional<std::string> heading_text(const std::string &line) {
  const std::string trimmed = common::trim(line);
  std::size_t level = 0;
  while (level < trimmed.size() && trimmed[level] == '#') {
    ++level;
  }
  if (level == 0 || level > 6 || level >= trimmed.size() || !is_space(trimmed[level])) {
    return std::nullopt;
  }
  std::string text = common::trim(trimmed.substr(level));
  while (!text.empty() && text.back() == '#') {
    text.pop_back();
  }
  text = common::trim(text);
  if (text.empty()) {
    return std::nullopt;
  }
  return text;
}

std::optional<std::string> list_item_content(const std::string &line) {
  std::size_t i = 0;
  while (i < line.size() && is_space(line[i])) {
    ++i;
  }
  if (i >= line.size()) {
    return std::nullopt;
  }
  const char marker = line[i];
  if (marker != '-' && marker != '*' && marker != '+') {
    return std::nullopt;
  }
  if (i + 1 < line.size() && !is_space(line[i + 1])) {
    return std::nullopt;
  }
  return common::trim(line.substr(std::min(line.size(), i + 1)));
}

bool is_code_fence(const std::string &line) {
  const std::string trimmed = common::trim(line);
  return common::starts_with(trimmed, "```") || common::starts_with(trimmed, "~~~");
}

// Splits a trailing "(context)" off the text.
std::pair<std::string, std::optional<std::string>> split_context(const std::string &text) {
  const std::string trimmed = common::trim(text);
  if (trimmed.empty() || trimmed.back() != ')') {
    return {trimmed, std::nullopt};
  }

  int depth = 0;
  std::size_t open = std::string::npos;
  for (std::size_t i = trimmed.size(); i-- > 0;) {
    if (trimmed[i] == ')') {
      ++depth;
    } else if (trimmed[i] == '(') {
      --depth;
      if (depth == 0) {
        open = i;
        break;
      }
    }
  }
  if (open == std::string::npos || (open > 0 && !is_space(trimmed[open - 1]))) {
    return {trimmed, std::nullopt};
  }

  const std::string context = common::trim(trimmed.substr(open + 1, trimmed.size() - open - 2));
  if (context.empty()) {
    return {trimmed, std::nullopt};
  }
  return {common::trim(trimmed.substr(0, open)), context};
}

std::string strip_tag_punctuation(std::string tag) {
  while (!tag.empty() && std::string(".,;:!?)]\"'").find(tag.back()) != std::string::npos) {
    tag.pop_back();
  }
  return tag;
}

std::vector<std::string> extract_hashtags(const std::string &content) {
  std::vector<std::string> tags;
  std::size_t i = 0;
  while (i < content.size()) {
    if (content[i] != '#' || (i > 0 && !is_space(content[i - 1]))) {
      ++i;
      continue;
    }
    std::size_t end = i;
    while (end < content.size() && !is_space(content[end])) {
      ++end;
    }
    for (const auto &part : common::split(content.substr(i, end - i), '#')) {
      const std::string tag = strip_tag_punctuation(part);
      if (!tag.empty() && std::find(tags.begin(), tags.end(), tag) == tags.end()) {
        tags.push_back(tag);
      }
    }
    i = end;
  }
  return tags;
}

class DraftBuilder {
public:
  explicit DraftBuilder(ParsedDraft &draft) : draft_(draft) {}

  void add_relation(std::string type, const std::string &raw_target,
                    std::optional<std::string> context, const std::size_t line) {
    std::string target = normalize_link_target(raw_target);
    if (target.empty()) {
      draft_.warnings.push_back({line, "empty link target"});
      return;
    }
    if (type.empty()) {
      type = kDefaultRelationType;
    }
    if (!seen_.insert(type + "\x1f" + common::to_lower(target)).second) {
      return;
    }
    draft_.relations.push_back(ParsedRelation{
        .relation_type = std::move(type), .target = std::move(target), .context = std::move(context)});
  }

  // Every [[...]] in running text becomes a links_to edge.
  void add_inline_links(const std::string &text, const std::size_t line, std::size_t from = 0) {
    while (true) {
      const auto open = text.find("[[", from);
      if (open == std::string::npos) {
        return;
      }
      const auto close = text.find("]]", open + 2);
      if (close == std::string::npos) {
        draft_.warnings.push_back({line, "unterminated wiki link"});
        return;
      }
      add_relation(kInlineLinkRelationType, text.substr(open + 2, close - open - 2), std::nullopt,
                   line);
      from = close + 2;
    }
  }

  void add_observation(const std::string &category, const std::string &rest,
                       const std::size_t line) {
    auto [content, context] = split_context(rest);
    if (content.empty()) {
      draft_.warnings.push_back({line, "observation without content"});
      return;
    }
    ParsedObservation observation;
    observation.category = category.empty() ? kDefaultCategory : category;
    observation.tags = extract_hashtags(content);
    observation.context = std::move(context);
    observation.content = std::move(content);
    add_inline_links(observation.content, line);
    draft_.observations.push_back(std::move(observation));
  }

  void handle_list_item(const std::string &item, const std::size_t line) {
    if (common::starts_with(item, "[[")) {
      handle_relation(item, line);
      return;
    }

    if (!item.empty() && item.front() == '[') {
      const auto close = item.find(']');
      if (close == std::string::npos) {
        draft_.warnings.push_back({line, "unterminated observation category"});
        return;
      }
      const std::string inner = item.substr(1, close - 1);
      if (inner.size() == 1 && std::string(" xX-").find(inner.front()) != std::string::npos) {
        add_inline_links(item, line);
        return;
      }
      add_observation(common::trim(inner), item.substr(close + 1), line);
      return;
    }

    if (item.find("[[") != std::string::npos) {
      handle_relation(item, line);
      return;
    }

    if (!extract_hashtags(item).empty()) {
      add_observation(kDefaultCategory, item, line);
    }
  }

  void handle_relation(const std::string &item, const std::size_t line) {
    const auto open = item.find("[[");
    const auto close = item.find("]]", open + 2);
    if (close == std::string::npos) {
      draft_.warnings.push_back({line, "unterminated relation link"});
      return;
    }
    const std::string type = common::trim(item.substr(0, open));
    const std::string target = item.substr(open + 2, close - open - 2);
    const std::string after = common::trim(item.substr(close + 2));

    std::optional<std::string> context;
    if (after.size() >= 2 && after.front() == '(' && after.back() == ')') {
      context = common::trim(after.substr(1, after.size() - 2));
      if (context->empty()) {
        context.reset();
      }
    }
    const bool has_context = context.has_value();
    add_relation(type, target, std::move(context), line);
    if (!has_context) {
      add_inline_links(item, line, close + 2);
    }
  }

private:
  ParsedDraft &draft_;
  std::set<std::string> seen_;
};

} // namespace

std::string normalize_link_target(const std::string &target) {
  std::string value = common::trim(target);
  if (common::starts_with(value, "[[") && value.size() >= 4 && value.ends_with("]]")) {
    value = value.substr(2, value.size() - 4);
  }
  if (const auto bar = value.find('|'); bar != std::string::npos) {
    value = value.substr(0, bar);
  }
  return common::trim(value);
}

std::vector<std::string> normalize_tags(const std::vector<std::string> &raw) {
  std::vector<std::string> tags;
  auto add = [&tags](std::string tag) {
    tag = common::trim(tag);
    while (!tag.empty() && tag.front() == '#') {
      tag.erase(tag.begin());
    }
    tag = common::trim(tag);
    if (!tag.empty() && std::find(tags.begin(), tags.end(), tag) == tags.end()) {
      tags.push_back(std::move(tag));
    }
  };

  for (const auto &item : raw) {
    const std::string trimmed = common::trim(item);
    if (common::starts_with(trimmed, "#") && trimmed.find(' ') != std::string::npos) {
      std::istringstream words(trimmed);
      std::string word;
      while (words >> word) {
        add(word);
      }
      continue;
    }
    add(trimmed);
  }
  return tags;
}

common::Result<ParsedDraft> parse(const std::string &raw, const std::string &filename_stem) {
  if (looks_binary(raw)) {
    return common::Result<ParsedDraft>::failure(common::ErrorCode::Parse,
                                                "content is not UTF-8 text");
  }

  ParsedDraft draft;
  auto split = split_frontmatter(raw);
  draft.warnings = std::move(split.warnings);
  if (split.frontmatter.has_value()) {
    draft.has_frontmatter = true;
    draft.frontmatter = parse_frontmatter(*split.frontmatter, split.frontmatter_line, draft.warnings);
  }
  draft.body = std::move(split.body);

  if (auto type = draft.frontmatter.get_scalar("type"); type.has_value() && !common::trim(*type).empty()) {
    draft.entity_type = common::trim(*type);
  }
  if (auto permalink = draft.frontmatter.get_scalar("permalink");
      permalink.has_value() && !common::trim(*permalink).empty()) {
    draft.permalink = common::trim(*permalink);
  }
  draft.tags = normalize_tags(draft.frontmatter.get_list("tags"));

  std::optional<std::string> first_heading;
  DraftBuilder builder(draft);
  bool in_code = false;
  std::istringstream lines(draft.body);
  std::string line;
  std::size_t line_number = split.body_line - 1;
  while (std::getline(lines, line)) {
    ++line_number;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (is_code_fence(line)) {
      in_code = !in_code;
      continue;
    }
    if (in_code) {
      continue;
    }

    if (!first_heading.has_value()) {
      first_heading = heading_text(line);
    }

    if (const auto item = list_item_content(line); item.has_value()) {
      builder.handle_list_item(*item, line_number);
      continue;
    }
    builder.add_inline_links(line, line_number);
  }
  if (in_code) {
    draft.warnings.push_back({line_number, "unterminated code fence"});
  }

  if (auto title = draft.frontmatter.get_scalar("title"); title.has_value() && !common::trim(*title).empty()) {
    draft.title = common::trim(*title);
  } else if (first_heading.has_value()) {
    draft.title = *first_heading;
  } else if (!common::trim(filename_stem).empty()) {
    draft.title = common::trim(filename_stem);
  } else {
    draft.title = "untitled";
  }

  return common::Result<ParsedDraft>::success(std::move(draft));
}

} // namespace noteweave::markdown
