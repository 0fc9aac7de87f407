#include "noteweave/markdown/frontmatter.hpp"

#include "noteweave/common/fs.hpp"

#include <algorithm>
#include <sstream>

namespace noteweave::markdown {

namespace {

enum class EntryMode { Scalar, Pending, List, Literal, Folded, Nested };

std::string rstrip_cr(std::string line) {
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return line;
}

bool is_fence(const std::string &line) {
  const std::string clean = rstrip_cr(line);
  return clean == "---";
}

bool is_closing_fence(const std::string &line) {
  const std::string clean = common::trim(rstrip_cr(line));
  return clean == "---" || clean == "...";
}

std::string strip_quotes(std::string value) {
  value = common::trim(value);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    bool escaped = false;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      const char ch = value[i];
      if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      if (escaped && ch == 'n') {
        out.push_back('\n');
      } else {
        out.push_back(ch);
      }
      escaped = false;
    }
    return out;
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    std::string inner = value.substr(1, value.size() - 2);
    std::string out;
    for (std::size_t i = 0; i < inner.size(); ++i) {
      out.push_back(inner[i]);
      if (inner[i] == '\'' && i + 1 < inner.size() && inner[i + 1] == '\'') {
        ++i;
      }
    }
    return out;
  }
  return value;
}

std::string strip_inline_comment(const std::string &value) {
  if (value.empty() || value.front() == '"' || value.front() == '\'') {
    return value;
  }
  const auto pos = value.find(" #");
  if (pos == std::string::npos) {
    return value;
  }
  return common::trim(value.substr(0, pos));
}

std::vector<std::string> split_flow_list(const std::string &inner) {
  std::vector<std::string> out;
  std::string current;
  char quote = '\0';
  for (const char ch : inner) {
    if (quote != '\0') {
      current.push_back(ch);
      if (ch == quote) {
        quote = '\0';
      }
      continue;
    }
    if (ch == '"' || ch == '\'') {
      quote = ch;
      current.push_back(ch);
      continue;
    }
    if (ch == ',') {
      if (!common::trim(current).empty()) {
        out.push_back(strip_quotes(current));
      }
      current.clear();
      continue;
    }
    current.push_back(ch);
  }
  if (!common::trim(current).empty()) {
    out.push_back(strip_quotes(current));
  }
  return out;
}

bool needs_quoting(const std::string &value) {
  if (value.empty()) {
    return true;
  }
  if (value != common::trim(value)) {
    return true;
  }
  static const std::string leading_specials = "-?:,[]{}#&*!|>'\"%@`";
  if (leading_specials.find(value.front()) != std::string::npos) {
    return true;
  }
  if (value.find(": ") != std::string::npos || value.find(" #") != std::string::npos ||
      value.back() == ':') {
    return true;
  }
  const std::string lower = common::to_lower(value);
  return lower == "true" || lower == "false" || lower == "null" || lower == "yes" ||
         lower == "no" || lower == "~";
}

std::string quote_scalar(const std::string &value) {
  if (!needs_quoting(value)) {
    return value;
  }
  std::string out = "\"";
  for (const char ch : value) {
    if (ch == '"' || ch == '\\') {
      out.push_back('\\');
    }
    out.push_back(ch);
  }
  out.push_back('"');
  return out;
}

std::string render_entry(const std::string &key, const FrontmatterValue &value) {
  std::ostringstream out;
  if (value.is_list) {
    if (value.list.empty()) {
      out << key << ": []\n";
      return out.str();
    }
    out << key << ":\n";
    for (const auto &item : value.list) {
      out << "  - " << quote_scalar(item) << "\n";
    }
    return out.str();
  }

  if (value.scalar.find('\n') != std::string::npos) {
    out << key << ": |\n";
    std::istringstream lines(value.scalar);
    std::string line;
    while (std::getline(lines, line)) {
      out << "  " << line << "\n";
    }
    return out.str();
  }

  out << key << ": " << quote_scalar(value.scalar) << "\n";
  return out.str();
}

} // namespace

bool Frontmatter::has(const std::string &key) const { return find(key) != nullptr; }

std::optional<std::string> Frontmatter::get_scalar(const std::string &key) const {
  const auto *value = find(key);
  if (value == nullptr || value->is_list) {
    return std::nullopt;
  }
  return value->scalar;
}

std::vector<std::string> Frontmatter::get_list(const std::string &key) const {
  const auto *value = find(key);
  if (value == nullptr) {
    return {};
  }
  if (value->is_list) {
    return value->list;
  }
  std::vector<std::string> out;
  for (const auto &part : common::split(value->scalar, ',')) {
    const std::string item = common::trim(part);
    if (!item.empty()) {
      out.push_back(item);
    }
  }
  return out;
}

std::vector<std::string> Frontmatter::keys() const {
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto &[key, value] : entries_) {
    out.push_back(key);
  }
  return out;
}

void Frontmatter::set_scalar(const std::string &key, std::string value) {
  FrontmatterValue entry;
  entry.scalar = std::move(value);
  set_value(key, std::move(entry));
}

void Frontmatter::set_list(const std::string &key, std::vector<std::string> values) {
  FrontmatterValue entry;
  entry.is_list = true;
  entry.list = std::move(values);
  set_value(key, std::move(entry));
}

void Frontmatter::set_value(const std::string &key, FrontmatterValue value) {
  if (auto *existing = find(key); existing != nullptr) {
    *existing = std::move(value);
    return;
  }
  entries_.emplace_back(key, std::move(value));
}

bool Frontmatter::erase(const std::string &key) {
  const auto before = entries_.size();
  std::erase_if(entries_, [&](const auto &entry) { return entry.first == key; });
  return entries_.size() != before;
}

FrontmatterValue *Frontmatter::find(const std::string &key) {
  for (auto &[entry_key, value] : entries_) {
    if (entry_key == key) {
      return &value;
    }
  }
  return nullptr;
}

const FrontmatterValue *Frontmatter::find(const std::string &key) const {
  for (const auto &[entry_key, value] : entries_) {
    if (entry_key == key) {
      return &value;
    }
  }
  return nullptr;
}

SplitDocument split_frontmatter(const std::string &text) {
  SplitDocument doc;
  doc.body = text;

  auto read_line = [&text](const std::size_t start, std::string &line) {
    const auto end = text.find('\n', start);
    if (end == std::string::npos) {
      line = text.substr(start);
      return text.size();
    }
    line = text.substr(start, end - start);
    return end + 1;
  };

  std::size_t start = 0;
  if (text.rfind("\xEF\xBB\xBF", 0) == 0) {
    start = 3;
  }

  std::string line;
  std::size_t pos = read_line(start, line);
  if (!is_fence(line)) {
    return doc;
  }

  const std::size_t block_start = pos;
  std::size_t line_number = 1;
  while (pos < text.size()) {
    const std::size_t line_start = pos;
    pos = read_line(pos, line);
    ++line_number;
    if (is_closing_fence(line)) {
      doc.frontmatter = text.substr(block_start, line_start - block_start);
      doc.frontmatter_line = 2;
      doc.body = text.substr(pos);
      doc.body_line = line_number + 1;
      return doc;
    }
  }

  doc.warnings.push_back({1, "unterminated frontmatter block; treating file as body"});
  return doc;
}

Frontmatter parse_frontmatter(const std::string &block, const std::size_t first_line,
                              std::vector<ParseWarning> &warnings) {
  Frontmatter frontmatter;
  std::string current_key;
  FrontmatterValue current;
  EntryMode mode = EntryMode::Scalar;
  std::vector<std::string> block_lines;
  bool has_current = false;

  auto finish_entry = [&]() {
    if (!has_current) {
      return;
    }
    if (mode == EntryMode::Literal || mode == EntryMode::Folded) {
      while (!block_lines.empty() && common::trim(block_lines.back()).empty()) {
        block_lines.pop_back();
      }
      std::string joined;
      for (std::size_t i = 0; i < block_lines.size(); ++i) {
        if (i > 0) {
          joined += (mode == EntryMode::Literal) ? "\n" : " ";
        }
        joined += block_lines[i];
      }
      current.scalar = joined;
    }
    if (frontmatter.has(current_key)) {
      warnings.push_back({0, "duplicate frontmatter key: " + current_key});
    }
    frontmatter.set_value(current_key, std::move(current));
    current = FrontmatterValue{};
    block_lines.clear();
    has_current = false;
    mode = EntryMode::Scalar;
  };

  std::istringstream stream(block);
  std::string raw_line;
  std::size_t line_number = first_line - 1;
  while (std::getline(stream, raw_line)) {
    ++line_number;
    const std::string line = rstrip_cr(raw_line);
    const std::string trimmed = common::trim(line);

    if (trimmed.empty()) {
      if (has_current) {
        current.raw += line + "\n";
        if (mode == EntryMode::Literal || mode == EntryMode::Folded) {
          block_lines.emplace_back();
        }
      } else {
        frontmatter.preamble += line + "\n";
      }
      continue;
    }

    const bool indented = line.front() == ' ' || line.front() == '\t';
    const bool list_item = trimmed == "-" || common::starts_with(trimmed, "- ");

    if (indented || (list_item && has_current &&
                     (mode == EntryMode::Pending || mode == EntryMode::List))) {
      if (!has_current) {
        warnings.push_back({line_number, "indented frontmatter line without a key"});
        continue;
      }
      current.raw += line + "\n";
      if (mode == EntryMode::Literal || mode == EntryMode::Folded) {
        block_lines.push_back(trimmed);
      } else if (list_item && (mode == EntryMode::Pending || mode == EntryMode::List)) {
        mode = EntryMode::List;
        current.is_list = true;
        const std::string item = strip_quotes(trimmed.size() > 1 ? trimmed.substr(2) : "");
        if (!item.empty()) {
          current.list.push_back(item);
        }
      } else if (mode == EntryMode::Pending || mode == EntryMode::Nested) {
        mode = EntryMode::Nested;
      } else {
        warnings.push_back({line_number, "unexpected indentation in frontmatter"});
      }
      continue;
    }

    if (trimmed.front() == '#') {
      if (has_current) {
        current.raw += line + "\n";
      } else {
        frontmatter.preamble += line + "\n";
      }
      continue;
    }

    const auto colon = line.find(':');
    if (colon == std::string::npos || common::trim(line.substr(0, colon)).empty()) {
      warnings.push_back({line_number, "malformed frontmatter line: " + trimmed});
      continue;
    }

    finish_entry();
    has_current = true;
    current_key = strip_quotes(line.substr(0, colon));
    current.raw = line + "\n";
    const std::string value = strip_inline_comment(common::trim(line.substr(colon + 1)));

    if (value.empty()) {
      mode = EntryMode::Pending;
    } else if (value == "|" || value == "|-" || value == "|+") {
      mode = EntryMode::Literal;
    } else if (value == ">" || value == ">-" || value == ">+") {
      mode = EntryMode::Folded;
    } else if (value.front() == '[') {
      if (value.back() != ']') {
        warnings.push_back({line_number, "unterminated list for key " + current_key});
        current.scalar = value;
      } else {
        current.is_list = true;
        current.list = split_flow_list(value.substr(1, value.size() - 2));
      }
      mode = EntryMode::Scalar;
    } else {
      current.scalar = strip_quotes(value);
      mode = EntryMode::Scalar;
    }
  }
  finish_entry();

  return frontmatter;
}

std::string render_frontmatter(const Frontmatter &frontmatter) {
  std::string out = frontmatter.preamble;
  for (const auto &[key, value] : frontmatter.entries()) {
    if (!value.raw.empty()) {
      out += value.raw;
      if (out.back() != '\n') {
        out.push_back('\n');
      }
      continue;
    }
    out += render_entry(key, value);
  }
  return out;
}

std::string render_document(const Frontmatter &frontmatter, const std::string &body) {
  if (frontmatter.empty() && frontmatter.preamble.empty()) {
    return body;
  }
  return "---\n" + render_frontmatter(frontmatter) + "---\n" + body;
}

} // namespace noteweave::markdown
