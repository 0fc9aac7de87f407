#include "noteweave/common/toml.hpp"

#include "noteweave/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <sstream>

namespace noteweave::common {

namespace {

bool is_bare_key_char(const char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_' || ch == '-';
}

// `pos` points at the opening quote and ends one past the closing one.
std::optional<std::string> read_quoted(const std::string &text, std::size_t &pos) {
  const char quote = text[pos];
  std::string out;
  for (std::size_t i = pos + 1; i < text.size(); ++i) {
    const char ch = text[i];
    if (ch == quote) {
      pos = i + 1;
      return out;
    }
    if (quote == '"' && ch == '\\' && i + 1 < text.size()) {
      const char next = text[++i];
      switch (next) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case '"':
      case '\\':
        out.push_back(next);
        break;
      default:
        out.push_back('\\');
        out.push_back(next);
        break;
      }
      continue;
    }
    out.push_back(ch);
  }
  return std::nullopt;
}

// nullopt when a string is left open.
std::optional<std::string> strip_comment(const std::string &line) {
  char quote = '\0';
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (quote != '\0') {
      if (quote == '"' && ch == '\\') {
        ++i;
      } else if (ch == quote) {
        quote = '\0';
      }
      continue;
    }
    if (ch == '"' || ch == '\'') {
      quote = ch;
    } else if (ch == '#') {
      return line.substr(0, i);
    }
  }
  if (quote != '\0') {
    return std::nullopt;
  }
  return line;
}

std::optional<std::string> read_key(const std::string &text, std::size_t &pos) {
  if (pos < text.size() && (text[pos] == '"' || text[pos] == '\'')) {
    return read_quoted(text, pos);
  }
  const std::size_t start = pos;
  while (pos < text.size() && (is_bare_key_char(text[pos]) || text[pos] == '.')) {
    ++pos;
  }
  if (pos == start) {
    return std::nullopt;
  }
  return text.substr(start, pos - start);
}

std::string decode_scalar(const std::string &raw) {
  const std::string value = trim(raw);
  if (!value.empty() && (value.front() == '"' || value.front() == '\'')) {
    std::size_t pos = 0;
    if (auto decoded = read_quoted(value, pos); decoded.has_value()) {
      return *decoded;
    }
  }
  return value;
}

std::vector<std::string> split_array_elements(const std::string &body) {
  std::vector<std::string> elements;
  std::string current;
  char quote = '\0';

  for (std::size_t i = 0; i < body.size(); ++i) {
    const char ch = body[i];
    if (quote != '\0') {
      current.push_back(ch);
      if (quote == '"' && ch == '\\' && i + 1 < body.size()) {
        current.push_back(body[++i]);
      } else if (ch == quote) {
        quote = '\0';
      }
      continue;
    }
    if (ch == '"' || ch == '\'') {
      quote = ch;
      current.push_back(ch);
    } else if (ch == ',') {
      elements.push_back(trim(current));
      current.clear();
    } else {
      current.push_back(ch);
    }
  }
  if (!trim(current).empty()) {
    elements.push_back(trim(current));
  }
  return elements;
}

Result<TomlDocument> parse_error(const std::string &what, const std::size_t line) {
  return Result<TomlDocument>::failure(ErrorCode::Parse,
                                       what + " at line " + std::to_string(line));
}

} // namespace

const TomlEntry *TomlDocument::find(const std::string &key) const {
  const auto it = std::find_if(entries.begin(), entries.end(),
                               [&key](const TomlEntry &entry) { return entry.key == key; });
  return it == entries.end() ? nullptr : &*it;
}

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto *entry = find(key);
  return entry == nullptr ? fallback : decode_scalar(entry->raw_value);
}

bool TomlDocument::get_bool(const std::string &key, const bool fallback) const {
  const auto *entry = find(key);
  if (entry == nullptr) {
    return fallback;
  }
  const std::string value = trim(entry->raw_value);
  if (value == "true") {
    return true;
  }
  if (value == "false") {
    return false;
  }
  return fallback;
}

std::uint32_t TomlDocument::get_u32(const std::string &key, const std::uint32_t fallback) const {
  const auto *entry = find(key);
  if (entry == nullptr) {
    return fallback;
  }

  std::string digits = trim(entry->raw_value);
  digits.erase(std::remove(digits.begin(), digits.end(), '_'), digits.end());
  std::uint64_t parsed = 0;
  const char *first = digits.data();
  const char *last = first + digits.size();
  const auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (digits.empty() || ec != std::errc() || ptr != last ||
      parsed > std::numeric_limits<std::uint32_t>::max()) {
    return fallback;
  }
  return static_cast<std::uint32_t>(parsed);
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto *entry = find(key);
  if (entry == nullptr) {
    return fallback;
  }
  const std::string raw = trim(entry->raw_value);
  if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
    return fallback;
  }

  std::vector<std::string> values;
  for (const auto &element : split_array_elements(raw.substr(1, raw.size() - 2))) {
    if (!element.empty()) {
      values.push_back(decode_scalar(element));
    }
  }
  return values;
}

std::vector<std::string> TomlDocument::table_keys(const std::string &table) const {
  const std::string prefix = table + ".";
  std::vector<std::string> keys;
  for (const auto &entry : entries) {
    if (starts_with(entry.key, prefix)) {
      keys.push_back(entry.key.substr(prefix.size()));
    }
  }
  return keys;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string table;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const auto stripped = strip_comment(line);
    if (!stripped.has_value()) {
      return parse_error("unterminated string", line_number);
    }
    const std::string clean = trim(*stripped);
    if (clean.empty()) {
      continue;
    }

    if (clean.front() == '[') {
      if (clean.back() != ']') {
        return parse_error("invalid table header", line_number);
      }
      table = trim(clean.substr(1, clean.size() - 2));
      const bool valid = !table.empty() && std::all_of(table.begin(), table.end(), [](char ch) {
        return is_bare_key_char(ch) || ch == '.';
      });
      if (!valid) {
        return parse_error("invalid table name", line_number);
      }
      continue;
    }

    std::size_t pos = 0;
    const auto key = read_key(clean, pos);
    if (!key.has_value() || key->empty()) {
      return parse_error("missing key", line_number);
    }
    while (pos < clean.size() && (clean[pos] == ' ' || clean[pos] == '\t')) {
      ++pos;
    }
    if (pos >= clean.size() || clean[pos] != '=') {
      return parse_error("expected '='", line_number);
    }
    const std::string value = trim(clean.substr(pos + 1));
    if (value.empty()) {
      return parse_error("missing value", line_number);
    }

    std::string full_key = table.empty() ? *key : table + "." + *key;
    if (document.has(full_key)) {
      return parse_error("duplicate key '" + full_key + "'", line_number);
    }
    document.entries.push_back(
        TomlEntry{.key = std::move(full_key), .raw_value = value, .line = line_number});
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 2);
  escaped.push_back('"');
  for (const char ch : value) {
    switch (ch) {
    case '"':
    case '\\':
      escaped.push_back('\\');
      escaped.push_back(ch);
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      escaped.push_back(ch);
      break;
    }
  }
  escaped.push_back('"');
  return escaped;
}

std::string toml_key(const std::string &key) {
  const bool bare = !key.empty() && std::all_of(key.begin(), key.end(), is_bare_key_char);
  return bare ? key : quote_toml_string(key);
}

} // namespace noteweave::common
