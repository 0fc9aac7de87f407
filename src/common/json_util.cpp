#include "noteweave/common/json_util.hpp"

#include "noteweave/common/utf8.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdio>
#include <optional>

namespace noteweave::common {

namespace {

void append_escaped(std::string &out, const std::string &value) {
  out.push_back('"');
  for (const char ch : value) {
    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned char>(ch));
        out += buffer;
      } else {
        out.push_back(ch);
      }
      break;
    }
  }
  out.push_back('"');
}

std::optional<std::uint32_t> read_hex4(const std::string &text, const std::size_t pos) {
  if (pos + 4 > text.size()) {
    return std::nullopt;
  }
  std::uint32_t value = 0;
  const char *first = text.data() + pos;
  const auto [ptr, ec] = std::from_chars(first, first + 4, value, 16);
  if (ec != std::errc() || ptr != first + 4) {
    return std::nullopt;
  }
  return value;
}

class ArrayReader {
public:
  explicit ArrayReader(const std::string &text) : text_(text) {}

  void skip_ws() {
    while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_])) != 0) {
      ++pos_;
    }
  }

  [[nodiscard]] bool at_end() const { return pos_ >= text_.size(); }
  [[nodiscard]] char peek() const { return text_[pos_]; }
  void advance() { ++pos_; }

  // Reads a string literal at the current '"'.
  std::optional<std::string> read_string() {
    std::string out;
    for (++pos_; pos_ < text_.size(); ++pos_) {
      const char ch = text_[pos_];
      if (ch == '"') {
        ++pos_;
        return out;
      }
      if (ch != '\\') {
        out.push_back(ch);
        continue;
      }
      if (++pos_ >= text_.size()) {
        return std::nullopt;
      }
      switch (text_[pos_]) {
      case 'n':
        out.push_back('\n');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'b':
        out.push_back('\b');
        break;
      case 'f':
        out.push_back('\f');
        break;
      case 'u': {
        auto code = read_hex4(text_, pos_ + 1);
        if (!code.has_value()) {
          return std::nullopt;
        }
        pos_ += 4;
        // Surrogate pair.
        if (*code >= 0xD800 && *code <= 0xDBFF && pos_ + 2 < text_.size() &&
            text_[pos_ + 1] == '\\' && text_[pos_ + 2] == 'u') {
          const auto low = read_hex4(text_, pos_ + 3);
          if (low.has_value() && *low >= 0xDC00 && *low <= 0xDFFF) {
            *code = 0x10000 + ((*code - 0xD800) << 10) + (*low - 0xDC00);
            pos_ += 6;
          }
        }
        utf8_append(out, static_cast<char32_t>(*code));
        break;
      }
      default:
        out.push_back(text_[pos_]);
        break;
      }
    }
    return std::nullopt;
  }

  // Skips a non-string scalar up to the next ',' or ']'.
  void skip_scalar() {
    while (pos_ < text_.size() && text_[pos_] != ',' && text_[pos_] != ']') {
      ++pos_;
    }
  }

private:
  const std::string &text_;
  std::size_t pos_ = 0;
};

} // namespace

std::string json_string_array(const std::vector<std::string> &values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out.push_back(',');
    }
    append_escaped(out, values[i]);
  }
  out.push_back(']');
  return out;
}

std::vector<std::string> json_parse_string_array(const std::string &text) {
  std::vector<std::string> values;
  ArrayReader reader(text);
  reader.skip_ws();
  if (reader.at_end() || reader.peek() != '[') {
    return values;
  }
  reader.advance();

  while (true) {
    reader.skip_ws();
    if (reader.at_end() || reader.peek() == ']') {
      break;
    }
    if (reader.peek() == ',') {
      reader.advance();
      continue;
    }
    if (reader.peek() != '"') {
      reader.skip_scalar();
      continue;
    }
    auto value = reader.read_string();
    if (!value.has_value()) {
      break;
    }
    values.push_back(std::move(*value));
  }
  return values;
}

} // namespace noteweave::common
