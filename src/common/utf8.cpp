#include "noteweave/common/utf8.hpp"

namespace noteweave::common {

namespace {

constexpr char32_t kReplacement = 0xFFFD;

// Returns the sequence length for a lead byte, or 0 when it cannot start one.
std::size_t sequence_length(const unsigned char lead) {
  if (lead < 0x80) {
    return 1;
  }
  if ((lead & 0xE0) == 0xC0) {
    return lead >= 0xC2 ? 2 : 0;
  }
  if ((lead & 0xF0) == 0xE0) {
    return 3;
  }
  if ((lead & 0xF8) == 0xF0) {
    return lead <= 0xF4 ? 4 : 0;
  }
  return 0;
}

bool decode_at(const std::string &bytes, std::size_t pos, char32_t &out, std::size_t &length) {
  const auto lead = static_cast<unsigned char>(bytes[pos]);
  length = sequence_length(lead);
  if (length == 0 || pos + length > bytes.size()) {
    length = 1;
    return false;
  }
  if (length == 1) {
    out = lead;
    return true;
  }

  char32_t cp = lead & (0xFF >> (length + 1));
  for (std::size_t i = 1; i < length; ++i) {
    const auto next = static_cast<unsigned char>(bytes[pos + i]);
    if ((next & 0xC0) != 0x80) {
      length = i;
      return false;
    }
    cp = (cp << 6) | (next & 0x3F);
  }

  const bool overlong = (length == 3 && cp < 0x800) || (length == 4 && cp < 0x10000);
  const bool surrogate = cp >= 0xD800 && cp <= 0xDFFF;
  if (overlong || surrogate || cp > 0x10FFFF) {
    return false;
  }
  out = cp;
  return true;
}

} // namespace

bool is_valid_utf8(const std::string &bytes) {
  std::size_t pos = 0;
  while (pos < bytes.size()) {
    char32_t cp = 0;
    std::size_t length = 0;
    if (!decode_at(bytes, pos, cp, length)) {
      return false;
    }
    pos += length;
  }
  return true;
}

std::u32string utf8_decode(const std::string &bytes) {
  std::u32string out;
  out.reserve(bytes.size());
  std::size_t pos = 0;
  while (pos < bytes.size()) {
    char32_t cp = 0;
    std::size_t length = 0;
    out.push_back(decode_at(bytes, pos, cp, length) ? cp : kReplacement);
    pos += length;
  }
  return out;
}

void utf8_append(std::string &out, const char32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

std::string utf8_encode(const std::u32string &codepoints) {
  std::string out;
  out.reserve(codepoints.size());
  for (const char32_t cp : codepoints) {
    utf8_append(out, cp);
  }
  return out;
}

} // namespace noteweave::common
