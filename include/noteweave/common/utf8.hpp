#pragma once

#include <string>
#include <vector>

namespace noteweave::common {

[[nodiscard]] bool is_valid_utf8(const std::string &bytes);

/// Decodes UTF-8; invalid sequences become U+FFFD.
[[nodiscard]] std::u32string utf8_decode(const std::string &bytes);
[[nodiscard]] std::string utf8_encode(const std::u32string &codepoints);
void utf8_append(std::string &out, char32_t codepoint);

} // namespace noteweave::common
