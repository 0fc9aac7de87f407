#pragma once

#include <string>
#include <vector>

namespace noteweave::common {

// Tag lists are stored in TEXT columns as JSON arrays of strings.

/// Encodes strings as a JSON array like ["a","b"].
[[nodiscard]] std::string json_string_array(const std::vector<std::string> &values);

/// Decodes a JSON array of strings. Non-string elements and anything after a
/// malformed element are dropped; input that is not an array yields {}.
[[nodiscard]] std::vector<std::string> json_parse_string_array(const std::string &text);

} // namespace noteweave::common
