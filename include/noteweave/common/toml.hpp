#pragma once

#include "noteweave/common/result.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace noteweave::common {

struct TomlEntry {
  // Dotted path, e.g. "sync.debounce_ms". Quoted keys are stored unquoted.
  std::string key;
  std::string raw_value;
  std::size_t line = 0;
};

/// Flat, ordered view of the subset of TOML the config file uses: tables,
/// bare or quoted keys, strings, integers, booleans and string arrays.
struct TomlDocument {
  std::vector<TomlEntry> entries;

  [[nodiscard]] const TomlEntry *find(const std::string &key) const;
  [[nodiscard]] bool has(const std::string &key) const { return find(key) != nullptr; }

  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  /// Falls back on garbage, negatives and values above UINT32_MAX.
  [[nodiscard]] std::uint32_t get_u32(const std::string &key, std::uint32_t fallback) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;

  /// Keys of one table in file order, without the table prefix.
  [[nodiscard]] std::vector<std::string> table_keys(const std::string &table) const;
};

/// Fails with ErrorCode::Parse and the offending line on malformed lines,
/// unterminated strings and duplicate keys.
[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);
/// Bare keys are written as is, anything else quoted.
[[nodiscard]] std::string toml_key(const std::string &key);

} // namespace noteweave::common
