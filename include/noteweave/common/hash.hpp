#pragma once

#include "noteweave/common/result.hpp"

#include <filesystem>
#include <string>

namespace noteweave::common {

[[nodiscard]] std::string sha256_hex(const std::string &bytes);
[[nodiscard]] Result<std::string> sha256_file(const std::filesystem::path &path);

} // namespace noteweave::common
