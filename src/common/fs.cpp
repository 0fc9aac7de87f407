#include "noteweave/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>
#include <thread>

namespace noteweave::common {

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::vector<std::string> split(const std::string &value, const char delimiter) {
  std::vector<std::string> parts;
  std::stringstream stream(value);
  std::string part;
  while (std::getline(stream, part, delimiter)) {
    parts.push_back(part);
  }
  return parts;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure("HOME is not set");
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure(ErrorCode::Io,
                                                  "Failed to create directory: " +
                                                      path.string() + ": " + ec.message());
  }
  return Result<std::filesystem::path>::success(path);
}

std::string expand_path(std::string value) {
  if (value.empty()) {
    return value;
  }

  if (value[0] == '~') {
    if (auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }

  std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::smatch match;
  std::string expanded;
  std::string remaining = value;

  while (std::regex_search(remaining, match, env_pattern)) {
    expanded += match.prefix().str();
    const std::string var_name = match[1].str();
    if (const char *var = std::getenv(var_name.c_str()); var != nullptr) {
      expanded += var;
    }
    remaining = match.suffix().str();
  }

  expanded += remaining;
  return expanded;
}

bool is_subpath(const std::filesystem::path &candidate, const std::filesystem::path &parent) {
  const auto c = candidate.lexically_normal();
  const auto p = parent.lexically_normal();
  auto c_it = c.begin();
  auto p_it = p.begin();

  for (; p_it != p.end(); ++p_it, ++c_it) {
    if (p_it->empty()) {
      continue;
    }
    if (c_it == c.end() || *c_it != *p_it) {
      return false;
    }
  }

  return true;
}

std::string relative_key(const std::filesystem::path &path, const std::filesystem::path &root) {
  const auto relative = path.lexically_normal().lexically_relative(root.lexically_normal());
  return relative.generic_string();
}

Result<std::string> read_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    return Result<std::string>::failure(ErrorCode::Io, path.string() + " is a directory");
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return Result<std::string>::failure(ErrorCode::Io, "failed to read " + path.string());
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return Result<std::string>::failure(ErrorCode::Io, "read error on " + path.string());
  }
  return Result<std::string>::success(buffer.str());
}

Result<std::string> read_file_with_retry(const std::filesystem::path &path,
                                         const std::uint32_t retries,
                                         std::chrono::milliseconds backoff) {
  auto attempt = read_file(path);
  for (std::uint32_t i = 0; i < retries && !attempt.ok(); ++i) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
      return Result<std::string>::failure(ErrorCode::NotFound, "file vanished: " + path.string());
    }
    std::this_thread::sleep_for(backoff);
    backoff *= 2;
    attempt = read_file(path);
  }
  return attempt;
}

Status write_file_atomic(const std::filesystem::path &path, const std::string &content) {
  if (!path.parent_path().empty()) {
    auto dir = ensure_dir(path.parent_path());
    if (!dir.ok()) {
      return dir.status();
    }
  }

  const std::filesystem::path tmp_path = path.string() + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      return Status::error(ErrorCode::Io, "unable to open " + tmp_path.string());
    }
    out << content;
    out.close();
    if (!out) {
      return Status::error(ErrorCode::Io, "failed writing " + tmp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    const std::string reason = ec.message();
    std::filesystem::remove(tmp_path, ec);
    return Status::error(ErrorCode::Io, "failed to replace " + path.string() + ": " + reason);
  }
  return Status::success();
}

} // namespace noteweave::common
