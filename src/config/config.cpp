#include "noteweave/config/config.hpp"

#include "noteweave/common/fs.hpp"
#include "noteweave/common/toml.hpp"
#include "noteweave/observability/log_observer.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace noteweave::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".noteweave";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("NOTEWEAVE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

bool parse_bool_env(const char *value, const bool fallback) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
    return true;
  }
  if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
    return false;
  }
  return fallback;
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }

  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

std::string expand_config_path(const std::string &path) { return common::expand_path(path); }

void apply_env_overrides(Config &config) {
  if (const char *store = std::getenv("NOTEWEAVE_STORE_PATH"); store != nullptr && *store) {
    config.store_path = store;
  }

  if (const char *project = std::getenv("NOTEWEAVE_DEFAULT_PROJECT");
      project != nullptr && *project) {
    config.default_project = project;
  }

  if (const char *delay = std::getenv("NOTEWEAVE_SYNC_DELAY_MS"); delay != nullptr && *delay) {
    char *end = nullptr;
    const unsigned long parsed = std::strtoul(delay, &end, 10);
    if (end != delay && *end == '\0') {
      config.sync.debounce_ms = static_cast<std::uint32_t>(parsed);
    }
  }

  if (const char *update = std::getenv("NOTEWEAVE_UPDATE_PERMALINKS_ON_MOVE");
      update != nullptr && *update) {
    config.sync.update_permalinks_on_move =
        parse_bool_env(update, config.sync.update_permalinks_on_move);
  }

  if (const char *backend = std::getenv("NOTEWEAVE_OBSERVABILITY");
      backend != nullptr && *backend) {
    config.observability.backend = backend;
  }
  if (const char *level = std::getenv("NOTEWEAVE_LOG_LEVEL"); level != nullptr && *level) {
    config.observability.log_level = level;
  }
}

common::Result<Config> parse_config(const std::string &toml) {
  const auto parsed = common::parse_toml(toml);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.status());
  }

  const auto &doc = parsed.value();
  Config config;

  config.store_path = expand_config_path(doc.get_string("store_path", config.store_path));
  config.default_project = doc.get_string("default_project", config.default_project);

  for (const auto &key : doc.table_keys("projects")) {
    ProjectConfig project;
    project.name = key;
    project.path = expand_config_path(doc.get_string("projects." + key));
    config.projects.push_back(std::move(project));
  }

  config.sync.watch = doc.get_bool("sync.watch", config.sync.watch);
  config.sync.debounce_ms = doc.get_u32("sync.debounce_ms", config.sync.debounce_ms);
  if (doc.has("sync.sync_delay")) {
    config.sync.debounce_ms = doc.get_u32("sync.sync_delay", config.sync.debounce_ms);
  }
  config.sync.update_permalinks_on_move =
      doc.get_bool("sync.update_permalinks_on_move", config.sync.update_permalinks_on_move);
  config.sync.scan_batch_size = doc.get_u32("sync.scan_batch_size", config.sync.scan_batch_size);
  config.sync.max_scan_duration_ms =
      doc.get_u32("sync.max_scan_duration_ms", config.sync.max_scan_duration_ms);
  config.sync.io_retries = doc.get_u32("sync.io_retries", config.sync.io_retries);
  config.sync.io_backoff_ms = doc.get_u32("sync.io_backoff_ms", config.sync.io_backoff_ms);
  config.sync.queue_capacity = doc.get_u32("sync.queue_capacity", config.sync.queue_capacity);

  // Accepts "log,none" as well as ["log", "none"].
  if (const auto backends = doc.get_string_array("observability.backend"); !backends.empty()) {
    std::string joined;
    for (const auto &backend : backends) {
      joined += joined.empty() ? backend : "," + backend;
    }
    config.observability.backend = joined;
  } else {
    config.observability.backend =
        doc.get_string("observability.backend", config.observability.backend);
  }
  config.observability.log_level =
      doc.get_string("observability.log_level", config.observability.log_level);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    config.store_path = expand_config_path(config.store_path);
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure(common::ErrorCode::Io,
                                          "unable to read config file " + path.string() + ": " +
                                              content.error());
  }

  auto config = parse_config(content.value());
  if (!config.ok()) {
    return config;
  }
  apply_env_overrides(config.value());
  return config;
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }

  std::ostringstream file;
  file << "store_path = " << common::quote_toml_string(config.store_path) << "\n";
  file << "default_project = " << common::quote_toml_string(config.default_project) << "\n";

  file << "\n[projects]\n";
  for (const auto &project : config.projects) {
    file << common::toml_key(project.name) << " = "
         << common::quote_toml_string(project.path) << "\n";
  }

  file << "\n[sync]\n";
  file << "watch = " << bool_to_toml(config.sync.watch) << "\n";
  file << "debounce_ms = " << config.sync.debounce_ms << "\n";
  file << "update_permalinks_on_move = " << bool_to_toml(config.sync.update_permalinks_on_move)
       << "\n";
  file << "scan_batch_size = " << config.sync.scan_batch_size << "\n";
  file << "max_scan_duration_ms = " << config.sync.max_scan_duration_ms << "\n";
  file << "io_retries = " << config.sync.io_retries << "\n";
  file << "io_backoff_ms = " << config.sync.io_backoff_ms << "\n";
  file << "queue_capacity = " << config.sync.queue_capacity << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  file << "log_level = " << common::quote_toml_string(config.observability.log_level) << "\n";

  return common::write_file_atomic(cfg_path_result.value(), file.str());
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (common::trim(config.store_path).empty()) {
    return common::Result<std::vector<std::string>>::failure(
        common::ErrorCode::InvalidArgument, "store_path must not be empty");
  }

  if (config.sync.scan_batch_size == 0) {
    return common::Result<std::vector<std::string>>::failure(
        common::ErrorCode::InvalidArgument, "sync.scan_batch_size must be at least 1");
  }

  if (config.sync.queue_capacity == 0) {
    return common::Result<std::vector<std::string>>::failure(
        common::ErrorCode::InvalidArgument, "sync.queue_capacity must be at least 1");
  }

  std::set<std::string> names;
  for (const auto &project : config.projects) {
    if (common::trim(project.name).empty()) {
      return common::Result<std::vector<std::string>>::failure(
          common::ErrorCode::InvalidArgument, "project name must not be empty");
    }
    if (!names.insert(common::to_lower(project.name)).second) {
      return common::Result<std::vector<std::string>>::failure(
          common::ErrorCode::InvalidArgument, "duplicate project: " + project.name);
    }
    if (common::trim(project.path).empty()) {
      return common::Result<std::vector<std::string>>::failure(
          common::ErrorCode::InvalidArgument, "project " + project.name + " has no path");
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(project.path, ec)) {
      warnings.push_back("project " + project.name + " path does not exist: " + project.path);
    }
  }

  if (!config.projects.empty() && !names.contains(common::to_lower(config.default_project))) {
    warnings.push_back("default_project " + config.default_project +
                       " is not one of the configured projects");
  }

  if (config.sync.debounce_ms > 60000) {
    warnings.push_back("sync.debounce_ms above 60s delays every watch-mode update");
  }

  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  for (const auto &part : common::split(backend, ',')) {
    const std::string p = common::trim(part);
    if (!p.empty() && p != "log" && p != "none" && p != "noop") {
      warnings.push_back("unknown observability backend: " + p);
    }
  }
  if (!observability::parse_log_level(config.observability.log_level).has_value()) {
    warnings.push_back("unknown log_level " + config.observability.log_level + ", using info");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace noteweave::config
