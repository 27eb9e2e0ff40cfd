// Implementation file for config.hpp

#include <flowgrid/config.hpp>
#include <flowgrid/errors.hpp>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <string_view>
#include <system_error>

namespace flowgrid {

namespace {

std::int64_t read_int(const YAML::Node& section, const char* key, std::int64_t fallback, const char* where) {
  const auto node = section[key];
  if (!node) {
    return fallback;
  }
  std::int64_t value = 0;
  try {
    value = node.as<std::int64_t>();
  } catch (const YAML::Exception& e) {
    throw ConfigError(std::string("config ") + where + "." + key + ": expected an integer (" + e.what() + ")");
  }
  if (value < 0) {
    throw ConfigError(std::string("config ") + where + "." + key + ": must not be negative");
  }
  return value;
}

std::string read_string(const YAML::Node& section, const char* key, const std::string& fallback,
                        const char* where) {
  const auto node = section[key];
  if (!node) {
    return fallback;
  }
  try {
    return node.as<std::string>();
  } catch (const YAML::Exception& e) {
    throw ConfigError(std::string("config ") + where + "." + key + ": expected a string (" + e.what() + ")");
  }
}

Config from_node(const YAML::Node& root) {
  Config config;
  if (!root || root.IsNull()) {
    return config;
  }
  if (!root.IsMap()) {
    throw ConfigError("config root must be a mapping");
  }

  if (const auto node = root["node"]) {
    config.node.id = read_string(node, "id", config.node.id, "node");
    config.node.role = read_string(node, "role", config.node.role, "node");
  }

  if (const auto grid = root["grid"]) {
    auto& g = config.grid;
    g.scheduler_interval = std::chrono::milliseconds(
        read_int(grid, "scheduler_interval_ms", g.scheduler_interval.count(), "grid"));
    g.batch_size = static_cast<std::size_t>(read_int(grid, "batch_size", g.batch_size, "grid"));
    g.workers = static_cast<std::size_t>(read_int(grid, "workers", g.workers, "grid"));
    g.poll_interval = std::chrono::milliseconds(read_int(grid, "poll_interval_ms", g.poll_interval.count(), "grid"));
    g.await_timeout = std::chrono::milliseconds(read_int(grid, "await_timeout_ms", g.await_timeout.count(), "grid"));
    g.journal_path = read_string(grid, "journal_path", g.journal_path, "grid");
  }

  if (const auto engine = root["engine"]) {
    auto& e = config.engine;
    e.workers = static_cast<std::size_t>(read_int(engine, "workers", e.workers, "engine"));
    e.job_poll_interval = std::chrono::milliseconds(
        read_int(engine, "job_poll_interval_ms", e.job_poll_interval.count(), "engine"));
    e.job_timeout = std::chrono::milliseconds(read_int(engine, "job_timeout_ms", e.job_timeout.count(), "engine"));
    e.max_call_depth = static_cast<std::size_t>(read_int(engine, "max_call_depth", e.max_call_depth, "engine"));
  }

  config.log_level = read_string(root, "log_level", config.log_level, "root");
  return config;
}

const char* env_value(const char* name) {
  const char* v = std::getenv(name);
  return (v != nullptr && *v != '\0') ? v : nullptr;
}

template <typename Apply>
void env_count(const char* name, Apply apply) {
  const char* v = env_value(name);
  if (v == nullptr) {
    return;
  }
  std::string_view text(v);
  std::uint64_t value = 0;
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || end != text.data() + text.size()) {
    spdlog::warn("ignoring {}='{}': not a non-negative integer", name, text);
    return;
  }
  apply(value);
}

}  // namespace

Config Config::load_file(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw ConfigError("failed to load config '" + path + "': " + e.what());
  }
  return from_node(root);
}

Config Config::from_yaml(const std::string& text) {
  YAML::Node root;
  try {
    root = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw ConfigError(std::string("failed to parse config: ") + e.what());
  }
  return from_node(root);
}

void Config::apply_env() {
  if (const char* v = env_value("FLOWGRID_NODE_ID")) node.id = v;
  if (const char* v = env_value("FLOWGRID_NODE_ROLE")) node.role = v;
  if (const char* v = env_value("FLOWGRID_JOURNAL")) grid.journal_path = v;
  if (const char* v = env_value("FLOWGRID_LOG_LEVEL")) log_level = v;

  env_count("FLOWGRID_SCHEDULER_INTERVAL_MS",
            [&](std::uint64_t v) { grid.scheduler_interval = std::chrono::milliseconds(v); });
  env_count("FLOWGRID_BATCH_SIZE", [&](std::uint64_t v) { grid.batch_size = v; });
  env_count("FLOWGRID_GRID_WORKERS", [&](std::uint64_t v) { grid.workers = v; });
  env_count("FLOWGRID_ENGINE_WORKERS", [&](std::uint64_t v) { engine.workers = v; });
}

WorkerIdentity Config::identity() const {
  WorkerIdentity identity;
  identity.worker_id = node.id;
  identity.role = node.role;
  return identity;
}

SchedulerOptions Config::scheduler_options() const {
  SchedulerOptions options;
  options.interval = grid.scheduler_interval;
  options.batch_size = grid.batch_size;
  options.workers = grid.workers;
  options.await.interval = grid.poll_interval;
  options.await.timeout = grid.await_timeout;
  return options;
}

EngineOptions Config::engine_options() const {
  EngineOptions options;
  options.workers = engine.workers;
  options.job_poll_interval = engine.job_poll_interval;
  options.job_timeout = engine.job_timeout;
  options.max_call_depth = engine.max_call_depth;
  return options;
}

}  // namespace flowgrid
