// Runtime configuration: YAML file plus FLOWGRID_* environment overrides

#ifndef FLOWGRID_CONFIG_HPP
#define FLOWGRID_CONFIG_HPP

#include <flowgrid/engine.hpp>
#include <flowgrid/scheduler.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <string>
#include <thread>

namespace flowgrid {

struct NodeConfig {
  std::string id = "local";
  std::string role = "core";
};

struct GridConfig {
  std::chrono::milliseconds scheduler_interval{250};
  std::size_t batch_size = 5;
  std::size_t workers = 4;
  std::chrono::milliseconds poll_interval{20};
  std::chrono::milliseconds await_timeout{60000};
  std::string journal_path;  // empty keeps jobs in memory only
};

struct EngineConfig {
  std::size_t workers = std::max(1u, std::thread::hardware_concurrency());
  std::chrono::milliseconds job_poll_interval{10};
  std::chrono::milliseconds job_timeout{60000};
  std::size_t max_call_depth = 8;
};

/**
 * @brief Settings of one flowgrid process
 *
 * YAML layout:
 * @code
 * node:   { id: edge-1, role: edge }
 * grid:   { scheduler_interval_ms: 250, batch_size: 5, workers: 4,
 *           poll_interval_ms: 20, await_timeout_ms: 60000, journal_path: jobs.jsonl }
 * engine: { workers: 8, job_poll_interval_ms: 10, job_timeout_ms: 60000, max_call_depth: 8 }
 * log_level: info
 * @endcode
 */
struct Config {
  NodeConfig node;
  GridConfig grid;
  EngineConfig engine;
  std::string log_level = "info";

  /**
   * @brief Load a YAML file; absent keys keep their defaults
   * @throws ConfigError when the file cannot be read or a value has the wrong type
   */
  static Config load_file(const std::string& path);

  /**
   * @brief Same as load_file for an in-memory document
   */
  static Config from_yaml(const std::string& text);

  /**
   * @brief Override fields from FLOWGRID_* environment variables
   * @details Unparsable numbers are ignored with a warning
   */
  void apply_env();

  WorkerIdentity identity() const;
  SchedulerOptions scheduler_options() const;
  EngineOptions engine_options() const;
};

}  // namespace flowgrid

#endif  // FLOWGRID_CONFIG_HPP
