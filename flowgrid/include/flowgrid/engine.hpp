// Plan execution engine: runs a PlanGraph as a Taskflow, one task per node

#ifndef FLOWGRID_ENGINE_HPP
#define FLOWGRID_ENGINE_HPP

#include <flowgrid/grid.hpp>
#include <flowgrid/plan.hpp>

#include <nlohmann/json.hpp>
#include <taskflow/taskflow.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <thread>

namespace flowgrid {

class GridScheduler;

enum class ExecutionMode { Sync, Async };

const char* to_string(ExecutionMode mode);

enum class NodeEventKind { Started, Succeeded, Failed, Skipped };

const char* to_string(NodeEventKind kind);

struct NodeEvent {
  NodeEventKind kind = NodeEventKind::Started;
  std::string node_id;
  std::string step_name;
  std::string detail;  // failure message, or the failed dependency for Skipped
  std::size_t depth = 0;  // CALL FLOW nesting level
};

/**
 * @brief Per-node progress callback
 * @details Invoked from executor worker threads; must be thread-safe
 */
using NodeListener = std::function<void(const NodeEvent&)>;

/**
 * @brief Returns the FLOW source referenced by a CALL FLOW path
 */
using FlowLoader = std::function<std::string(const std::string& path)>;

struct EngineOptions {
  std::size_t workers = std::max(1u, std::thread::hardware_concurrency());
  std::string project_scope = "default";
  std::chrono::milliseconds job_poll_interval{10};
  std::chrono::milliseconds job_timeout{60000};
  std::size_t max_call_depth = 8;
  FlowLoader loader;
  NodeListener listener;
};

struct ExecutionResult {
  ExecutionMode mode = ExecutionMode::Sync;
  nlohmann::json outputs = nlohmann::json::object();  // empty for async runs
  std::optional<std::string> job_id;                  // set for async runs
  std::size_t nodes_executed = 0;
  std::chrono::milliseconds elapsed{0};
};

nlohmann::json to_json(const ExecutionResult& result);

class PlanExecutor {
 public:
  /**
   * @brief Create an executor with its own Taskflow worker pool
   * @param grid Grid that job nodes are submitted to
   * @param options Pool size, job scope, job await policy and hooks
   */
  explicit PlanExecutor(JobGrid& grid, EngineOptions options = {});

  PlanExecutor(const PlanExecutor&) = delete;
  PlanExecutor& operator=(const PlanExecutor&) = delete;

  /**
   * @brief Execute a plan
   * @param plan Validated plan graph
   * @param inputs External input values keyed by name
   * @param mode Sync blocks for the outputs; Async submits a flow_run job
   *             and returns its id
   * @param project_scope Scope of the jobs this run submits; empty uses the configured scope
   * @return Named outputs (sync) or the job id (async)
   * @throws ExecutionError naming the first node that failed
   */
  ExecutionResult execute(const PlanGraph& plan, const nlohmann::json& inputs = nlohmann::json::object(),
                          ExecutionMode mode = ExecutionMode::Sync, const std::string& project_scope = {});

  /**
   * @brief Register the `flow_run` custom task that executes async submissions
   */
  void install(GridScheduler& scheduler);

  tf::Executor& executor() { return executor_; }
  const EngineOptions& options() const { return options_; }

 private:
  struct RunContext {
    std::size_t depth = 0;
    std::string project_scope;
  };

  nlohmann::json run_plan(const PlanGraph& plan, const nlohmann::json& inputs, const RunContext& context,
                          std::size_t* executed);
  nlohmann::json run_node(const PlanNode& node, const nlohmann::json& state, const nlohmann::json& inputs,
                          const RunContext& context);
  nlohmann::json run_job(const PlanNode& node, JobSpec spec);
  nlohmann::json call_flow(const std::string& path, const nlohmann::json& payload, const RunContext& context);
  void notify(NodeEventKind kind, const PlanNode& node, const RunContext& context,
              const std::string& detail = {}) const;

  JobGrid& grid_;
  EngineOptions options_;
  tf::Executor executor_;
};

}  // namespace flowgrid

#endif  // FLOWGRID_ENGINE_HPP
