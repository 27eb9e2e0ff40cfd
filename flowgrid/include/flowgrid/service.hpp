// Flow service: compile, plan and execute boundaries with a per-scope plan store

#ifndef FLOWGRID_SERVICE_HPP
#define FLOWGRID_SERVICE_HPP

#include <flowgrid/ast.hpp>
#include <flowgrid/engine.hpp>
#include <flowgrid/grid.hpp>
#include <flowgrid/parser.hpp>
#include <flowgrid/plan.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace flowgrid {

/**
 * @brief A plan kept by the service, owned by one project scope
 */
struct StoredPlan {
  std::string id;
  std::string project_scope;
  WorkflowAst ast;
  PlanGraph graph;
  std::chrono::system_clock::time_point created_at;
};

nlohmann::json to_json(const StoredPlan& plan);

struct OpDescription {
  std::string name;
  std::string version;
  std::string category;
  std::string description;
};

class FlowService {
 public:
  explicit FlowService(JobGrid& grid, EngineOptions options = {});

  /**
   * @brief Compile boundary; never throws for malformed source
   */
  CompileResult compile(const std::string& source, bool strict = false) const;

  /**
   * @brief Strictly compile and plan a source for a scope
   * @details Planning the same source twice in one scope returns the stored plan
   * @throws ParseError, OperationSyntaxError or GraphError
   */
  std::shared_ptr<const StoredPlan> plan(const std::string& project_scope, const std::string& source);

  /**
   * @brief Plan lookup; nullptr when missing or owned by another scope
   */
  std::shared_ptr<const StoredPlan> get_plan(const std::string& plan_id, const std::string& project_scope) const;

  /**
   * @brief Plans of a scope in creation order
   */
  std::vector<std::shared_ptr<const StoredPlan>> list_plans(const std::string& project_scope) const;

  bool delete_plan(const std::string& plan_id, const std::string& project_scope);

  /**
   * @brief Execute a stored plan
   * @throws FlowError when the plan is unknown in the scope
   * @throws ExecutionError when a node fails (sync mode)
   */
  ExecutionResult execute(const std::string& plan_id, const std::string& project_scope,
                          const nlohmann::json& inputs = nlohmann::json::object(),
                          ExecutionMode mode = ExecutionMode::Sync);

  /**
   * @brief Supported operations with category and summary
   */
  static const std::vector<OpDescription>& describe_ops();

  /**
   * @brief Let a scheduler run this service's async executions
   */
  void install(GridScheduler& scheduler) { executor_.install(scheduler); }

  PlanExecutor& executor() { return executor_; }

 private:
  PlanExecutor executor_;

  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<const StoredPlan>> plans_;  // creation order
};

}  // namespace flowgrid

#endif  // FLOWGRID_SERVICE_HPP
