// Implementation file for service.hpp

#include <flowgrid/service.hpp>
#include <flowgrid/errors.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <utility>

namespace flowgrid {

nlohmann::json to_json(const StoredPlan& plan) {
  auto created = std::chrono::duration_cast<std::chrono::milliseconds>(plan.created_at.time_since_epoch());
  nlohmann::json j = to_json(plan.graph);
  j["id"] = plan.id;
  j["projectScope"] = plan.project_scope;
  j["createdAt"] = created.count();
  return j;
}

FlowService::FlowService(JobGrid& grid, EngineOptions options) : executor_(grid, std::move(options)) {}

CompileResult FlowService::compile(const std::string& source, bool strict) const {
  ParseOptions options;
  options.strict = strict;
  return parse_flow(source, options);
}

std::shared_ptr<const StoredPlan> FlowService::plan(const std::string& project_scope, const std::string& source) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& stored : plans_) {
      if (stored->project_scope == project_scope && stored->ast.source == source) {
        return stored;
      }
    }
  }

  auto stored = std::make_shared<StoredPlan>();
  stored->ast = parse_flow_strict(source);
  stored->graph = build_plan(stored->ast);
  stored->id = make_uuid();
  stored->project_scope = project_scope;
  stored->created_at = std::chrono::system_clock::now();

  std::lock_guard<std::mutex> lock(mutex_);
  // Another caller may have planned the same source meanwhile
  for (const auto& existing : plans_) {
    if (existing->project_scope == project_scope && existing->ast.source == source) {
      return existing;
    }
  }
  plans_.push_back(stored);
  spdlog::info("planned flow '{}' as {} for scope {} ({} nodes)", stored->graph.name, stored->id, project_scope,
               stored->graph.nodes.size());
  return stored;
}

std::shared_ptr<const StoredPlan> FlowService::get_plan(const std::string& plan_id,
                                                        const std::string& project_scope) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& stored : plans_) {
    if (stored->id == plan_id) {
      return stored->project_scope == project_scope ? stored : nullptr;
    }
  }
  return nullptr;
}

std::vector<std::shared_ptr<const StoredPlan>> FlowService::list_plans(const std::string& project_scope) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::shared_ptr<const StoredPlan>> out;
  std::copy_if(plans_.begin(), plans_.end(), std::back_inserter(out),
               [&](const auto& stored) { return stored->project_scope == project_scope; });
  return out;
}

bool FlowService::delete_plan(const std::string& plan_id, const std::string& project_scope) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find_if(plans_.begin(), plans_.end(), [&](const auto& stored) {
    return stored->id == plan_id && stored->project_scope == project_scope;
  });
  if (it == plans_.end()) {
    return false;
  }
  plans_.erase(it);
  return true;
}

ExecutionResult FlowService::execute(const std::string& plan_id, const std::string& project_scope,
                                     const nlohmann::json& inputs, ExecutionMode mode) {
  auto stored = get_plan(plan_id, project_scope);
  if (!stored) {
    throw FlowError("flow plan " + plan_id + " not found in scope " + project_scope);
  }
  return executor_.execute(stored->graph, inputs, mode, project_scope);
}

const std::vector<OpDescription>& FlowService::describe_ops() {
  static const std::vector<OpDescription> ops = {
      {"LOAD_TABLE", "1.0", "data", "Bind a named input table."},
      {"LOAD_CSV", "1.0", "data", "Load rows from an input table or CSV text."},
      {"FILTER", "1.0", "data", "Keep rows matching a comparison."},
      {"GROUP_AGG", "1.0", "data", "Group rows by a field and aggregate sums and counts."},
      {"SORT", "1.0", "data", "Stable sort by a field with an optional row limit."},
      {"TAKE", "1.0", "data", "Return the first N rows."},
      {"RUN_AGENT", "1.0", "job", "Run an agent as an inference job on the grid."},
      {"APX_EXEC", "1.0", "job", "Dispatch a command to an APX target through the grid."},
      {"BUILD_VPKG", "1.0", "job", "Build a package artifact from a manifest."},
      {"DEPLOY_SERVICE", "1.0", "job", "Deploy a built package as a named service."},
      {"RUN_VASM", "1.0", "bytecode", "Execute a bytecode program as an artifact job."},
      {"CALL_FLOW", "1.0", "runtime", "Run another flow in-process with the given inputs."},
      {"OUTPUT", "1.0", "io", "Emit a step result under a label."},
      {"OUTPUT_TEXT", "1.0", "io", "Emit a literal with step references resolved."},
  };
  return ops;
}

}  // namespace flowgrid
