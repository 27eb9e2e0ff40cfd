// Implementation file for engine.hpp

#include <flowgrid/engine.hpp>
#include <flowgrid/errors.hpp>
#include <flowgrid/parser.hpp>
#include <flowgrid/scheduler.hpp>
#include <flowgrid/table.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace flowgrid {

const char* to_string(ExecutionMode mode) {
  return mode == ExecutionMode::Async ? "async" : "sync";
}

const char* to_string(NodeEventKind kind) {
  switch (kind) {
    case NodeEventKind::Started: return "started";
    case NodeEventKind::Succeeded: return "succeeded";
    case NodeEventKind::Failed: return "failed";
    case NodeEventKind::Skipped: return "skipped";
  }
  return "started";
}

nlohmann::json to_json(const ExecutionResult& result) {
  nlohmann::json j = {
      {"mode", to_string(result.mode)},
      {"outputs", result.outputs},
      {"nodesExecuted", result.nodes_executed},
      {"elapsedMs", result.elapsed.count()},
  };
  if (result.job_id) {
    j["jobId"] = *result.job_id;
  }
  return j;
}

PlanExecutor::PlanExecutor(JobGrid& grid, EngineOptions options)
    : grid_(grid), options_(std::move(options)), executor_(options_.workers == 0 ? 1 : options_.workers) {}

ExecutionResult PlanExecutor::execute(const PlanGraph& plan, const nlohmann::json& inputs, ExecutionMode mode,
                                      const std::string& project_scope) {
  using steady = std::chrono::steady_clock;
  const auto start = steady::now();
  const auto bound = inputs.is_null() ? nlohmann::json::object() : inputs;
  const auto& scope = project_scope.empty() ? options_.project_scope : project_scope;

  ExecutionResult result;
  result.mode = mode;
  if (mode == ExecutionMode::Async) {
    if (plan.source.empty()) {
      throw FlowError("async execution of flow '" + plan.name + "' requires its source text");
    }
    JobSpec spec;
    spec.project_scope = scope;
    spec.type = JobType::Custom;
    spec.params = {{"task", "flow_run"}, {"flow", plan.name}, {"source", plan.source}, {"inputs", bound}};
    result.job_id = grid_.submit(std::move(spec));
    spdlog::info("flow '{}' submitted as job {}", plan.name, *result.job_id);
  } else {
    RunContext context{0, scope};
    result.outputs = run_plan(plan, bound, context, &result.nodes_executed);
  }
  result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(steady::now() - start);
  return result;
}

void PlanExecutor::install(GridScheduler& scheduler) {
  scheduler.register_task("flow_run", [this](const JobContext& ctx) {
    const auto& params = ctx.job.params;
    if (!params.contains("source") || !params["source"].is_string()) {
      throw FlowError("flow_run requires the flow source");
    }
    auto plan = build_plan(parse_flow_strict(params["source"].get<std::string>()));
    RunContext context{0, ctx.job.project_scope};
    std::size_t executed = 0;
    auto outputs = run_plan(plan, params.value("inputs", nlohmann::json::object()), context, &executed);
    return nlohmann::json{{"flow", plan.name}, {"outputs", std::move(outputs)}, {"nodesExecuted", executed}};
  });
}

// ============================================================================
// Graph execution
// ============================================================================

namespace {

// Output slot of one node. Dependents block on `future`; a node that failed
// or was skipped publishes null and raises `failed`.
struct NodeSlot {
  std::promise<nlohmann::json> promise;
  std::shared_future<nlohmann::json> future;
  std::atomic<bool> failed{false};
};

}  // namespace

nlohmann::json PlanExecutor::run_plan(const PlanGraph& plan, const nlohmann::json& inputs,
                                      const RunContext& context, std::size_t* executed) {
  spdlog::debug("executing flow '{}' ({} nodes, depth {})", plan.name, plan.nodes.size(), context.depth);

  tf::Taskflow taskflow(plan.name.empty() ? "flow" : plan.name);
  std::unordered_map<std::string, std::unique_ptr<NodeSlot>> slots;
  for (const auto& node : plan.nodes) {
    auto slot = std::make_unique<NodeSlot>();
    slot->future = slot->promise.get_future().share();
    slots.emplace(node.id, std::move(slot));
  }

  std::mutex failure_mutex;
  std::optional<ExecutionError> first_failure;
  std::atomic<std::size_t> completed{0};

  std::unordered_map<std::string, tf::Task> tasks;
  for (const auto& node : plan.nodes) {
    NodeSlot* self = slots.at(node.id).get();
    std::vector<std::pair<std::string, NodeSlot*>> upstream;
    for (const auto& input_id : node.inputs) {
      const PlanNode* source = plan.find(input_id);
      if (source == nullptr) {
        throw GraphError("node " + node.id + " reads unknown node " + input_id, {node.id, input_id});
      }
      upstream.emplace_back(source->meta.step_name, slots.at(input_id).get());
    }

    auto task = taskflow.emplace([this, &node, self, upstream, &inputs, &context, &failure_mutex,
                                  &first_failure, &completed]() {
      nlohmann::json state = nlohmann::json::object();
      for (const auto& [name, slot] : upstream) {
        const auto& value = slot->future.get();
        if (slot->failed.load()) {
          self->failed.store(true);
          self->promise.set_value(nullptr);
          notify(NodeEventKind::Skipped, node, context, "dependency " + name + " failed");
          return;
        }
        state[name] = value;
      }

      notify(NodeEventKind::Started, node, context);
      nlohmann::json output;
      try {
        output = run_node(node, state, inputs, context);
      } catch (const std::exception& e) {
        spdlog::warn("node {} ({}) failed: {}", node.id, node.meta.op, e.what());
        self->failed.store(true);
        {
          std::lock_guard<std::mutex> lock(failure_mutex);
          if (!first_failure) {
            first_failure.emplace(node.id, node.meta.step_name, e.what());
          }
        }
        self->promise.set_value(nullptr);
        notify(NodeEventKind::Failed, node, context, e.what());
        return;
      }
      ++completed;
      self->promise.set_value(std::move(output));
      notify(NodeEventKind::Succeeded, node, context);
    });
    task.name(node.id);
    tasks.emplace(node.id, task);
  }

  for (const auto& edge : plan.edges) {
    tasks.at(edge.from).precede(tasks.at(edge.to));
  }

  if (executor_.this_worker_id() >= 0) {
    // Nested run (CALL FLOW): keep this worker executing tasks until the subgraph is done
    executor_.corun(taskflow);
  } else {
    executor_.run(taskflow).wait();
  }

  if (executed != nullptr) {
    *executed += completed.load();
  }
  if (first_failure) {
    throw *first_failure;
  }

  nlohmann::json outputs = nlohmann::json::object();
  bool labelled = false;
  for (const auto& node : plan.nodes) {
    if (const auto* out = std::get_if<OutputOp>(&node.op)) {
      outputs[out->label] = slots.at(node.id)->future.get();
      labelled = true;
    }
  }
  if (!labelled && !plan.nodes.empty()) {
    const auto& last = plan.nodes.back();
    outputs[last.meta.step_name] = slots.at(last.id)->future.get();
  }
  return outputs;
}

// ============================================================================
// Node bodies
// ============================================================================

nlohmann::json PlanExecutor::run_node(const PlanNode& node, const nlohmann::json& state,
                                      const nlohmann::json& inputs, const RunContext& context) {
  return std::visit(
      [&](const auto& op) -> nlohmann::json {
        using T = std::decay_t<decltype(op)>;

        if constexpr (std::is_same_v<T, LoadTableOp>) {
          return resolve_dataset(op.table, state, inputs);
        } else if constexpr (std::is_same_v<T, LoadCsvOp>) {
          return resolve_dataset(op.source, state, inputs);
        } else if constexpr (std::is_same_v<T, FilterOp>) {
          return table::filter(resolve_dataset(op.source, state, inputs), op.condition);
        } else if constexpr (std::is_same_v<T, GroupAggregateOp>) {
          return table::group_aggregate(resolve_dataset(op.source, state, inputs), op.group_by, op.aggregations);
        } else if constexpr (std::is_same_v<T, SortOp>) {
          return table::sort(resolve_dataset(op.source, state, inputs), op.field, op.direction, op.limit);
        } else if constexpr (std::is_same_v<T, TakeOp>) {
          return table::take(resolve_dataset(op.source, state, inputs), op.count);
        } else if constexpr (std::is_same_v<T, OutputOp>) {
          auto value = resolve_reference(op.source, state, inputs);
          if (!value) {
            throw FlowError("output source '" + op.source + "' is not available");
          }
          return *value;
        } else if constexpr (std::is_same_v<T, OutputTextOp>) {
          return resolve_literal(op.value, state, inputs);
        } else if constexpr (std::is_same_v<T, CallFlowOp>) {
          return call_flow(op.path, resolve_literal(op.payload, state, inputs), context);
        } else {
          JobSpec spec;
          spec.project_scope = context.project_scope;
          spec.input_refs = {{"node", node.id}, {"dependencies", node.inputs}};

          if constexpr (std::is_same_v<T, RunAgentOp>) {
            auto payload = resolve_literal(op.payload, state, inputs);
            spec.type = JobType::Inference;
            spec.params = {{"agent", op.agent}, {"payload", payload}};
            if (payload.is_object()) {
              if (payload.contains("prompt")) spec.params["prompt"] = payload["prompt"];
              if (payload.contains("maxTokens")) spec.params["maxTokens"] = payload["maxTokens"];
            }
          } else if constexpr (std::is_same_v<T, ApxExecOp>) {
            spec.type = JobType::Custom;
            spec.params = {{"task", "apx_exec"},
                           {"target", op.target},
                           {"payload", resolve_literal(op.payload, state, inputs)}};
          } else if constexpr (std::is_same_v<T, BuildVpkgOp>) {
            spec.type = JobType::BuildArtifact;
            spec.params = {{"manifestRef", op.manifest_ref}};
            if (auto manifest = resolve_reference(op.manifest_ref, state, inputs)) {
              spec.params["manifest"] = *manifest;
            }
          } else if constexpr (std::is_same_v<T, DeployServiceOp>) {
            spec.type = JobType::Custom;
            auto vpkg = resolve_reference(op.vpkg_ref, state, inputs);
            spec.params = {{"task", "deploy_service"},
                           {"service", op.service_name},
                           {"vpkg", vpkg ? *vpkg : nlohmann::json(op.vpkg_ref)}};
          } else {
            static_assert(std::is_same_v<T, RunVasmOp>, "unhandled operation");
            spec.type = JobType::ExecArtifact;
            spec.params = {{"program", op.program}, {"payload", resolve_literal(op.payload, state, inputs)}};
          }
          return run_job(node, std::move(spec));
        }
      },
      node.op);
}

nlohmann::json PlanExecutor::run_job(const PlanNode& node, JobSpec spec) {
  const auto type = spec.type;
  auto job_id = grid_.submit(std::move(spec));
  spdlog::debug("node {} dispatched {} job {}", node.id, to_string(type), job_id);

  AwaitOptions await;
  await.interval = options_.job_poll_interval;
  await.timeout = options_.job_timeout;
  auto job = grid_.await(job_id, await, &executor_);
  if (job.status != JobStatus::Succeeded) {
    throw JobFailedError(job_id, to_string(job.status), job.error);
  }
  return job.result;
}

nlohmann::json PlanExecutor::call_flow(const std::string& path, const nlohmann::json& payload,
                                       const RunContext& context) {
  if (!options_.loader) {
    throw FlowError("CALL FLOW '" + path + "' requires a flow loader");
  }
  if (context.depth + 1 > options_.max_call_depth) {
    throw FlowError("CALL FLOW '" + path + "' exceeds the maximum call depth of " +
                    std::to_string(options_.max_call_depth));
  }
  auto plan = build_plan(parse_flow_strict(options_.loader(path)));
  RunContext nested{context.depth + 1, context.project_scope};
  std::size_t executed = 0;
  return run_plan(plan, payload.is_object() ? payload : nlohmann::json::object(), nested, &executed);
}

void PlanExecutor::notify(NodeEventKind kind, const PlanNode& node, const RunContext& context,
                          const std::string& detail) const {
  if (!options_.listener) {
    return;
  }
  NodeEvent event;
  event.kind = kind;
  event.node_id = node.id;
  event.step_name = node.meta.step_name;
  event.detail = detail;
  event.depth = context.depth;
  options_.listener(event);
}

}  // namespace flowgrid
