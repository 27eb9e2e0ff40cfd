// Implementation file for plan.hpp

#include <flowgrid/plan.hpp>
#include <flowgrid/errors.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>
#include <unordered_map>
#include <utility>

namespace flowgrid {

const char* to_string(NodeKind kind) {
  switch (kind) {
    case NodeKind::DataOp: return "DataOp";
    case NodeKind::BytecodeOp: return "BytecodeOp";
    case NodeKind::JobOp: return "JobOp";
  }
  return "DataOp";
}

std::string node_id_for(const std::string& step_name) {
  return "step:" + step_name;
}

namespace {

NodeKind kind_of(const Operation& op) {
  if (std::holds_alternative<RunVasmOp>(op)) {
    return NodeKind::BytecodeOp;
  }
  if (std::holds_alternative<RunAgentOp>(op) || std::holds_alternative<ApxExecOp>(op) ||
      std::holds_alternative<BuildVpkgOp>(op) || std::holds_alternative<DeployServiceOp>(op)) {
    return NodeKind::JobOp;
  }
  return NodeKind::DataOp;
}

// Three-colour DFS; returns the cycle as node names, empty when acyclic
std::vector<std::string> find_cycle(const PlanGraph& graph,
                                    const std::unordered_map<std::string, std::size_t>& index) {
  enum class Color { White, Gray, Black };
  std::vector<Color> color(graph.nodes.size(), Color::White);
  std::vector<std::size_t> stack;
  std::vector<std::string> cycle;

  std::function<bool(std::size_t)> visit = [&](std::size_t u) {
    color[u] = Color::Gray;
    stack.push_back(u);
    for (const auto& next_id : graph.nodes[u].outputs) {
      std::size_t v = index.at(next_id);
      if (color[v] == Color::Gray) {
        auto it = std::find(stack.begin(), stack.end(), v);
        for (; it != stack.end(); ++it) {
          cycle.push_back(graph.nodes[*it].meta.step_name);
        }
        cycle.push_back(graph.nodes[v].meta.step_name);
        return true;
      }
      if (color[v] == Color::White && visit(v)) {
        return true;
      }
    }
    stack.pop_back();
    color[u] = Color::Black;
    return false;
  };

  for (std::size_t i = 0; i < graph.nodes.size(); ++i) {
    if (color[i] == Color::White && visit(i)) {
      break;
    }
  }
  return cycle;
}

}  // namespace

// ============================================================================
// PlanGraph
// ============================================================================

const PlanNode* PlanGraph::find(const std::string& id) const {
  for (const auto& node : nodes) {
    if (node.id == id) return &node;
  }
  return nullptr;
}

const PlanNode* PlanGraph::node_for_step(const std::string& step_name) const {
  return find(node_id_for(step_name));
}

std::vector<std::string> PlanGraph::topological_order() const {
  std::unordered_map<std::string, std::size_t> indegree;
  for (const auto& node : nodes) {
    indegree[node.id] = node.inputs.size();
  }
  std::vector<std::string> order;
  std::vector<bool> emitted(nodes.size(), false);
  while (order.size() < nodes.size()) {
    bool progressed = false;
    for (std::size_t i = 0; i < nodes.size(); ++i) {
      if (emitted[i] || indegree[nodes[i].id] != 0) continue;
      emitted[i] = true;
      progressed = true;
      order.push_back(nodes[i].id);
      for (const auto& next : nodes[i].outputs) {
        --indegree[next];
      }
      break;
    }
    if (!progressed) {
      throw GraphError("plan graph '" + name + "' contains a cycle", {});
    }
  }
  return order;
}

void PlanGraph::dump(std::ostream& os) const {
  os << "digraph \"" << name << "\" {\n";
  for (const auto& node : nodes) {
    os << "  \"" << node.id << "\" [label=\"" << node.meta.step_name << "\\n" << node.meta.op
       << "\" shape=" << (node.kind == NodeKind::DataOp ? "box" : "ellipse") << "];\n";
  }
  for (const auto& edge : edges) {
    os << "  \"" << edge.from << "\" -> \"" << edge.to << "\" [label=\"" << edge.via << "\"];\n";
  }
  os << "}\n";
}

// ============================================================================
// build_plan
// ============================================================================

PlanGraph build_plan(const WorkflowAst& ast) {
  PlanGraph graph;
  graph.name = ast.name;
  graph.source = ast.source;

  std::vector<std::string> step_names;
  std::unordered_map<std::string, std::size_t> index;
  for (const auto& step : ast.steps) {
    if (index.count(node_id_for(step.name))) {
      throw GraphError("duplicate step name '" + step.name + "'", {step.name});
    }
    index[node_id_for(step.name)] = step_names.size();
    step_names.push_back(step.name);
  }

  std::vector<std::vector<std::string>> dependencies;
  for (std::size_t i = 0; i < ast.steps.size(); ++i) {
    const auto& step = ast.steps[i];
    AnalyzeContext context{i > 0 ? ast.steps[i - 1].name : std::string(), step_names};
    auto analyzed = analyze_step(step, context);

    PlanNode node;
    node.id = node_id_for(step.name);
    node.kind = kind_of(analyzed.op);
    node.meta.step_name = step.name;
    node.meta.start_line = step.start_line;
    node.meta.op = std::string(operation_name(analyzed.op)) + "@1.0";
    if (auto* take = std::get_if<TakeOp>(&analyzed.op); take && take->implicit_source) {
      node.meta.warnings.push_back("TAKE without FROM reads from preceding step '" + take->source + "'");
    }
    node.op = std::move(analyzed.op);
    graph.nodes.push_back(std::move(node));
    dependencies.push_back(std::move(analyzed.dependencies));
  }

  for (std::size_t i = 0; i < graph.nodes.size(); ++i) {
    auto& node = graph.nodes[i];
    for (const auto& dep : dependencies[i]) {
      auto it = index.find(node_id_for(dep));
      if (it != index.end()) {
        auto& upstream = graph.nodes[it->second];
        graph.edges.push_back(PlanEdge{upstream.id, node.id, dep});
        upstream.outputs.push_back(node.id);
        node.inputs.push_back(upstream.id);
      } else if (ast.has_input(dep)) {
        node.external_inputs.push_back(dep);
      } else {
        throw GraphError("step '" + node.meta.step_name + "' depends on unknown step '" + dep + "'",
                         {node.meta.step_name, dep});
      }
    }
  }

  auto cycle = find_cycle(graph, index);
  if (!cycle.empty()) {
    std::string path;
    for (const auto& name : cycle) {
      path += (path.empty() ? "" : " -> ") + name;
    }
    throw GraphError("cycle detected: " + path, cycle);
  }

  spdlog::debug("planned flow '{}': {} nodes, {} edges", graph.name, graph.nodes.size(), graph.edges.size());
  return graph;
}

nlohmann::json to_json(const PlanGraph& graph) {
  auto nodes = nlohmann::json::array();
  for (const auto& node : graph.nodes) {
    nodes.push_back({
      {"id", node.id},
      {"kind", to_string(node.kind)},
      {"op", node.meta.op},
      {"config", to_json(node.op)},
      {"inputs", node.inputs},
      {"outputs", node.outputs},
      {"externalInputs", node.external_inputs},
      {"meta", {{"stepName", node.meta.step_name},
                {"startLine", node.meta.start_line},
                {"warnings", node.meta.warnings}}},
    });
  }
  auto edges = nlohmann::json::array();
  for (const auto& edge : graph.edges) {
    edges.push_back({{"from", edge.from}, {"to", edge.to}, {"via", edge.via}});
  }
  return {{"name", graph.name}, {"nodes", nodes}, {"edges", edges}};
}

}  // namespace flowgrid
