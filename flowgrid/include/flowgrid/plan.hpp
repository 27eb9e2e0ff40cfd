// Plan graph: one node per step, one edge per resolved dependency

#ifndef FLOWGRID_PLAN_HPP
#define FLOWGRID_PLAN_HPP

#include <flowgrid/ast.hpp>
#include <flowgrid/operations.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace flowgrid {

enum class NodeKind { DataOp, BytecodeOp, JobOp };

const char* to_string(NodeKind kind);

struct NodeMeta {
  std::string step_name;
  std::size_t start_line = 0;
  std::string op;  // versioned op code, e.g. "FILTER@1.0"
  std::vector<std::string> warnings;
};

struct PlanNode {
  std::string id;  // "step:<name>"
  NodeKind kind = NodeKind::DataOp;
  Operation op;
  std::vector<std::string> inputs;           // upstream node ids
  std::vector<std::string> outputs;          // downstream node ids
  std::vector<std::string> external_inputs;  // dependencies satisfied by workflow INPUTS
  NodeMeta meta;
};

struct PlanEdge {
  std::string from;
  std::string to;
  std::string via;  // dependency name as written in the step

  bool operator==(const PlanEdge&) const = default;
};

/**
 * @brief Validated, acyclic plan compiled from a workflow
 */
class PlanGraph {
 public:
  std::string name;
  std::string source;
  std::vector<PlanNode> nodes;  // source order
  std::vector<PlanEdge> edges;

  /**
   * @brief Find a node by id
   * @return Pointer into nodes, nullptr when absent
   */
  const PlanNode* find(const std::string& id) const;

  /**
   * @brief Find the node compiled from a step
   */
  const PlanNode* node_for_step(const std::string& step_name) const;

  /**
   * @brief Kahn ordering of node ids; ties keep source order
   */
  std::vector<std::string> topological_order() const;

  /**
   * @brief Write the graph in GraphViz DOT format
   */
  void dump(std::ostream& os) const;
};

/**
 * @brief Node id assigned to a step
 */
std::string node_id_for(const std::string& step_name);

/**
 * @brief Analyze every step and assemble the plan graph
 * @param ast Parsed workflow
 * @return Plan graph
 * @throws OperationSyntaxError when a step body is invalid
 * @throws GraphError on duplicate steps, unknown dependencies or cycles
 */
PlanGraph build_plan(const WorkflowAst& ast);

nlohmann::json to_json(const PlanGraph& graph);

}  // namespace flowgrid

#endif  // FLOWGRID_PLAN_HPP
