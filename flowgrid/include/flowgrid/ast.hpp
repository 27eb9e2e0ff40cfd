// Workflow syntax tree produced by the step parser

#ifndef FLOWGRID_AST_HPP
#define FLOWGRID_AST_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace flowgrid {

enum class InputType { File, Table, Text, Json, Number, Bool, Blob };

/**
 * @brief Operation keyword inferred from the first body line of a step
 */
enum class OpKeyword {
  LoadTable,
  LoadCsv,
  Filter,
  GroupAggregate,
  Sort,
  Take,
  RunAgent,
  ApxExec,
  BuildVpkg,
  DeployService,
  RunVasm,
  CallFlow,
  Output,
  OutputText,
  Unknown
};

struct InputDecl {
  std::string name;
  InputType type = InputType::Text;
  bool optional = false;

  bool operator==(const InputDecl&) const = default;
};

struct Step {
  std::string name;
  OpKeyword keyword = OpKeyword::Unknown;
  std::vector<std::string> body_lines;  // indent-stripped, right-trimmed
  std::size_t start_line = 0;           // 1-based line of the STEP declaration

  bool operator==(const Step&) const = default;
};

struct WorkflowAst {
  std::string name;
  std::vector<InputDecl> inputs;
  std::vector<Step> steps;
  std::string source;

  bool operator==(const WorkflowAst&) const = default;

  const Step* find_step(const std::string& step_name) const {
    for (const auto& step : steps) {
      if (step.name == step_name) return &step;
    }
    return nullptr;
  }

  bool has_input(const std::string& input_name) const {
    for (const auto& input : inputs) {
      if (input.name == input_name) return true;
    }
    return false;
  }
};

}  // namespace flowgrid

#endif  // FLOWGRID_AST_HPP
