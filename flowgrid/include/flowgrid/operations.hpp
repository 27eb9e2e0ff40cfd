// Typed operation descriptors and the per-step analyzer

#ifndef FLOWGRID_OPERATIONS_HPP
#define FLOWGRID_OPERATIONS_HPP

#include <flowgrid/ast.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace flowgrid {

enum class CompareOp { Gt, Ge, Lt, Le, Eq, Ne };
enum class AggregateFn { Sum, Count };
enum class SortDirection { Asc, Desc };

struct Condition {
  std::string field;       // dotted path into the row
  CompareOp op = CompareOp::Eq;
  nlohmann::json value;    // number or string
};

struct Aggregation {
  std::optional<std::string> field;  // empty for count(*)
  std::string alias;
  AggregateFn fn = AggregateFn::Sum;
};

// ============================================================================
// Operation variants
// ============================================================================

struct LoadTableOp {
  std::string table;
};

struct LoadCsvOp {
  std::string source;
};

struct FilterOp {
  std::string source;
  Condition condition;
};

struct GroupAggregateOp {
  std::string source;
  std::string group_by;
  std::vector<Aggregation> aggregations;
};

struct SortOp {
  std::string source;
  std::string field;
  SortDirection direction = SortDirection::Asc;
  std::optional<std::size_t> limit;  // folded from a trailing TAKE line
};

struct TakeOp {
  std::string source;
  std::size_t count = 0;
  bool implicit_source = false;  // FROM omitted, source is the preceding step
};

struct RunAgentOp {
  std::string agent;
  nlohmann::json payload = nlohmann::json::object();
};

struct ApxExecOp {
  std::string target;
  nlohmann::json payload;
};

struct BuildVpkgOp {
  std::string manifest_ref;
};

struct DeployServiceOp {
  std::string vpkg_ref;
  std::string service_name;
};

struct RunVasmOp {
  std::string program;
  nlohmann::json payload = nlohmann::json::object();
};

struct CallFlowOp {
  std::string path;
  nlohmann::json payload = nlohmann::json::object();
};

struct OutputOp {
  std::string source;
  std::string label;
};

struct OutputTextOp {
  nlohmann::json value;
};

using Operation = std::variant<LoadTableOp, LoadCsvOp, FilterOp, GroupAggregateOp, SortOp, TakeOp,
                               RunAgentOp, ApxExecOp, BuildVpkgOp, DeployServiceOp, RunVasmOp,
                               CallFlowOp, OutputOp, OutputTextOp>;

/**
 * @brief Operation descriptor plus the upstream names it reads from
 */
struct AnalyzedStep {
  Operation op;
  std::vector<std::string> dependencies;  // de-duplicated, first occurrence order
};

struct AnalyzeContext {
  std::string previous_step;             // empty for the first step
  std::vector<std::string> step_names;   // every step of the workflow
};

/**
 * @brief Analyze one step body into a typed operation
 * @param step Parsed step
 * @param context Neighbouring step information used for implicit sources
 *                and payload reference inference
 * @return Operation descriptor and dependency names
 * @throws OperationSyntaxError naming the step when the body does not match
 */
AnalyzedStep analyze_step(const Step& step, const AnalyzeContext& context);

/**
 * @brief Canonical operation name, e.g. "FILTER" or "RUN_VASM"
 */
const char* operation_name(const Operation& op);

/**
 * @brief Leading segment of a dotted/indexed reference ("sales.rows[0]" -> "sales")
 */
std::string reference_head(std::string_view reference);

const char* to_string(CompareOp op);
const char* to_string(AggregateFn fn);
const char* to_string(SortDirection direction);

nlohmann::json to_json(const Operation& op);

}  // namespace flowgrid

#endif  // FLOWGRID_OPERATIONS_HPP
