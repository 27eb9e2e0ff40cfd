// Step parser: FLOW header, INPUTS block and STEP bodies

#ifndef FLOWGRID_PARSER_HPP
#define FLOWGRID_PARSER_HPP

#include <flowgrid/ast.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace flowgrid {

struct ParseOptions {
  bool strict = false;  // zero steps is an error instead of a warning
};

/**
 * @brief Result of the compile boundary
 * @details ok is false only when errors is non-empty; warnings never block planning
 */
struct CompileResult {
  bool ok = false;
  std::optional<WorkflowAst> ast;
  std::vector<std::string> warnings;
  std::vector<std::string> errors;
};

/**
 * @brief Parse workflow source into an AST
 * @param source FLOW source text
 * @param options Strictness
 * @return Compile result; never throws for malformed source
 */
CompileResult parse_flow(std::string_view source, const ParseOptions& options = {});

/**
 * @brief Strict parse that throws instead of returning errors
 * @throws ParseError when the source has a missing header or no steps
 */
WorkflowAst parse_flow_strict(std::string_view source);

/**
 * @brief Infer the operation keyword of a body line
 * @details Keywords are tried in a fixed priority order, longest prefix first,
 *          and must be followed by whitespace or the end of the line
 */
OpKeyword infer_keyword(std::string_view line);

const char* to_string(OpKeyword keyword);
const char* to_string(InputType type);
std::optional<InputType> input_type_from_string(std::string_view name);

}  // namespace flowgrid

#endif  // FLOWGRID_PARSER_HPP
