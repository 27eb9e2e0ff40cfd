// In-process data operations over row tables and reference resolution.
// A table is a JSON array of objects; every operation returns a new table.

#ifndef FLOWGRID_TABLE_HPP
#define FLOWGRID_TABLE_HPP

#include <flowgrid/operations.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace flowgrid {

namespace table {

/**
 * @brief Parse CSV text with a header row
 * @details Cells are trimmed; empty cells become null, numeric cells become
 *          numbers and surrounding quotes are stripped
 */
nlohmann::json parse_csv(std::string_view text);

/**
 * @brief Coerce a value into a table
 * @param value Array of rows, or CSV text
 * @param label Name used in the error message
 * @throws FlowError when the value is not tabular
 */
nlohmann::json ensure_table(const nlohmann::json& value, const std::string& label);

/**
 * @brief Look up a dotted field path in a row; null when absent
 */
nlohmann::json field_value(const nlohmann::json& row, std::string_view path);

bool matches(const nlohmann::json& row, const Condition& condition);

nlohmann::json filter(const nlohmann::json& rows, const Condition& condition);

/**
 * @brief Group rows by a field and aggregate each group
 * @details Groups appear in first-seen order; each output row carries the group key
 *          under the group field name followed by one column per aggregation
 */
nlohmann::json group_aggregate(const nlohmann::json& rows, const std::string& group_by,
                               const std::vector<Aggregation>& aggregations);

/**
 * @brief Stable sort by a field, numeric when both values are numbers
 */
nlohmann::json sort(const nlohmann::json& rows, const std::string& field, SortDirection direction,
                    std::optional<std::size_t> limit = std::nullopt);

nlohmann::json take(const nlohmann::json& rows, std::size_t count);

}  // namespace table

// ============================================================================
// Reference resolution against step results and execution inputs
// ============================================================================

/**
 * @brief Resolve `name`, `name.field` or `name[0].field` against state then inputs
 * @return The referenced value, or nullopt when the head is unknown or the path is missing
 */
std::optional<nlohmann::json> resolve_reference(std::string_view token, const nlohmann::json& state,
                                                const nlohmann::json& inputs);

/**
 * @brief Replace every string leaf that resolves as a reference with its value
 */
nlohmann::json resolve_literal(const nlohmann::json& value, const nlohmann::json& state,
                               const nlohmann::json& inputs);

/**
 * @brief Resolve a dataset name or reference path to a table
 * @throws FlowError when the reference does not resolve
 */
nlohmann::json resolve_dataset(const std::string& name, const nlohmann::json& state,
                               const nlohmann::json& inputs);

}  // namespace flowgrid

#endif  // FLOWGRID_TABLE_HPP
