// Structured literal parser for WITH blocks and OUTPUT_TEXT values

#ifndef FLOWGRID_PAYLOAD_HPP
#define FLOWGRID_PAYLOAD_HPP

#include <nlohmann/json.hpp>
#include <string_view>

namespace flowgrid {

/**
 * @brief Parse a structured literal into a JSON value
 * @param text Literal text: object, array, string, number, true/false/null,
 *             bare identifier, or a top-level `key = value, ...` list
 * @return Parsed value; an empty object for blank input
 * @throws PayloadError on malformed or unterminated literals
 */
nlohmann::json parse_payload(std::string_view text);

/**
 * @brief Whether text can start a bare identifier token
 */
bool is_identifier_start(char c);

/**
 * @brief Whether c may continue a bare identifier (letters, digits, `_ - . [ ]`)
 */
bool is_identifier_char(char c);

}  // namespace flowgrid

#endif  // FLOWGRID_PAYLOAD_HPP
