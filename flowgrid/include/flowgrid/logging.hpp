// Process-wide logging setup

#ifndef FLOWGRID_LOGGING_HPP
#define FLOWGRID_LOGGING_HPP

#include <spdlog/spdlog.h>

#include <string_view>

namespace flowgrid {

/**
 * @brief Case-insensitive level name to spdlog level; unknown names map to info
 */
spdlog::level::level_enum parse_log_level(std::string_view name);

/**
 * @brief Install the "flowgrid" stderr logger as spdlog's default logger
 * @param level Level name, e.g. "debug" or "warn"
 */
void init_logging(std::string_view level = "info");

}  // namespace flowgrid

#endif  // FLOWGRID_LOGGING_HPP
