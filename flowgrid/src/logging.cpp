// Implementation file for logging.hpp

#include <flowgrid/logging.hpp>
#include <flowgrid/text.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>

namespace flowgrid {

spdlog::level::level_enum parse_log_level(std::string_view name) {
  auto level = text::to_lower(text::trim(name));
  if (level == "trace") return spdlog::level::trace;
  if (level == "debug") return spdlog::level::debug;
  if (level == "info") return spdlog::level::info;
  if (level == "warn" || level == "warning") return spdlog::level::warn;
  if (level == "error") return spdlog::level::err;
  if (level == "critical") return spdlog::level::critical;
  if (level == "off") return spdlog::level::off;
  return spdlog::level::info;
}

void init_logging(std::string_view level) {
  auto logger = spdlog::get("flowgrid");
  if (!logger) {
    logger = spdlog::stderr_color_mt("flowgrid");
  }
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
  logger->set_level(parse_log_level(level));
  spdlog::set_default_logger(logger);
}

}  // namespace flowgrid
