#ifndef CODEFLOW_COMMON_LOGGING_H
#define CODEFLOW_COMMON_LOGGING_H

#include <spdlog/spdlog.h>
#include <string>

namespace codeflow {

// Installs a stderr color logger as spdlog's default logger.
// level: trace|debug|info|warn|error|off; unknown names fall back to info.
void init_logging(const std::string& level = "info");

spdlog::level::level_enum parse_log_level(const std::string& level);

} // namespace codeflow

#endif // CODEFLOW_COMMON_LOGGING_H
