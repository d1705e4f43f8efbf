// src/common/logging.cpp
#include "codeflow/common/logging.h"
#include "codeflow/common/utils.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>

namespace codeflow {

spdlog::level::level_enum parse_log_level(const std::string& level) {
    const std::string name = to_lower(trim(level));
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off") return spdlog::level::off;
    return spdlog::level::info;
}

void init_logging(const std::string& level) {
    // stdout 留给结果输出，日志走 stderr
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("codeflow", sink);
    spdlog::set_default_logger(logger);
    spdlog::set_level(parse_log_level(level));
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
}

} // namespace codeflow
