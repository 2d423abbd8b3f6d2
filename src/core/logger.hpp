#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace agentgate::core {

// Initialize logging with console output
void init_logger(spdlog::level::level_enum level = spdlog::level::info);

void set_log_level(spdlog::level::level_enum level);

// "trace", "debug", "info", "warn", "error", "critical", "off"; anything else is info
spdlog::level::level_enum parse_log_level(const std::string& name);

} // namespace agentgate::core
