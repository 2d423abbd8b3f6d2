#include "core/logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>

namespace agentgate::core {

void init_logger(spdlog::level::level_enum level) {
    auto console = spdlog::get("agentgate");
    if (!console) {
        console = spdlog::stdout_color_mt("agentgate");
    }
    spdlog::set_default_logger(console);
    spdlog::set_level(level);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace")    return spdlog::level::trace;
    if (lowered == "debug")    return spdlog::level::debug;
    if (lowered == "info")     return spdlog::level::info;
    if (lowered == "warn" || lowered == "warning") return spdlog::level::warn;
    if (lowered == "error")    return spdlog::level::err;
    if (lowered == "critical") return spdlog::level::critical;
    if (lowered == "off")      return spdlog::level::off;
    return spdlog::level::info;
}

} // namespace agentgate::core
