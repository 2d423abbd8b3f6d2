#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include "gateway/process_executor.hpp"
#include "gateway/prompt_enricher.hpp"
#include "security/tool_policy.hpp"
#include "session/session_manager.hpp"

namespace agentgate::gateway {

// Everything the gateway is built from, read from AGENTGATE_* variables
struct GatewayConfig {
    std::filesystem::path approved_directory;
    std::vector<std::filesystem::path> allowed_paths;   // extra roots

    security::ToolPolicy policy;
    session::SessionConfig session;
    std::filesystem::path session_file;
    ProcessExecutorConfig executor;
    EnricherConfig enricher;
    spdlog::level::level_enum log_level = spdlog::level::info;

    // approved_directory first, then allowed_paths, duplicates removed
    std::vector<std::filesystem::path> all_allowed_paths() const;

    nlohmann::json to_json() const;
};

// Throws ConfigError on invalid values
GatewayConfig load_gateway_config();

} // namespace agentgate::gateway
