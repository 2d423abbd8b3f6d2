#include "gateway/config.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/paths.hpp"
#include <algorithm>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace agentgate::gateway {

std::vector<fs::path> GatewayConfig::all_allowed_paths() const {
    std::vector<fs::path> roots;
    auto add = [&roots](const fs::path& p) {
        if (!p.empty() && std::find(roots.begin(), roots.end(), p) == roots.end()) {
            roots.push_back(p);
        }
    };
    add(approved_directory);
    for (const auto& p : allowed_paths) {
        add(p);
    }
    return roots;
}

json GatewayConfig::to_json() const {
    json j;
    j["approved_directory"] = approved_directory.string();
    j["allowed_paths"] = json::array();
    for (const auto& p : allowed_paths) {
        j["allowed_paths"].push_back(p.string());
    }
    j["policy"] = policy.to_json();
    j["session_timeout_seconds"] = session.timeout.count();
    j["max_sessions_per_user"] = session.max_sessions_per_user;
    j["session_file"] = session_file.string();
    j["agent_command"] = executor.command;
    j["agent_model"] = executor.model;
    j["agent_max_turns"] = executor.max_turns;
    j["agent_timeout_seconds"] = executor.timeout.count();
    j["language"] = enricher.language;
    j["timezone"] = enricher.timezone;
    j["log_level"] = spdlog::level::to_string_view(log_level).data();
    return j;
}

GatewayConfig load_gateway_config() {
    using namespace core::config;

    load_dotenv();

    GatewayConfig config;

    // Directories
    config.approved_directory = core::paths::expand_user(
        get_env_or("AGENTGATE_APPROVED_DIRECTORY", (core::paths::default_state_dir() / "workspace").string()));
    if (!config.approved_directory.is_absolute()) {
        throw ConfigError("AGENTGATE_APPROVED_DIRECTORY must be an absolute path: " +
                          config.approved_directory.string());
    }
    for (const auto& p : get_env_list("AGENTGATE_ALLOWED_PATHS", {})) {
        fs::path expanded = core::paths::expand_user(p);
        if (!expanded.is_absolute()) {
            throw ConfigError("AGENTGATE_ALLOWED_PATHS entries must be absolute: " + p);
        }
        config.allowed_paths.push_back(expanded);
    }

    // Tool policy
    config.policy = security::ToolPolicy::defaults();
    auto allowed = get_env_list("AGENTGATE_ALLOWED_TOOLS", security::DEFAULT_ALLOWED_TOOLS);
    if (std::find(allowed.begin(), allowed.end(), "*") != allowed.end()) {
        config.policy.allowed_tools.reset();
    } else {
        config.policy.allowed_tools = std::set<std::string>(allowed.begin(), allowed.end());
    }
    auto disallowed = get_env_list("AGENTGATE_DISALLOWED_TOOLS", {});
    config.policy.disallowed_tools = std::set<std::string>(disallowed.begin(), disallowed.end());
    config.policy.allow_list_disabled = get_env_bool("AGENTGATE_DISABLE_TOOL_VALIDATION", false);
    config.policy.agentic_relaxed = get_env_bool("AGENTGATE_AGENTIC_MODE", true) ||
                                    get_env_bool("AGENTGATE_DISABLE_SECURITY_PATTERNS", false);
    auto critical = get_env_list("AGENTGATE_CRITICAL_TOOLS", security::DEFAULT_CRITICAL_TOOLS);
    config.policy.critical_tools = std::set<std::string>(critical.begin(), critical.end());
    config.policy.dangerous_patterns = get_env_list("AGENTGATE_DANGEROUS_PATTERNS",
                                                    security::DEFAULT_DANGEROUS_PATTERNS);
    config.policy.approved_roots = config.all_allowed_paths();

    // Sessions
    long long timeout_hours = get_env_int("AGENTGATE_SESSION_TIMEOUT_HOURS", 24);
    if (timeout_hours <= 0) {
        throw ConfigError("AGENTGATE_SESSION_TIMEOUT_HOURS must be positive");
    }
    config.session.timeout = std::chrono::hours(timeout_hours);

    long long max_sessions = get_env_int("AGENTGATE_MAX_SESSIONS_PER_USER", 5);
    if (max_sessions < 0) {
        throw ConfigError("AGENTGATE_MAX_SESSIONS_PER_USER must not be negative");
    }
    config.session.max_sessions_per_user = static_cast<size_t>(max_sessions);
    config.session_file = core::paths::expand_user(
        get_env_or("AGENTGATE_SESSION_FILE", (core::paths::default_state_dir() / "sessions.json").string()));

    // Agent process
    config.executor.command = {get_env_or("AGENTGATE_AGENT_CLI", "claude")};
    config.executor.model = get_env("AGENTGATE_AGENT_MODEL");

    long long max_turns = get_env_int("AGENTGATE_AGENT_MAX_TURNS", 10);
    if (max_turns <= 0) {
        throw ConfigError("AGENTGATE_AGENT_MAX_TURNS must be positive");
    }
    config.executor.max_turns = static_cast<int>(max_turns);

    long long agent_timeout = get_env_int("AGENTGATE_AGENT_TIMEOUT_SECONDS", 300);
    if (agent_timeout <= 0) {
        throw ConfigError("AGENTGATE_AGENT_TIMEOUT_SECONDS must be positive");
    }
    config.executor.timeout = std::chrono::seconds(agent_timeout);
    config.executor.allowed_tools = config.policy.allowed_tool_list();
    config.executor.disallowed_tools = disallowed;

    // Prompt context
    config.enricher.language = get_env_or("AGENTGATE_LANGUAGE", "auto");
    config.enricher.timezone = get_env_or("AGENTGATE_TIMEZONE", "UTC");

    config.log_level = core::parse_log_level(get_env_or("AGENTGATE_LOG_LEVEL", "info"));

    return config;
}

} // namespace agentgate::gateway
