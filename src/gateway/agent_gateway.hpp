#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/types.hpp"
#include "gateway/executor.hpp"
#include "gateway/keyed_mutex.hpp"
#include "gateway/prompt_enricher.hpp"
#include "security/tool_validator.hpp"
#include "session/session_manager.hpp"

namespace agentgate::gateway {

struct RunRequest {
    std::string prompt;
    std::filesystem::path working_directory;
    int64_t user_id = 0;
    std::optional<std::string> session_id;
    bool force_new = false;
    core::StreamCallback on_stream;
};

// Runs agent turns: picks the session, builds the prompt, executes with
// every tool call passed through the validator, restarts once on a stale
// session, then records the turn. Calls for the same (user, directory)
// are serialized.
class AgentGateway {
public:
    AgentGateway(session::SessionManager& sessions,
                 security::ToolValidator& validator,
                 AgentExecutor& executor,
                 PromptEnricher* enricher = nullptr);
    ~AgentGateway();

    AgentGateway(const AgentGateway&) = delete;
    AgentGateway& operator=(const AgentGateway&) = delete;

    // Throws ToolValidationError when a critical tool is blocked, and
    // passes executor faults through. Non-critical blocks come back as
    // is_error = true with error_type "tool_validation_failed".
    core::AgentResponse run(const RunRequest& request);

    // Latest non-placeholder session for the directory, expired or not.
    // nullopt when the user has none there.
    std::optional<core::AgentResponse> continue_session(int64_t user_id,
                                                        const std::filesystem::path& working_directory,
                                                        const std::optional<std::string>& prompt = std::nullopt,
                                                        const core::StreamCallback& on_stream = nullptr);

    // One-off turn with no session and no validation
    std::string quick_query(const std::string& prompt, const std::filesystem::path& working_directory);

    nlohmann::json get_user_sessions(int64_t user_id) const;
    std::optional<nlohmann::json> get_session_info(const std::string& session_id) const;
    size_t cleanup_expired_sessions();
    nlohmann::json get_tool_stats() const;
    nlohmann::json get_user_summary(int64_t user_id) const;

    void shutdown();

private:
    session::SessionManager& sessions_;
    security::ToolValidator& validator_;
    AgentExecutor& executor_;
    PromptEnricher* enricher_;
    KeyedMutex locks_;

    std::string enrich_prompt(int64_t user_id, const std::string& prompt,
                              const std::optional<std::string>& session_id);
};

// "Tool access blocked" text listing the blocked and allowed tools, with
// instructions for extending AGENTGATE_ALLOWED_TOOLS
std::string tool_blocked_message(const std::vector<std::string>& blocked_tools,
                                 const std::vector<std::string>& allowed_tools);

} // namespace agentgate::gateway
