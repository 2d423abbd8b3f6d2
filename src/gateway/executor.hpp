#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "core/types.hpp"

namespace agentgate::gateway {

struct ExecutionRequest {
    std::string prompt;
    std::filesystem::path working_directory;
    std::optional<std::string> session_id;  // engine id to resume, never a placeholder
    bool continue_session = false;
};

// Runs one agent turn. Implementations report every engine event through
// on_event while the turn runs and throw the typed faults from
// core/errors.hpp (TimeoutError, ProcessError, StaleSessionError,
// ParsingError). Exceptions thrown by on_event abort the turn and propagate.
class AgentExecutor {
public:
    virtual ~AgentExecutor() = default;

    virtual core::AgentResponse execute(const ExecutionRequest& request,
                                        const core::StreamCallback& on_event) = 0;

    // Stop any turn still running
    virtual void shutdown() {}
};

} // namespace agentgate::gateway
