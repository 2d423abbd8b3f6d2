#include "gateway/agent_gateway.hpp"
#include "core/errors.hpp"
#include "session/session_id.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

using json = nlohmann::json;

namespace agentgate::gateway {

namespace {

// Outcome of tool validation across one execute attempt
struct TurnValidation {
    bool passed = true;
    std::vector<std::string> errors;
    std::vector<std::string> blocked_tools;

    void reset() {
        passed = true;
        errors.clear();
        blocked_tools.clear();
    }
};

std::string join(const std::vector<std::string>& items, const std::string& sep, const std::string& quote = "") {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += quote + items[i] + quote;
    }
    return out;
}

std::string lock_key(int64_t user_id, const std::string& project_path) {
    return std::to_string(user_id) + ":" + project_path;
}

} // namespace

std::string tool_blocked_message(const std::vector<std::string>& blocked_tools,
                                 const std::vector<std::string>& allowed_tools) {
    std::vector<std::string> merged = allowed_tools;
    for (const auto& tool : blocked_tools) {
        if (std::find(merged.begin(), merged.end(), tool) == merged.end()) {
            merged.push_back(tool);
        }
    }

    std::string msg;
    msg += "Tool Access Blocked\n\n";
    msg += "The agent tried to use tools that are not currently allowed:\n";
    msg += join(blocked_tools, ", ", "`") + "\n\n";
    msg += "What you can do:\n";
    msg += "- Contact the administrator to request access to these tools\n";
    msg += "- Try rephrasing your request to use different approaches\n\n";
    msg += "Currently allowed tools:\n";
    msg += (allowed_tools.empty() ? std::string("None") : join(allowed_tools, ", ", "`")) + "\n\n";
    msg += "For administrators:\n";
    msg += "To enable these tools, set in the environment or .env file:\n";
    msg += "AGENTGATE_ALLOWED_TOOLS=\"" + join(merged, ",") + "\"";
    return msg;
}

AgentGateway::AgentGateway(session::SessionManager& sessions,
                           security::ToolValidator& validator,
                           AgentExecutor& executor,
                           PromptEnricher* enricher)
    : sessions_(sessions), validator_(validator), executor_(executor), enricher_(enricher) {
    // A session whose (user, directory) lock is taken has a turn running
    sessions_.set_busy_check([this](int64_t user_id, const std::string& project_path) {
        return locks_.contains(lock_key(user_id, project_path));
    });
}

AgentGateway::~AgentGateway() {
    sessions_.set_busy_check(nullptr);
}

core::AgentResponse AgentGateway::run(const RunRequest& request) {
    const std::string project_path = session::canonical_project_path(request.working_directory);
    const int64_t user_id = request.user_id;

    spdlog::info("Running agent turn: user={} dir={} session={} force_new={}",
                 user_id, project_path, request.session_id.value_or("none"), request.force_new);

    auto guard = locks_.lock(lock_key(user_id, project_path));

    // RESOLVE
    session::Session session = sessions_.get_or_create(user_id, request.working_directory,
                                                       request.session_id, request.force_new);

    bool has_real_session = !session.is_new_session && !session.is_placeholder();
    std::optional<std::string> engine_session;
    if (has_real_session) {
        engine_session = session.session_id;
    }

    // ENRICH
    const std::string prompt = enrich_prompt(user_id, request.prompt, engine_session);

    // EXECUTE
    TurnValidation validation;
    const auto allowed_tools = validator_.policy().allowed_tool_list();

    core::StreamCallback interceptor = [&](const core::StreamUpdate& update) {
        for (const auto& call : update.tool_calls) {
            auto result = validator_.validate(call.name, call.input, request.working_directory, user_id);
            if (result.allowed) {
                continue;
            }

            validation.passed = false;
            validation.errors.push_back(result.error);
            if (std::find(validation.blocked_tools.begin(), validation.blocked_tools.end(), call.name) ==
                validation.blocked_tools.end()) {
                validation.blocked_tools.push_back(call.name);
            }
            spdlog::error("Tool validation failed: user={} tool={} reason={}: {}",
                          user_id, call.name, security::block_reason_name(result.reason), result.error);

            if (validator_.policy().is_critical(call.name)) {
                throw ToolValidationError(tool_blocked_message(validation.blocked_tools, allowed_tools),
                                          validation.blocked_tools, allowed_tools);
            }
        }

        if (request.on_stream) {
            try {
                request.on_stream(update);
            } catch (const std::exception& e) {
                spdlog::warn("Stream callback failed: {}", e.what());
            }
        }
    };

    core::AgentResponse response;
    try {
        ExecutionRequest exec;
        exec.prompt = prompt;
        exec.working_directory = request.working_directory;
        exec.session_id = engine_session;
        exec.continue_session = has_real_session;

        try {
            response = executor_.execute(exec, interceptor);
        } catch (const ToolValidationError&) {
            throw;
        } catch (const std::exception& e) {
            if (!has_real_session || !is_stale_session_error(e)) {
                throw;
            }

            // RETRY_FRESH
            spdlog::warn("Session {} no longer exists on the engine, starting fresh: {}",
                         session.session_id, e.what());
            if (!sessions_.remove_session(session.session_id)) {
                spdlog::debug("Stale session {} was not in the store", session.session_id);
            }
            session = sessions_.get_or_create(user_id, request.working_directory, std::nullopt, true);

            exec.session_id.reset();
            exec.continue_session = false;
            validation.reset();

            try {
                response = executor_.execute(exec, interceptor);
            } catch (const ToolValidationError&) {
                throw;
            } catch (const std::exception& retry_error) {
                if (is_stale_session_error(retry_error)) {
                    throw ProcessError(std::string("Fresh session also failed: ") + retry_error.what());
                }
                throw;
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("Agent turn failed: user={} session={}: {}", user_id, session.session_id, e.what());
        throw;
    }

    // Soft tool-validation failures
    if (!validation.passed) {
        spdlog::error("Turn completed but {} tool call(s) were blocked", validation.errors.size());
        response.is_error = true;
        response.error_type = "tool_validation_failed";
        if (!validation.blocked_tools.empty()) {
            response.content = tool_blocked_message(validation.blocked_tools, allowed_tools) +
                               "\n\nDetails: " + join(validation.errors, "; ");
        } else {
            response.content = "Tool Validation Failed\n\nTools failed security validation. "
                               "Try a different approach.\n\nDetails: " + join(validation.errors, "; ");
        }
    }

    // FINALIZE
    const std::string old_id = session.session_id;
    const std::string engine_id = response.session_id;
    if (!sessions_.update_session(old_id, response)) {
        spdlog::warn("Session {} could not be updated after the turn", old_id);
    }

    std::string final_id = (session.is_new_session && !engine_id.empty()) ? engine_id : old_id;
    if (session::SessionId::parse(final_id).is_pending()) {
        final_id.clear();
    }
    response.session_id = final_id;

    if (response.session_id.empty()) {
        spdlog::warn("No session id after turn for user {}; session cannot be resumed", user_id);
    }

    spdlog::info("Agent turn completed: session={} cost={:.4f} duration={}ms turns={} error={}",
                 response.session_id, response.cost, response.duration_ms,
                 response.num_turns, response.is_error);
    return response;
}

std::optional<core::AgentResponse> AgentGateway::continue_session(int64_t user_id,
                                                                  const std::filesystem::path& working_directory,
                                                                  const std::optional<std::string>& prompt,
                                                                  const core::StreamCallback& on_stream) {
    auto latest = sessions_.find_latest(user_id, working_directory);
    if (!latest) {
        spdlog::info("No session to continue for user {} in {}", user_id, working_directory.string());
        return std::nullopt;
    }

    RunRequest request;
    request.prompt = prompt && !prompt->empty() ? *prompt : "Please continue where we left off";
    request.working_directory = working_directory;
    request.user_id = user_id;
    request.session_id = latest->session_id;
    request.on_stream = on_stream;
    return run(request);
}

std::string AgentGateway::quick_query(const std::string& prompt, const std::filesystem::path& working_directory) {
    ExecutionRequest exec;
    exec.prompt = prompt;
    exec.working_directory = working_directory;
    return executor_.execute(exec, nullptr).content;
}

json AgentGateway::get_user_sessions(int64_t user_id) const {
    const auto now = sessions_.now();
    json list = json::array();
    for (const auto& s : sessions_.get_user_sessions(user_id)) {
        json entry = s.to_json();
        entry["expired"] = s.is_expired(sessions_.config().timeout, now);
        list.push_back(entry);
    }
    return list;
}

std::optional<json> AgentGateway::get_session_info(const std::string& session_id) const {
    return sessions_.get_session_info(session_id);
}

size_t AgentGateway::cleanup_expired_sessions() {
    return sessions_.cleanup_expired_sessions();
}

json AgentGateway::get_tool_stats() const {
    return validator_.state().tool_stats();
}

json AgentGateway::get_user_summary(int64_t user_id) const {
    json summary = sessions_.get_user_session_summary(user_id);
    json usage = validator_.state().user_tool_usage(user_id);
    summary.update(usage);
    return summary;
}

void AgentGateway::shutdown() {
    spdlog::info("Shutting down agent gateway");
    executor_.shutdown();
    size_t removed = cleanup_expired_sessions();
    spdlog::info("Agent gateway shutdown complete ({} expired sessions removed)", removed);
}

std::string AgentGateway::enrich_prompt(int64_t user_id, const std::string& prompt,
                                        const std::optional<std::string>& session_id) {
    if (!enricher_) {
        return prompt;
    }
    try {
        return enricher_->enrich(user_id, prompt, session_id);
    } catch (const std::exception& e) {
        spdlog::warn("Prompt enrichment failed, using the plain prompt: {}", e.what());
        return prompt;
    }
}

} // namespace agentgate::gateway
