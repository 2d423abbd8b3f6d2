#include "gateway/process_executor.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <optional>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

using json = nlohmann::json;

namespace agentgate::gateway {

namespace {

constexpr int EXIT_CHDIR_FAILED = 126;
constexpr int EXIT_EXEC_FAILED = 127;
constexpr size_t MAX_STDERR_BYTES = 64 * 1024;

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Accumulates the turn while events arrive
struct TurnState {
    core::AgentResponse response;
    std::string assistant_text;
    bool saw_result = false;
    std::string result_error;
};

// Folds one event into the turn; nullopt for event types we do not forward
std::optional<core::StreamUpdate> decode_event(const json& event, TurnState& turn) {
    if (!event.is_object()) {
        throw ParsingError("Agent event is not a JSON object: " + event.dump());
    }
    const std::string type = event.value("type", "");

    core::StreamUpdate update;
    update.type = type;

    if (type == "system") {
        update.metadata["subtype"] = event.value("subtype", "");
        if (event.contains("session_id") && event["session_id"].is_string()) {
            turn.response.session_id = event["session_id"].get<std::string>();
            update.metadata["session_id"] = turn.response.session_id;
        }
        if (event.contains("model")) {
            update.metadata["model"] = event["model"];
        }
    } else if (type == "assistant") {
        const json message = event.value("message", json::object());
        const json blocks = message.value("content", json::array());
        if (!blocks.is_array()) {
            update.content = blocks.is_string() ? blocks.get<std::string>() : "";
        } else for (const auto& block : blocks) {
            if (!block.is_object()) continue;
            const std::string block_type = block.value("type", "");
            if (block_type == "text") {
                std::string text = block.value("text", "");
                if (!update.content.empty()) update.content += "\n";
                update.content += text;
            } else if (block_type == "tool_use") {
                core::ToolCall call;
                call.name = block.value("name", "");
                call.input = block.value("input", json::object());
                call.id = block.value("id", "");
                turn.response.tools_used.push_back({call.name, call.input});
                update.tool_calls.push_back(std::move(call));
            }
        }
        if (!update.content.empty()) {
            if (!turn.assistant_text.empty()) turn.assistant_text += "\n";
            turn.assistant_text += update.content;
        }
    } else if (type == "user") {
        const json message = event.value("message", json::object());
        const json blocks = message.value("content", json::array());
        if (blocks.is_array()) {
            for (const auto& block : blocks) {
                if (block.is_object() && block.value("type", "") == "tool_result" && block.contains("content") &&
                    block["content"].is_string()) {
                    if (!update.content.empty()) update.content += "\n";
                    update.content += block["content"].get<std::string>();
                }
            }
        }
    } else if (type == "result") {
        turn.saw_result = true;
        turn.response.content = event.value("result", "");
        if (event.contains("session_id") && event["session_id"].is_string()) {
            turn.response.session_id = event["session_id"].get<std::string>();
        }
        turn.response.cost = event.value("total_cost_usd", 0.0);
        turn.response.num_turns = event.value("num_turns", 0);
        turn.response.duration_ms = event.value("duration_ms", int64_t(0));
        turn.response.is_error = event.value("is_error", false);
        if (turn.response.is_error) {
            turn.result_error = turn.response.content;
        }
        update.content = turn.response.content;
        update.metadata["session_id"] = turn.response.session_id;
        update.metadata["cost"] = turn.response.cost;
        update.metadata["num_turns"] = turn.response.num_turns;
    } else {
        spdlog::debug("Ignoring agent event of type '{}'", type);
        return std::nullopt;
    }

    return update;
}

// Name following "server" in an MCP failure, quoted or bare; empty if none
std::string mcp_server_name(const std::string& detail) {
    size_t pos = to_lower(detail).find("server");
    if (pos == std::string::npos) {
        return "";
    }
    pos += 6;
    while (pos < detail.size() && (detail[pos] == ' ' || detail[pos] == ':')) pos++;
    if (pos >= detail.size()) {
        return "";
    }

    const char quote = detail[pos];
    if (quote == '"' || quote == '\'') {
        size_t end = detail.find(quote, pos + 1);
        return end == std::string::npos ? "" : detail.substr(pos + 1, end - pos - 1);
    }

    size_t end = pos;
    while (end < detail.size() &&
           (std::isalnum(static_cast<unsigned char>(detail[end])) || detail[end] == '-' ||
            detail[end] == '_' || detail[end] == '.')) {
        end++;
    }
    return detail.substr(pos, end - pos);
}

// Typed fault for a failed run, chosen from the text the agent left behind
void raise_process_failure(int exit_code, const std::string& detail) {
    const std::string message = "Agent process exited with code " + std::to_string(exit_code) +
                                (detail.empty() ? "" : ": " + detail);

    ProcessError generic(message);
    if (is_stale_session_error(generic)) {
        throw StaleSessionError(message);
    }
    if (to_lower(detail).find("mcp") != std::string::npos) {
        throw McpError("MCP server error: " + detail, mcp_server_name(detail));
    }
    throw ProcessError(message);
}

} // namespace

// Owns one forked child and its pipes; kills and reaps it if still running
class ChildProcess {
public:
    ChildProcess(ProcessAgentExecutor& owner, pid_t pid, int out_fd, int err_fd)
        : owner_(owner), pid_(pid), out_fd_(out_fd), err_fd_(err_fd) {
        owner_.track(pid_);
    }

    ~ChildProcess() {
        close_fd(out_fd_);
        close_fd(err_fd_);
        if (pid_ > 0) {
            kill(pid_, SIGKILL);
            int status = 0;
            waitpid(pid_, &status, 0);
            owner_.untrack(pid_);
        }
    }

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    int& out_fd() { return out_fd_; }
    int& err_fd() { return err_fd_; }

    // Reap without blocking. nullopt while the child is still running;
    // otherwise the exit code, or 128 + signal.
    std::optional<int> try_wait() {
        int status = 0;
        pid_t reaped;
        do {
            reaped = waitpid(pid_, &status, WNOHANG);
        } while (reaped < 0 && errno == EINTR);

        if (reaped == 0) {
            return std::nullopt;
        }
        if (reaped < 0) {
            int saved = errno;
            forget();
            throw ProcessError(std::string("waitpid failed: ") + std::strerror(saved));
        }

        // The pid may be recycled from here on; shutdown() must not see it
        forget();
        if (WIFEXITED(status)) {
            return WEXITSTATUS(status);
        }
        if (WIFSIGNALED(status)) {
            return 128 + WTERMSIG(status);
        }
        return -1;
    }

private:
    ProcessAgentExecutor& owner_;
    pid_t pid_;     // -1 once reaped
    int out_fd_;
    int err_fd_;

    void forget() {
        owner_.untrack(pid_);
        pid_ = -1;
    }
};

ProcessAgentExecutor::ProcessAgentExecutor(ProcessExecutorConfig config)
    : config_(std::move(config)) {
    if (config_.command.empty()) {
        throw ConfigError("Agent command must not be empty");
    }
}

ProcessAgentExecutor::~ProcessAgentExecutor() {
    shutdown();
}

std::vector<std::string> ProcessAgentExecutor::build_arguments(const ExecutionRequest& request) const {
    std::vector<std::string> args = {
        "-p", request.prompt,
        "--output-format", "stream-json",
        "--verbose",
        "--max-turns", std::to_string(config_.max_turns)
    };

    if (!config_.model.empty()) {
        args.push_back("--model");
        args.push_back(config_.model);
    }
    if (!config_.allowed_tools.empty()) {
        args.push_back("--allowedTools");
        args.push_back(join(config_.allowed_tools, ","));
    }
    if (!config_.disallowed_tools.empty()) {
        args.push_back("--disallowedTools");
        args.push_back(join(config_.disallowed_tools, ","));
    }
    if (request.continue_session && request.session_id && !request.session_id->empty()) {
        args.push_back("--resume");
        args.push_back(*request.session_id);
    }

    args.push_back("--append-system-prompt");
    args.push_back("All file operations must stay within " + request.working_directory.string() +
                   ". Use relative paths.");
    return args;
}

core::AgentResponse ProcessAgentExecutor::execute(const ExecutionRequest& request,
                                                  const core::StreamCallback& on_event) {
    std::vector<std::string> argv_storage = config_.command;
    auto args = build_arguments(request);
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());

    std::vector<char*> argv;
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    int stdout_pipe[2];
    int stderr_pipe[2];
    if (pipe2(stdout_pipe, O_CLOEXEC) < 0) {
        throw ProcessError(std::string("Failed to create pipe: ") + std::strerror(errno));
    }
    if (pipe2(stderr_pipe, O_CLOEXEC) < 0) {
        int saved = errno;
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        throw ProcessError(std::string("Failed to create pipe: ") + std::strerror(saved));
    }

    const std::string wd = request.working_directory.string();
    const auto started = std::chrono::steady_clock::now();

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        close(stderr_pipe[0]);
        close(stderr_pipe[1]);
        throw ProcessError(std::string("Failed to fork agent process: ") + std::strerror(saved));
    }

    if (pid == 0) {
        // Child process
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
        }

        if (!wd.empty() && chdir(wd.c_str()) != 0) {
            _exit(EXIT_CHDIR_FAILED);
        }

        execvp(argv[0], argv.data());
        _exit(EXIT_EXEC_FAILED);
    }

    // Parent process
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    ChildProcess child(*this, pid, stdout_pipe[0], stderr_pipe[0]);

    spdlog::debug("Agent process started (pid={}, cwd={}, resume={})",
                  pid, wd, request.continue_session ? request.session_id.value_or("") : "");

    const auto deadline = started + config_.timeout;
    TurnState turn;
    std::string out_buffer;
    std::string err_buffer;
    char chunk[8192];

    // Decode one line, then hand the update to the caller outside the decode guard
    auto dispatch = [&](const std::string& line) {
        std::optional<core::StreamUpdate> update;
        try {
            update = decode_event(json::parse(line), turn);
        } catch (const json::exception& e) {
            throw ParsingError(std::string("Failed to decode agent output: ") + e.what());
        }
        if (update && on_event) {
            on_event(*update);
        }
    };

    auto drain_lines = [&](bool final) {
        size_t pos;
        while ((pos = out_buffer.find('\n')) != std::string::npos) {
            std::string line = trim(out_buffer.substr(0, pos));
            out_buffer.erase(0, pos + 1);
            if (line.empty()) continue;

            dispatch(line);
        }
        if (final) {
            std::string rest = trim(out_buffer);
            out_buffer.clear();
            if (!rest.empty()) {
                dispatch(rest);
            }
        }
    };

    while (child.out_fd() >= 0 || child.err_fd() >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            spdlog::warn("Agent process {} timed out after {}s", pid, config_.timeout.count());
            throw TimeoutError("Agent timed out after " + std::to_string(config_.timeout.count()) + "s");
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        int out_index = -1;
        int err_index = -1;
        if (child.out_fd() >= 0) {
            out_index = static_cast<int>(nfds);
            fds[nfds++] = {child.out_fd(), POLLIN, 0};
        }
        if (child.err_fd() >= 0) {
            err_index = static_cast<int>(nfds);
            fds[nfds++] = {child.err_fd(), POLLIN, 0};
        }

        int ready = poll(fds, nfds, static_cast<int>(std::min<long long>(remaining.count(), 1000)));
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw ProcessError(std::string("poll failed: ") + std::strerror(errno));
        }
        if (ready == 0) continue;

        if (out_index >= 0 && (fds[out_index].revents & (POLLIN | POLLHUP | POLLERR))) {
            ssize_t n = read(child.out_fd(), chunk, sizeof(chunk));
            if (n > 0) {
                out_buffer.append(chunk, static_cast<size_t>(n));
                drain_lines(false);
            } else if (n == 0 || errno != EINTR) {
                close_fd(child.out_fd());
            }
        }
        if (err_index >= 0 && (fds[err_index].revents & (POLLIN | POLLHUP | POLLERR))) {
            ssize_t n = read(child.err_fd(), chunk, sizeof(chunk));
            if (n > 0) {
                if (err_buffer.size() < MAX_STDERR_BYTES) {
                    err_buffer.append(chunk, static_cast<size_t>(n));
                }
            } else if (n == 0 || errno != EINTR) {
                close_fd(child.err_fd());
            }
        }
    }

    drain_lines(true);

    // Both pipes are closed but the child may still be running
    std::optional<int> reaped;
    while (!(reaped = child.try_wait())) {
        if (std::chrono::steady_clock::now() >= deadline) {
            spdlog::warn("Agent process {} timed out after {}s with its output closed",
                         pid, config_.timeout.count());
            throw TimeoutError("Agent timed out after " + std::to_string(config_.timeout.count()) + "s");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    const int exit_code = *reaped;
    const std::string stderr_text = trim(err_buffer);

    if (exit_code == EXIT_EXEC_FAILED && !turn.saw_result) {
        throw ProcessError("Agent CLI not found or not executable: " + config_.command.front());
    }
    if (exit_code == EXIT_CHDIR_FAILED && !turn.saw_result) {
        throw ProcessError("Cannot enter working directory: " + wd);
    }
    if (exit_code != 0) {
        std::string detail = stderr_text;
        if (!turn.result_error.empty()) {
            detail = detail.empty() ? turn.result_error : detail + "\n" + turn.result_error;
        }
        raise_process_failure(exit_code, detail);
    }

    core::AgentResponse response = std::move(turn.response);
    if (!turn.saw_result) {
        response.content = turn.assistant_text;
    }
    if (response.is_error) {
        response.error_type = "agent_error";
    }
    if (response.duration_ms == 0) {
        response.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();
    }

    spdlog::debug("Agent process {} finished: turns={} cost={:.4f}", pid, response.num_turns, response.cost);
    return response;
}

void ProcessAgentExecutor::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (pid_t pid : active_) {
        spdlog::info("Killing agent process {}", pid);
        kill(pid, SIGKILL);
    }
}

size_t ProcessAgentExecutor::active_process_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

void ProcessAgentExecutor::track(pid_t pid) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_.insert(pid);
}

void ProcessAgentExecutor::untrack(pid_t pid) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_.erase(pid);
}

} // namespace agentgate::gateway
