#pragma once
#include <chrono>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include <sys/types.h>
#include "gateway/executor.hpp"

namespace agentgate::gateway {

struct ProcessExecutorConfig {
    std::vector<std::string> command = {"claude"};   // argv prefix
    std::chrono::seconds timeout{300};
    int max_turns = 10;
    std::string model;
    std::vector<std::string> allowed_tools;
    std::vector<std::string> disallowed_tools;
};

// Runs the agent CLI as a child process in the working directory and
// decodes its line-delimited JSON event stream.
class ProcessAgentExecutor : public AgentExecutor {
public:
    explicit ProcessAgentExecutor(ProcessExecutorConfig config);
    ~ProcessAgentExecutor() override;

    ProcessAgentExecutor(const ProcessAgentExecutor&) = delete;
    ProcessAgentExecutor& operator=(const ProcessAgentExecutor&) = delete;

    core::AgentResponse execute(const ExecutionRequest& request,
                                const core::StreamCallback& on_event) override;

    // SIGKILL every child still running
    void shutdown() override;

    // Arguments after the command prefix
    std::vector<std::string> build_arguments(const ExecutionRequest& request) const;

    size_t active_process_count() const;

    const ProcessExecutorConfig& config() const { return config_; }

private:
    ProcessExecutorConfig config_;
    std::set<pid_t> active_;
    mutable std::mutex mutex_;

    friend class ChildProcess;
    void track(pid_t pid);
    void untrack(pid_t pid);
};

} // namespace agentgate::gateway
