#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace agentgate::gateway {

// Builds the prompt actually sent to the agent from the user's text
class PromptEnricher {
public:
    virtual ~PromptEnricher() = default;

    virtual std::string enrich(int64_t user_id,
                               const std::string& prompt,
                               const std::optional<std::string>& session_id) = 0;
};

struct EnricherConfig {
    std::string language = "auto";
    std::string timezone = "UTC";
};

// Prepends a language preference section and the current time, followed
// by a "---" separator and the user's prompt.
class ContextPromptEnricher : public PromptEnricher {
public:
    using ClockFn = std::function<std::chrono::system_clock::time_point()>;

    explicit ContextPromptEnricher(EnricherConfig config, ClockFn clock = nullptr);

    std::string enrich(int64_t user_id,
                       const std::string& prompt,
                       const std::optional<std::string>& session_id) override;

private:
    EnricherConfig config_;
    ClockFn clock_;
};

} // namespace agentgate::gateway
