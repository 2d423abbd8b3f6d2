#include "gateway/prompt_enricher.hpp"
#include <spdlog/spdlog.h>
#include <cctype>
#include <ctime>
#include <vector>

namespace agentgate::gateway {

ContextPromptEnricher::ContextPromptEnricher(EnricherConfig config, ClockFn clock)
    : config_(std::move(config)), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

std::string ContextPromptEnricher::enrich(int64_t user_id,
                                          const std::string& prompt,
                                          const std::optional<std::string>& session_id) {
    std::vector<std::string> sections;

    std::string lang = config_.language;
    for (auto& c : lang) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (!lang.empty() && lang != "auto") {
        sections.push_back("## Language\nAlways respond in " + config_.language +
                           ", regardless of what language the user writes in.");
    } else {
        sections.push_back("## Language\nDetect the language the user writes in and respond in that same "
                           "language. If they switch languages, follow their lead.");
    }

    std::time_t now = std::chrono::system_clock::to_time_t(clock_());
    std::tm utc{};
    gmtime_r(&now, &utc);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M", &utc);
    sections.push_back(std::string("## Current Context\nTime: ") + stamp +
                       " UTC (Timezone: " + config_.timezone + ")");

    spdlog::debug("Enriched prompt for user {} (session {}) with {} sections",
                  user_id, session_id.value_or("none"), sections.size());

    std::string out;
    for (const auto& section : sections) {
        out += section;
        out += "\n\n";
    }
    out += "---\n\n";
    out += prompt;
    return out;
}

} // namespace agentgate::gateway
