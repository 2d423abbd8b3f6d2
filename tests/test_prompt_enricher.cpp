#include <gtest/gtest.h>
#include "gateway/prompt_enricher.hpp"

using agentgate::gateway::ContextPromptEnricher;
using agentgate::gateway::EnricherConfig;

namespace {

// 2024-03-05 14:07:00 UTC
std::chrono::system_clock::time_point fixed_time() {
    return std::chrono::system_clock::time_point(std::chrono::seconds(1709647620));
}

} // namespace

TEST(ContextPromptEnricher, AutoLanguageFollowsUser) {
    ContextPromptEnricher enricher(EnricherConfig{}, fixed_time);
    auto out = enricher.enrich(1, "fix the build", std::nullopt);

    EXPECT_NE(out.find("## Language\nDetect the language the user writes in"), std::string::npos);
    EXPECT_NE(out.find("## Current Context\nTime: 2024-03-05 14:07 UTC (Timezone: UTC)"), std::string::npos);
    EXPECT_EQ(out.size() - out.rfind("\n\n---\n\nfix the build"), std::string("\n\n---\n\nfix the build").size());
}

TEST(ContextPromptEnricher, ExplicitLanguageAndTimezone) {
    EnricherConfig config;
    config.language = "German";
    config.timezone = "Europe/Berlin";
    ContextPromptEnricher enricher(config, fixed_time);

    auto out = enricher.enrich(1, "hallo", std::string("engine-1"));
    EXPECT_NE(out.find("Always respond in German"), std::string::npos);
    EXPECT_NE(out.find("(Timezone: Europe/Berlin)"), std::string::npos);
    EXPECT_EQ(out.rfind("hallo"), out.size() - 5);
}
