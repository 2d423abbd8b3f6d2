#include "core/errors.hpp"
#include <algorithm>
#include <cctype>

namespace agentgate {

namespace {

// TODO: switch to a coded fault once the agent CLI reports one for unknown sessions.
const char* const STALE_SESSION_MARKERS[] = {
    "no conversation found",
    "conversation not found",
};

} // namespace

bool is_stale_session_error(const std::exception& error) {
    if (dynamic_cast<const StaleSessionError*>(&error) != nullptr) {
        return true;
    }

    std::string message = error.what();
    std::transform(message.begin(), message.end(), message.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const char* marker : STALE_SESSION_MARKERS) {
        if (message.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace agentgate
