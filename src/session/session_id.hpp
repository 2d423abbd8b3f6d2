#pragma once
#include <string>

namespace agentgate::session {

// Session identifier: either a local placeholder (PENDING) handed out before
// the agent engine has produced an id, or the engine-assigned id (ASSIGNED).
// Only ASSIGNED ids are ever offered for resume.
class SessionId {
public:
    enum class Kind {
        PENDING,
        ASSIGNED
    };

    // Fresh placeholder "temp-<uuid>"
    static SessionId pending();

    // Classifies a stored string; "temp-" and "temp_" prefixes are pending
    static SessionId parse(const std::string& value);

    static bool is_placeholder(const std::string& value);

    Kind kind() const { return kind_; }
    bool is_pending() const { return kind_ == Kind::PENDING; }
    bool is_assigned() const { return kind_ == Kind::ASSIGNED; }
    const std::string& str() const { return value_; }

    bool operator==(const SessionId& other) const { return kind_ == other.kind_ && value_ == other.value_; }
    bool operator!=(const SessionId& other) const { return !(*this == other); }

private:
    SessionId(Kind kind, std::string value) : kind_(kind), value_(std::move(value)) {}

    Kind kind_;
    std::string value_;
};

} // namespace agentgate::session
