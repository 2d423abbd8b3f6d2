#include "session/session_id.hpp"
#include <iomanip>
#include <random>
#include <sstream>

namespace agentgate::session {

namespace {

const char* const PLACEHOLDER_PREFIXES[] = {"temp-", "temp_"};

// Random version-4 UUID
std::string random_uuid() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t hi = dist(rng);
    uint64_t lo = dist(rng);

    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream ss;
    ss << std::hex << std::setfill('0')
       << std::setw(8) << (hi >> 32) << '-'
       << std::setw(4) << ((hi >> 16) & 0xFFFF) << '-'
       << std::setw(4) << (hi & 0xFFFF) << '-'
       << std::setw(4) << (lo >> 48) << '-'
       << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return ss.str();
}

} // namespace

SessionId SessionId::pending() {
    return SessionId(Kind::PENDING, "temp-" + random_uuid());
}

SessionId SessionId::parse(const std::string& value) {
    if (value.empty() || is_placeholder(value)) {
        return SessionId(Kind::PENDING, value);
    }
    return SessionId(Kind::ASSIGNED, value);
}

bool SessionId::is_placeholder(const std::string& value) {
    for (const char* prefix : PLACEHOLDER_PREFIXES) {
        if (value.rfind(prefix, 0) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace agentgate::session
