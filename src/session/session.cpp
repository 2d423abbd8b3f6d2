#include "session/session.hpp"
#include <algorithm>

using json = nlohmann::json;

namespace agentgate::session {

int64_t to_epoch_ms(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint from_epoch_ms(int64_t ms) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

bool Session::is_expired(std::chrono::seconds timeout, TimePoint now) const {
    return now - last_used > timeout;
}

void Session::merge_tools(const std::vector<std::string>& tools) {
    for (const auto& tool : tools) {
        if (std::find(tools_used.begin(), tools_used.end(), tool) == tools_used.end()) {
            tools_used.push_back(tool);
        }
    }
}

json Session::to_json() const {
    json j;
    j["session_id"] = session_id;
    j["user_id"] = user_id;
    j["project_path"] = project_path;
    j["created_at"] = to_epoch_ms(created_at);
    j["last_used"] = to_epoch_ms(last_used);
    j["total_cost"] = total_cost;
    j["message_count"] = message_count;
    j["tools_used"] = tools_used;
    j["row_id"] = row_id;
    return j;
}

Session Session::from_json(const json& j) {
    Session s;
    s.session_id = j.at("session_id").get<std::string>();
    s.user_id = j.at("user_id").get<int64_t>();
    s.project_path = j.at("project_path").get<std::string>();
    s.created_at = from_epoch_ms(j.value("created_at", int64_t(0)));
    s.last_used = from_epoch_ms(j.value("last_used", int64_t(0)));
    s.total_cost = j.value("total_cost", 0.0);
    s.message_count = j.value("message_count", 0);
    s.tools_used = j.value("tools_used", std::vector<std::string>{});
    s.row_id = j.value("row_id", uint64_t(0));
    return s;
}

} // namespace agentgate::session
