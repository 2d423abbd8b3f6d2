#pragma once
#include <filesystem>
#include <mutex>
#include "session/memory_session_store.hpp"

namespace agentgate::session {

// InMemorySessionStore mirrored to a JSON file. The whole table is written
// after every successful mutation (temp file + rename) and read back on
// construction. I/O failures throw SessionError and leave the table as it
// was before the call.
class JsonFileSessionStore : public InMemorySessionStore {
public:
    explicit JsonFileSessionStore(std::filesystem::path file_path);

    bool create(const Session& session) override;
    bool update(const std::string& session_id, const SessionPatch& patch) override;
    bool erase(const std::string& session_id) override;

    const std::filesystem::path& file_path() const { return file_path_; }

private:
    std::filesystem::path file_path_;
    std::mutex write_mutex_;        // mutation + flush as one step

    void load();
    void flush();
};

} // namespace agentgate::session
