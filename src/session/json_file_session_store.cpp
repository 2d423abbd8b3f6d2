#include "session/json_file_session_store.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <fstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace agentgate::session {

JsonFileSessionStore::JsonFileSessionStore(fs::path file_path)
    : file_path_(std::move(file_path)) {
    load();
}

bool JsonFileSessionStore::create(const Session& session) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!InMemorySessionStore::create(session)) {
        return false;
    }
    try {
        flush();
    } catch (const std::exception&) {
        InMemorySessionStore::erase(session.session_id);
        throw;
    }
    return true;
}

bool JsonFileSessionStore::update(const std::string& session_id, const SessionPatch& patch) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto before = InMemorySessionStore::get(session_id);
    if (!InMemorySessionStore::update(session_id, patch)) {
        return false;
    }
    try {
        flush();
    } catch (const std::exception&) {
        if (patch.session_id && *patch.session_id != session_id) {
            InMemorySessionStore::erase(*patch.session_id);
        }
        restore(*before);
        throw;
    }
    return true;
}

bool JsonFileSessionStore::erase(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto before = InMemorySessionStore::get(session_id);
    if (!InMemorySessionStore::erase(session_id)) {
        return false;
    }
    try {
        flush();
    } catch (const std::exception&) {
        restore(*before);
        throw;
    }
    return true;
}

void JsonFileSessionStore::load() {
    std::error_code ec;
    if (!fs::exists(file_path_, ec)) {
        spdlog::debug("Session file {} not found, starting empty", file_path_.string());
        return;
    }

    std::ifstream file(file_path_);
    if (!file.is_open()) {
        throw SessionError("Failed to open session file: " + file_path_.string());
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        throw SessionError("Corrupt session file " + file_path_.string() + ": " + e.what());
    }

    if (!j.contains("sessions") || !j["sessions"].is_array()) {
        throw SessionError("Session file has no sessions array: " + file_path_.string());
    }

    size_t loaded = 0;
    for (const auto& entry : j["sessions"]) {
        try {
            restore(Session::from_json(entry));
            loaded++;
        } catch (const json::exception& e) {
            spdlog::warn("Skipping malformed session record in {}: {}", file_path_.string(), e.what());
        }
    }
    spdlog::info("Loaded {} sessions from {}", loaded, file_path_.string());
}

void JsonFileSessionStore::flush() {
    json j;
    j["version"] = 1;
    j["sessions"] = json::array();
    for (const auto& session : list_all()) {
        j["sessions"].push_back(session.to_json());
    }

    std::error_code ec;
    if (file_path_.has_parent_path()) {
        fs::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            spdlog::error("Failed to create session directory {}: {}",
                          file_path_.parent_path().string(), ec.message());
            throw SessionError("Failed to create session directory: " + ec.message());
        }
    }

    fs::path tmp_path = file_path_;
    tmp_path += ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::trunc);
        if (!file.is_open()) {
            spdlog::error("Failed to open {} for writing", tmp_path.string());
            throw SessionError("Failed to write session file: " + tmp_path.string());
        }
        file << j.dump(2);
        if (!file.good()) {
            throw SessionError("Failed to write session file: " + tmp_path.string());
        }
    }

    fs::rename(tmp_path, file_path_, ec);
    if (ec) {
        spdlog::error("Failed to replace session file {}: {}", file_path_.string(), ec.message());
        throw SessionError("Failed to replace session file: " + ec.message());
    }
}

} // namespace agentgate::session
