#pragma once
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>

namespace agentgate::testing {

// Fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
    TempDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "agentgate-test-XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (mkdtemp(buf.data()) == nullptr) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = std::filesystem::canonical(buf.data());
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path mkdir(const std::string& relative) const {
        auto p = path_ / relative;
        std::filesystem::create_directories(p);
        return p;
    }

    std::filesystem::path write(const std::string& relative, const std::string& content) const {
        auto p = path_ / relative;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream out(p);
        out << content;
        return p;
    }

private:
    std::filesystem::path path_;
};

// Manually advanced clock for session tests
class FakeClock {
public:
    FakeClock() : now_(std::chrono::system_clock::time_point(std::chrono::hours(24 * 365 * 50))) {}

    std::chrono::system_clock::time_point now() const { return now_; }
    void advance(std::chrono::system_clock::duration d) { now_ += d; }

    std::function<std::chrono::system_clock::time_point()> fn() {
        return [this] { return now_; };
    }

private:
    std::chrono::system_clock::time_point now_;
};

// Sets or unsets an environment variable for one scope
class ScopedEnv {
public:
    ScopedEnv(const std::string& key, const std::optional<std::string>& value) : key_(key) {
        const char* old = std::getenv(key.c_str());
        if (old) previous_ = std::string(old);
        if (value) {
            setenv(key.c_str(), value->c_str(), 1);
        } else {
            unsetenv(key.c_str());
        }
    }

    ~ScopedEnv() {
        if (previous_) {
            setenv(key_.c_str(), previous_->c_str(), 1);
        } else {
            unsetenv(key_.c_str());
        }
    }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    std::string key_;
    std::optional<std::string> previous_;
};

} // namespace agentgate::testing
