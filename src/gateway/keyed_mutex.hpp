#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace agentgate::gateway {

// One mutex per key, created on first use and dropped when the last
// holder or waiter releases it.
class KeyedMutex {
    struct Entry {
        std::mutex mutex;
        size_t refs = 0;
    };

public:
    // Holds the lock for one key until destroyed
    class Guard {
    public:
        Guard(Guard&& other);
        Guard& operator=(Guard&&) = delete;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        ~Guard();

    private:
        friend class KeyedMutex;
        Guard(KeyedMutex* owner, std::string key, std::shared_ptr<Entry> entry);

        KeyedMutex* owner_;
        std::string key_;
        std::shared_ptr<Entry> entry_;
    };

    Guard lock(const std::string& key);

    // Keys currently held or waited on
    size_t size() const;

    // True while the key is held or waited on
    bool contains(const std::string& key) const;

private:
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
    mutable std::mutex mutex_;

    void release(const std::string& key, const std::shared_ptr<Entry>& entry);
};

} // namespace agentgate::gateway
