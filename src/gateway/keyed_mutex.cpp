#include "gateway/keyed_mutex.hpp"

namespace agentgate::gateway {

KeyedMutex::Guard::Guard(KeyedMutex* owner, std::string key, std::shared_ptr<Entry> entry)
    : owner_(owner), key_(std::move(key)), entry_(std::move(entry)) {}

KeyedMutex::Guard::Guard(Guard&& other)
    : owner_(other.owner_), key_(std::move(other.key_)), entry_(std::move(other.entry_)) {
    other.owner_ = nullptr;
}

KeyedMutex::Guard::~Guard() {
    if (owner_ && entry_) {
        entry_->mutex.unlock();
        owner_->release(key_, entry_);
    }
}

KeyedMutex::Guard KeyedMutex::lock(const std::string& key) {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = entries_[key];
        if (!slot) {
            slot = std::make_shared<Entry>();
        }
        slot->refs++;
        entry = slot;
    }

    entry->mutex.lock();
    return Guard(this, key, entry);
}

size_t KeyedMutex::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

bool KeyedMutex::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(key) > 0;
}

void KeyedMutex::release(const std::string& key, const std::shared_ptr<Entry>& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (--entry->refs == 0) {
        auto it = entries_.find(key);
        if (it != entries_.end() && it->second == entry) {
            entries_.erase(it);
        }
    }
}

} // namespace agentgate::gateway
