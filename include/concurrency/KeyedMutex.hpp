#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ci::concurrency {

// Lock table keyed by string (a destination or relative path).
// Entries live only while somebody holds or waits on them.
class KeyedMutex {
    struct Entry {
        std::mutex mutex;
        size_t refs = 0;
    };

public:
    class Guard {
    public:
        Guard(KeyedMutex& owner, std::string key, Entry& entry)
            : owner_(&owner), key_(std::move(key)), entry_(&entry) {
            entry_->mutex.lock();
        }

        ~Guard() { release(); }

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        Guard(Guard&& other) noexcept
            : owner_(other.owner_), key_(std::move(other.key_)), entry_(other.entry_) {
            other.owner_ = nullptr;
            other.entry_ = nullptr;
        }

        Guard& operator=(Guard&&) = delete;

    private:
        void release() {
            if (!entry_) return;
            entry_->mutex.unlock();
            owner_->unref(key_);
            entry_ = nullptr;
            owner_ = nullptr;
        }

        KeyedMutex* owner_;
        std::string key_;
        Entry* entry_;
    };

    [[nodiscard]] Guard lock(const std::string& key) {
        Entry* entry;
        {
            std::scoped_lock lock(mutex_);
            auto& slot = entries_[key];
            if (!slot) slot = std::make_unique<Entry>();
            ++slot->refs;
            entry = slot.get();
        }
        return Guard(*this, key, *entry);
    }

    [[nodiscard]] size_t size() const {
        std::scoped_lock lock(mutex_);
        return entries_.size();
    }

private:
    void unref(const std::string& key) {
        std::scoped_lock lock(mutex_);
        const auto it = entries_.find(key);
        if (it != entries_.end() && --it->second->refs == 0) entries_.erase(it);
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<Entry>> entries_;
};

}
