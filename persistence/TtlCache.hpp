#pragma once

#include "persistence/Storage.hpp"
#include "core/Util.hpp"
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace filesentry {

// In-process reference-data cache. Readers share the lock; writers are
// serialized. Expired entries are reported as misses and dropped on the
// next write.
template<typename V>
class TtlCache : public ReferenceCache<V> {
public:
    using Clock = std::function<uint64_t()>;

    explicit TtlCache(Clock clock = &NowMillis)
        : clock_(std::move(clock)) {}

    std::optional<V> Get(const std::string& key) const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end() || clock_() >= it->second.expires_at) {
            return std::nullopt;
        }
        return it->second.value;
    }

    void Put(const std::string& key, V value, uint64_t ttl_ms) override {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        uint64_t now = clock_();
        PurgeExpiredLocked(now);
        entries_[key] = Entry{std::move(value), now + ttl_ms};
    }

    void Invalidate(const std::string& key) override {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        entries_.erase(key);
    }

    size_t Size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return entries_.size();
    }

private:
    struct Entry {
        V value;
        uint64_t expires_at;
    };

    void PurgeExpiredLocked(uint64_t now) {
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (now >= it->second.expires_at) {
                it = entries_.erase(it);
            } else {
                ++it;
            }
        }
    }

    Clock clock_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace filesentry
