#pragma once

#include "persistence/Storage.hpp"
#include "response/NotificationChannel.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace filesentry {
namespace test {

// AuditStore over a vector. Insert can be made to fail, and tests may edit
// stored records directly to simulate tampering.
class MemoryAuditStore : public AuditStore {
public:
    void Insert(const StoreRecord& record) override {
        if (fail_inserts) {
            throw StorageError("simulated insert failure");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(record);
    }

    std::vector<StoreRecord> Query(const QueryCriteria& criteria) override {
        if (fail_queries) {
            throw StorageError("simulated query failure");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<StoreRecord> out;
        for (const auto& record : records_) {
            if (!criteria.collection.empty() && record.collection != criteria.collection) continue;
            if (!criteria.file_id.empty() && record.file_id != criteria.file_id) continue;
            if (!criteria.record_id.empty() && record.record_id != criteria.record_id) continue;
            if (criteria.since > 0 && record.timestamp < criteria.since) continue;
            if (criteria.until > 0 && record.timestamp > criteria.until) continue;
            out.push_back(record);
        }
        if (criteria.descending) {
            std::vector<StoreRecord> reversed(out.rbegin(), out.rend());
            out.swap(reversed);
        }
        if (criteria.limit > 0 && out.size() > criteria.limit) {
            out.resize(criteria.limit);
        }
        return out;
    }

    std::vector<StoreRecord>& Records() { return records_; }

    size_t CountIn(const std::string& collection) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& record : records_) {
            if (record.collection == collection) ++n;
        }
        return n;
    }

    std::atomic<bool> fail_inserts{false};
    std::atomic<bool> fail_queries{false};

private:
    std::mutex mutex_;
    std::vector<StoreRecord> records_;
};

class MemoryBlobStore : public BlobStore {
public:
    void Put(const std::string& key, const std::vector<uint8_t>& bytes,
             const BlobMetadata& metadata) override {
        if (fail_puts) {
            throw StorageError("simulated blob failure");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        blobs_[key] = Blob{bytes, metadata};
    }

    std::optional<Blob> Get(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = blobs_.find(key);
        if (it == blobs_.end()) return std::nullopt;
        return it->second;
    }

    bool Delete(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return blobs_.erase(key) > 0;
    }

    std::vector<std::string> Keys() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> keys;
        for (const auto& entry : blobs_) keys.push_back(entry.first);
        return keys;
    }

    std::atomic<bool> fail_puts{false};

private:
    std::mutex mutex_;
    std::map<std::string, Blob> blobs_;
};

class RecordingChannel : public NotificationChannel {
public:
    struct Sent {
        std::string recipient;
        std::string method;
        std::string message;
    };

    DeliveryStatus Send(const std::string& recipient, const std::string& method,
                        const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        sent.push_back({recipient, method, message});
        if (fail) {
            return {false, "unreachable"};
        }
        return {true, "sent"};
    }

    std::vector<Sent> sent;
    bool fail{false};

private:
    std::mutex mutex_;
};

} // namespace test
} // namespace filesentry
