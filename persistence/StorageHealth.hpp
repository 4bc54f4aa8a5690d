#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace filesentry {

// Counts storage failures that were swallowed at the write site so the
// security decision could proceed.
class StorageHealth {
public:
    void RecordFailure(const std::string& operation, const std::string& message);

    uint64_t AuditWriteFailures() const { return audit_failures_.load(); }
    uint64_t BlobWriteFailures() const { return blob_failures_.load(); }
    uint64_t TotalFailures() const { return audit_failures_.load() + blob_failures_.load(); }

    void RecordBlobFailure(const std::string& key, const std::string& message);

private:
    std::atomic<uint64_t> audit_failures_{0};
    std::atomic<uint64_t> blob_failures_{0};
};

} // namespace filesentry
