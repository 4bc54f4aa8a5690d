#pragma once

#include "config/SecurityConfig.hpp"
#include "intel/ThreatIntel.hpp"
#include "persistence/Storage.hpp"
#include "persistence/TtlCache.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace filesentry {

using SnapshotPtr = std::shared_ptr<const ThreatIntelSnapshot>;

// Source of the reference data every scan reads. Sources, in order: the
// configured YAML intel file, records in the audit store, built-in
// defaults. The compiled snapshot is cached with a TTL; one caller
// refreshes on expiry while others keep reading the previous snapshot.
class ThreatIntelRepository {
public:
    static constexpr const char* kSignatureCollection = "threat_signatures";
    static constexpr const char* kHashCollection = "malware_hashes";
    static constexpr const char* kPatternCollection = "pii_patterns";
    static constexpr const char* kUpdateCollection = "intel_updates";

    ThreatIntelRepository(IntelConfig config, AuditStore* store,
                          ReferenceCache<SnapshotPtr>* cache = nullptr);

    SnapshotPtr Snapshot();

    // Persists `database` as the current reference data and drops the
    // cached snapshot. Throws StorageError or std::invalid_argument.
    void Publish(const ThreatIntelDatabase& database);

    void Invalidate();

    ThreatIntelDatabase LoadDatabase();

    uint64_t RefreshCount() const;

private:
    SnapshotPtr Refresh();
    SnapshotPtr Previous() const;
    bool LoadFromStore(ThreatIntelDatabase& database);

    IntelConfig config_;
    AuditStore* store_{nullptr};

    std::unique_ptr<TtlCache<SnapshotPtr>> owned_cache_;
    ReferenceCache<SnapshotPtr>* cache_{nullptr};

    std::mutex refresh_mutex_;
    mutable std::mutex previous_mutex_;
    SnapshotPtr previous_;
    uint64_t refresh_count_{0};
};

} // namespace filesentry
