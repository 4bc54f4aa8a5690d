#include "intel/ThreatIntelRepository.hpp"
#include "core/Logger.hpp"
#include "core/Util.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <stdexcept>

namespace filesentry {

namespace {

constexpr const char* kSnapshotKey = "threat_intel_snapshot";

// Latest version of each logical record, in first-seen order.
template<typename T, typename Decode>
std::vector<T> LatestRecords(AuditStore& store, const std::string& collection, Decode decode) {
    QueryCriteria criteria;
    criteria.collection = collection;
    auto records = store.Query(criteria);

    std::vector<std::string> order;
    std::map<std::string, T> latest;
    for (const auto& record : records) {
        try {
            T value = decode(record.data);
            if (latest.find(record.record_id) == latest.end()) {
                order.push_back(record.record_id);
            }
            latest[record.record_id] = std::move(value);
        } catch (const std::exception& ex) {
            LOG_WARN("ThreatIntelRepository: skipping malformed {} record {}: {}",
                     collection, record.record_id, ex.what());
        }
    }

    std::vector<T> values;
    values.reserve(order.size());
    for (const auto& id : order) {
        values.push_back(latest[id]);
    }
    return values;
}

} // namespace

ThreatIntelRepository::ThreatIntelRepository(IntelConfig config, AuditStore* store,
                                             ReferenceCache<SnapshotPtr>* cache)
    : config_(std::move(config)), store_(store), cache_(cache) {
    if (!cache_) {
        owned_cache_ = std::make_unique<TtlCache<SnapshotPtr>>();
        cache_ = owned_cache_.get();
    }
}

SnapshotPtr ThreatIntelRepository::Snapshot() {
    if (auto cached = cache_->Get(kSnapshotKey)) {
        return *cached;
    }

    std::unique_lock<std::mutex> lock(refresh_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        // Another caller is refreshing. Serve the previous snapshot if any.
        if (auto previous = Previous()) {
            return previous;
        }
        lock.lock();
    }

    if (auto cached = cache_->Get(kSnapshotKey)) {
        return *cached;
    }
    return Refresh();
}

SnapshotPtr ThreatIntelRepository::Refresh() {
    SnapshotPtr snapshot;
    try {
        snapshot = CompileSnapshot(LoadDatabase());
    } catch (const std::exception& ex) {
        auto previous = Previous();
        if (!previous) {
            throw;
        }
        LOG_ERROR("ThreatIntelRepository: refresh failed, keeping intel {}: {}", previous->version, ex.what());
        cache_->Put(kSnapshotKey, previous, config_.cache_ttl_ms);
        return previous;
    }

    cache_->Put(kSnapshotKey, snapshot, config_.cache_ttl_ms);
    {
        std::lock_guard<std::mutex> lock(previous_mutex_);
        previous_ = snapshot;
        ++refresh_count_;
    }
    LOG_INFO("Threat intel {} compiled from {} ({} rejected patterns)",
             snapshot->version, snapshot->source, snapshot->rejected_patterns);
    return snapshot;
}

SnapshotPtr ThreatIntelRepository::Previous() const {
    std::lock_guard<std::mutex> lock(previous_mutex_);
    return previous_;
}

uint64_t ThreatIntelRepository::RefreshCount() const {
    std::lock_guard<std::mutex> lock(previous_mutex_);
    return refresh_count_;
}

void ThreatIntelRepository::Invalidate() {
    cache_->Invalidate(kSnapshotKey);
}

bool ThreatIntelRepository::LoadFromStore(ThreatIntelDatabase& database) {
    if (!store_) {
        return false;
    }

    auto signatures = LatestRecords<ThreatSignature>(*store_, kSignatureCollection, SignatureFromJson);
    auto hashes = LatestRecords<MalwareHash>(*store_, kHashCollection, MalwareHashFromJson);
    auto patterns = LatestRecords<PIIPattern>(*store_, kPatternCollection, PIIPatternFromJson);
    if (signatures.empty() && hashes.empty() && patterns.empty()) {
        return false;
    }

    QueryCriteria criteria;
    criteria.collection = kUpdateCollection;
    criteria.limit = 1;
    criteria.descending = true;
    auto updates = store_->Query(criteria);

    ThreatIntelDatabase defaults = DefaultThreatIntel();
    database.version = updates.empty() ? "store" : updates.front().data.value("version", "store");
    database.source = "audit_store";
    database.last_updated = updates.empty() ? NowMillis() : updates.front().timestamp;
    // A collection with no records falls back to the built-in set.
    database.signatures = signatures.empty() ? defaults.signatures : std::move(signatures);
    database.malware_hashes = hashes.empty() ? defaults.malware_hashes : std::move(hashes);
    database.pii_patterns = patterns.empty() ? defaults.pii_patterns : std::move(patterns);
    return true;
}

ThreatIntelDatabase ThreatIntelRepository::LoadDatabase() {
    if (!config_.path.empty()) {
        return LoadThreatIntelFile(config_.path);
    }

    ThreatIntelDatabase database;
    if (LoadFromStore(database)) {
        return database;
    }
    return DefaultThreatIntel();
}

void ThreatIntelRepository::Publish(const ThreatIntelDatabase& database) {
    if (database.version.empty()) {
        throw std::invalid_argument("Threat intel version must not be empty");
    }
    if (!store_) {
        throw StorageError("ThreatIntelRepository: no store configured for publishing");
    }

    uint64_t now = NowMillis();
    for (const auto& signature : database.signatures) {
        StoreRecord record;
        record.collection = kSignatureCollection;
        record.record_id = signature.id;
        record.timestamp = now;
        record.data = signature;
        store_->Insert(record);
    }
    for (const auto& hash : database.malware_hashes) {
        StoreRecord record;
        record.collection = kHashCollection;
        record.record_id = ToLower(hash.hash_type) + ":" + ToLower(hash.hash);
        record.timestamp = now;
        record.data = hash;
        store_->Insert(record);
    }
    for (const auto& pattern : database.pii_patterns) {
        StoreRecord record;
        record.collection = kPatternCollection;
        record.record_id = pattern.id;
        record.timestamp = now;
        record.data = pattern;
        store_->Insert(record);
    }

    StoreRecord update;
    update.collection = kUpdateCollection;
    update.record_id = database.version;
    update.timestamp = now;
    update.data = {
        {"version", database.version},
        {"source", database.source},
        {"signatures_count", database.signatures.size()},
        {"hashes_count", database.malware_hashes.size()},
        {"patterns_count", database.pii_patterns.size()},
        {"last_updated", TimestampToISO8601(now)}
    };
    store_->Insert(update);

    Invalidate();
    LOG_INFO("Published threat intel {} ({} signatures, {} hashes, {} PII patterns)",
             database.version, database.signatures.size(), database.malware_hashes.size(),
             database.pii_patterns.size());
}

} // namespace filesentry
