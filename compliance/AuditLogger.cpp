#include "compliance/AuditLogger.hpp"
#include "core/Logger.hpp"
#include "core/Util.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <map>

namespace filesentry {

AuditLogger::AuditLogger(AuditStore* store, std::string hmac_key, StorageHealth* health)
    : store_(store), hmac_key_(std::move(hmac_key)), health_(health) {}

void AuditLogger::Initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_hash_ = kGenesisHash;
    entry_count_ = 0;
    if (!store_) {
        return;
    }

    try {
        QueryCriteria criteria;
        criteria.collection = kAuditCollection;
        auto records = store_->Query(criteria);
        if (!records.empty()) {
            last_hash_ = records.back().data.value("entry_hash", std::string(kGenesisHash));
            entry_count_ = records.size();
        }
    } catch (const StorageError& ex) {
        if (health_) health_->RecordFailure("audit_initialize", ex.what());
    }

    LOG_INFO("AuditLogger initialized (chain_tip={}, entries={})",
             last_hash_.substr(0, 16), entry_count_.load());
}

void AuditLogger::LogEvent(AuditEventType type, const std::string& actor,
                           const std::string& target, const nlohmann::json& details) {
    LogAction(AuditEventTypeToString(type), actor, target, DumpJson(details));
}

void AuditLogger::LogAction(const std::string& action, const std::string& actor,
                            const std::string& target, const std::string& details) {
    // The chain order must match insert order, so the lock spans the write.
    std::lock_guard<std::mutex> lock(mutex_);

    AuditEntry entry;
    entry.timestamp = NowMillis();
    // Hashed fields must survive the store's JSON round trip unchanged.
    entry.action = ToValidUtf8(action);
    entry.actor = ToValidUtf8(actor);
    entry.target = ToValidUtf8(target);
    entry.details = ToValidUtf8(details);
    entry.prev_hash = last_hash_;
    entry.entry_hash = ComputeEntryHash(entry);

    if (store_) {
        StoreRecord record;
        record.collection = kAuditCollection;
        record.record_id = entry.entry_hash;
        record.file_id = entry.target;
        record.timestamp = entry.timestamp;
        record.data = {
            {"timestamp", TimestampToISO8601(entry.timestamp)},
            {"action", entry.action},
            {"actor", entry.actor},
            {"target", entry.target},
            {"details", entry.details},
            {"prev_hash", entry.prev_hash},
            {"entry_hash", entry.entry_hash}
        };
        try {
            store_->Insert(record);
        } catch (const StorageError& ex) {
            if (health_) health_->RecordFailure("audit_log", ex.what());
            return;
        }
    }

    last_hash_ = entry.entry_hash;
    entry_count_++;

    LOG_DEBUG("AuditLogger: action={} actor={} target={}", entry.action, entry.actor, entry.target);
}

void AuditLogger::RecordResponse(const ThreatResponse& response) {
    StoreRecord record;
    record.collection = kResponseCollection;
    record.record_id = response.id;
    record.file_id = response.details.original.file_id;
    record.timestamp = response.timestamp;
    record.data = response;
    Write(record, "threat_responses");
}

void AuditLogger::RecordSecurityEvent(const std::string& file_id, const std::string& event_type,
                                      const nlohmann::json& details) {
    StoreRecord record;
    record.collection = kSecurityEventCollection;
    record.record_id = GenerateUUID();
    record.file_id = file_id;
    record.timestamp = NowMillis();
    record.data = {
        {"event_type", event_type},
        {"file_id", file_id},
        {"timestamp", TimestampToISO8601(record.timestamp)},
        {"details", details}
    };
    Write(record, "security_events");
}

void AuditLogger::Write(const StoreRecord& record, const char* operation) {
    if (!store_) {
        return;
    }
    try {
        store_->Insert(record);
    } catch (const StorageError& ex) {
        if (health_) health_->RecordFailure(operation, ex.what());
    }
}

bool AuditLogger::VerifyIntegrity() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!store_) {
        LOG_ERROR("AuditLogger: Cannot verify integrity without a store");
        return false;
    }

    std::vector<StoreRecord> records;
    try {
        QueryCriteria criteria;
        criteria.collection = kAuditCollection;
        records = store_->Query(criteria);
    } catch (const StorageError& ex) {
        LOG_ERROR("AuditLogger: Failed to read audit chain: {}", ex.what());
        return false;
    }

    if (records.empty()) {
        LOG_INFO("AuditLogger: No entries to verify");
        return true;
    }

    std::map<std::string, AuditEntry> by_prev;
    for (const auto& record : records) {
        AuditEntry entry = EntryFromRecord(record);
        if (!by_prev.emplace(entry.prev_hash, entry).second) {
            LOG_ERROR("AuditLogger: Chain forks at prev_hash={}", entry.prev_hash.substr(0, 16));
            return false;
        }
    }

    std::string expected_prev = kGenesisHash;
    size_t walked = 0;
    for (auto it = by_prev.find(expected_prev); it != by_prev.end(); it = by_prev.find(expected_prev)) {
        const AuditEntry& entry = it->second;
        std::string computed = ComputeEntryHash(entry);
        if (computed != entry.entry_hash) {
            LOG_ERROR("AuditLogger: HMAC mismatch at entry {} (expected={}, got={})",
                      walked, entry.entry_hash.substr(0, 16), computed.substr(0, 16));
            return false;
        }
        expected_prev = entry.entry_hash;
        ++walked;
    }

    if (walked != records.size()) {
        LOG_ERROR("AuditLogger: Chain broken after {} of {} entries", walked, records.size());
        return false;
    }

    LOG_INFO("AuditLogger: Integrity verified ({} entries)", walked);
    return true;
}

std::vector<AuditEntry> AuditLogger::QueryEntries(uint64_t start_time, uint64_t end_time,
                                                  size_t limit) {
    if (!store_) return {};

    QueryCriteria criteria;
    criteria.collection = kAuditCollection;
    criteria.since = start_time;
    criteria.until = end_time;
    criteria.limit = limit;

    std::vector<AuditEntry> result;
    try {
        for (const auto& record : store_->Query(criteria)) {
            result.push_back(EntryFromRecord(record));
        }
    } catch (const StorageError& ex) {
        LOG_ERROR("AuditLogger: Query failed: {}", ex.what());
    }
    return result;
}

size_t AuditLogger::GetEntryCount() const {
    return entry_count_.load();
}

AuditEntry AuditLogger::EntryFromRecord(const StoreRecord& record) {
    AuditEntry entry;
    entry.timestamp = record.timestamp;
    entry.action = record.data.value("action", "");
    entry.actor = record.data.value("actor", "");
    entry.target = record.data.value("target", "");
    entry.details = record.data.value("details", "");
    entry.prev_hash = record.data.value("prev_hash", "");
    entry.entry_hash = record.data.value("entry_hash", "");
    return entry;
}

// --- HMAC computation ---

std::string AuditLogger::ComputeHMAC(const std::string& data) const {
    unsigned char result[EVP_MAX_MD_SIZE];
    unsigned int result_len = 0;

    HMAC(EVP_sha256(),
         hmac_key_.c_str(), static_cast<int>(hmac_key_.size()),
         reinterpret_cast<const unsigned char*>(data.c_str()),
         data.size(),
         result, &result_len);

    return HexEncode(result, result_len);
}

std::string AuditLogger::ComputeEntryHash(const AuditEntry& entry) const {
    // ISO8601 timestamp so the hash can be recomputed from the stored payload.
    std::string data;
    data += TimestampToISO8601(entry.timestamp);
    data += "|";
    data += entry.action;
    data += "|";
    data += entry.actor;
    data += "|";
    data += entry.target;
    data += "|";
    data += entry.details;
    data += "|";
    data += entry.prev_hash;

    return ComputeHMAC(data);
}

} // namespace filesentry
