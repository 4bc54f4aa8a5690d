#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace filesentry {

class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& message)
        : std::runtime_error(message) {}
};

using BlobMetadata = std::map<std::string, std::string>;

struct Blob {
    std::vector<uint8_t> bytes;
    BlobMetadata metadata;
};

// Content-addressed by caller-chosen keys. Put of an existing key replaces it.
class BlobStore {
public:
    virtual ~BlobStore() = default;

    virtual void Put(const std::string& key,
                     const std::vector<uint8_t>& bytes,
                     const BlobMetadata& metadata) = 0;
    virtual std::optional<Blob> Get(const std::string& key) = 0;
    virtual bool Delete(const std::string& key) = 0;
};

struct StoreRecord {
    std::string collection;
    std::string record_id;
    std::string file_id;
    uint64_t timestamp{0};
    nlohmann::json data;
};

// Empty fields do not filter. A zero timestamp bound is open.
struct QueryCriteria {
    std::string collection;
    std::string file_id;
    std::string record_id;
    uint64_t since{0};
    uint64_t until{0};
    size_t limit{0};
    bool descending{false};
};

// Append-only relational store. Records sharing (collection, record_id)
// are versions of one logical record; Query returns all of them.
class AuditStore {
public:
    virtual ~AuditStore() = default;

    virtual void Insert(const StoreRecord& record) = 0;
    virtual std::vector<StoreRecord> Query(const QueryCriteria& criteria) = 0;
};

template<typename V>
class ReferenceCache {
public:
    virtual ~ReferenceCache() = default;

    virtual std::optional<V> Get(const std::string& key) const = 0;
    virtual void Put(const std::string& key, V value, uint64_t ttl_ms) = 0;
    virtual void Invalidate(const std::string& key) = 0;
};

} // namespace filesentry
