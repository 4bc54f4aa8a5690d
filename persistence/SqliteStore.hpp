#pragma once

#include "persistence/Storage.hpp"
#include <sqlite3.h>
#include <mutex>
#include <string>
#include <vector>

namespace filesentry {

// SQLite-backed AuditStore. All collections share one append-only table;
// payloads are stored as JSON text.
class SqliteStore : public AuditStore {
public:
    SqliteStore();
    ~SqliteStore() override;

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    bool Initialize(const std::string& db_path = "data/filesentry.db");
    void Shutdown();
    bool IsOpen() const;

    void Insert(const StoreRecord& record) override;
    std::vector<StoreRecord> Query(const QueryCriteria& criteria) override;

    size_t Count(const std::string& collection);

private:
    void CreateSchema();
    void PrepareStatements();
    void FinalizeStatements();

    sqlite3* db_{nullptr};
    mutable std::mutex mutex_;

    sqlite3_stmt* stmt_insert_{nullptr};
    sqlite3_stmt* stmt_count_{nullptr};
};

} // namespace filesentry
