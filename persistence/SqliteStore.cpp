#include "persistence/SqliteStore.hpp"
#include "core/Util.hpp"
#include "core/Logger.hpp"
#include <filesystem>

namespace filesentry {

namespace {

std::string ColumnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

} // namespace

SqliteStore::SqliteStore() = default;

SqliteStore::~SqliteStore() {
    Shutdown();
}

bool SqliteStore::Initialize(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        return true;
    }

    // Create parent directory if needed (skip for :memory:)
    if (db_path != ":memory:") {
        try {
            std::filesystem::path p(db_path);
            if (p.has_parent_path() && !p.parent_path().empty()) {
                std::filesystem::create_directories(p.parent_path());
            }
        } catch (const std::exception& ex) {
            LOG_ERROR("SqliteStore: Failed to create directory for {}: {}", db_path, ex.what());
            return false;
        }
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        LOG_ERROR("SqliteStore: Failed to open database {}: {}", db_path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    CreateSchema();
    PrepareStatements();

    if (!stmt_insert_ || !stmt_count_) {
        LOG_ERROR("SqliteStore: Failed to prepare statements: {}", sqlite3_errmsg(db_));
        FinalizeStatements();
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    LOG_INFO("SqliteStore initialized (db_path={})", db_path);
    return true;
}

void SqliteStore::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    FinalizeStatements();

    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_INFO("SqliteStore shutdown");
    }
}

bool SqliteStore::IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

void SqliteStore::CreateSchema() {
    const char* schema = R"SQL(
        CREATE TABLE IF NOT EXISTS records (
            seq         INTEGER PRIMARY KEY AUTOINCREMENT,
            collection  TEXT    NOT NULL,
            record_id   TEXT    NOT NULL,
            file_id     TEXT,
            timestamp   INTEGER NOT NULL,
            payload     TEXT    NOT NULL
        );

        CREATE INDEX IF NOT EXISTS idx_records_collection ON records(collection, seq);
        CREATE INDEX IF NOT EXISTS idx_records_file ON records(file_id);
        CREATE INDEX IF NOT EXISTS idx_records_record ON records(collection, record_id);
    )SQL";

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, schema, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        LOG_ERROR("SqliteStore: Failed to create schema: {}", err_msg ? err_msg : "unknown");
        sqlite3_free(err_msg);
    }
}

void SqliteStore::PrepareStatements() {
    sqlite3_prepare_v2(db_,
        "INSERT INTO records (collection, record_id, file_id, timestamp, payload) "
        "VALUES (?, ?, ?, ?, ?)",
        -1, &stmt_insert_, nullptr);

    sqlite3_prepare_v2(db_,
        "SELECT COUNT(*) FROM records WHERE collection = ?",
        -1, &stmt_count_, nullptr);
}

void SqliteStore::FinalizeStatements() {
    auto finalize = [](sqlite3_stmt*& stmt) {
        if (stmt) { sqlite3_finalize(stmt); stmt = nullptr; }
    };
    finalize(stmt_insert_);
    finalize(stmt_count_);
}

void SqliteStore::Insert(const StoreRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_ || !stmt_insert_) {
        throw StorageError("SqliteStore: store is not open");
    }
    if (record.collection.empty()) {
        throw StorageError("SqliteStore: record without collection");
    }

    std::string payload = DumpJson(record.data);

    sqlite3_reset(stmt_insert_);
    sqlite3_clear_bindings(stmt_insert_);
    sqlite3_bind_text(stmt_insert_, 1, record.collection.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_, 2, record.record_id.c_str(), -1, SQLITE_TRANSIENT);
    if (record.file_id.empty()) {
        sqlite3_bind_null(stmt_insert_, 3);
    } else {
        sqlite3_bind_text(stmt_insert_, 3, record.file_id.c_str(), -1, SQLITE_TRANSIENT);
    }
    sqlite3_bind_int64(stmt_insert_, 4, static_cast<sqlite3_int64>(record.timestamp));
    sqlite3_bind_text(stmt_insert_, 5, payload.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt_insert_);
    if (rc != SQLITE_DONE) {
        throw StorageError(std::string("SqliteStore: insert into ") + record.collection +
                           " failed: " + sqlite3_errmsg(db_));
    }
}

std::vector<StoreRecord> SqliteStore::Query(const QueryCriteria& criteria) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        throw StorageError("SqliteStore: store is not open");
    }

    std::string sql = "SELECT collection, record_id, file_id, timestamp, payload FROM records WHERE 1=1";
    std::vector<std::string> text_params;
    if (!criteria.collection.empty()) {
        sql += " AND collection = ?";
        text_params.push_back(criteria.collection);
    }
    if (!criteria.file_id.empty()) {
        sql += " AND file_id = ?";
        text_params.push_back(criteria.file_id);
    }
    if (!criteria.record_id.empty()) {
        sql += " AND record_id = ?";
        text_params.push_back(criteria.record_id);
    }
    if (criteria.since > 0) {
        sql += " AND timestamp >= ?";
    }
    if (criteria.until > 0) {
        sql += " AND timestamp <= ?";
    }
    sql += criteria.descending ? " ORDER BY seq DESC" : " ORDER BY seq ASC";
    if (criteria.limit > 0) {
        sql += " LIMIT " + std::to_string(criteria.limit);
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw StorageError(std::string("SqliteStore: query prepare failed: ") + sqlite3_errmsg(db_));
    }

    int index = 1;
    for (const auto& param : text_params) {
        sqlite3_bind_text(stmt, index++, param.c_str(), -1, SQLITE_TRANSIENT);
    }
    if (criteria.since > 0) {
        sqlite3_bind_int64(stmt, index++, static_cast<sqlite3_int64>(criteria.since));
    }
    if (criteria.until > 0) {
        sqlite3_bind_int64(stmt, index++, static_cast<sqlite3_int64>(criteria.until));
    }

    std::vector<StoreRecord> results;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        StoreRecord record;
        record.collection = ColumnText(stmt, 0);
        record.record_id = ColumnText(stmt, 1);
        record.file_id = ColumnText(stmt, 2);
        record.timestamp = static_cast<uint64_t>(sqlite3_column_int64(stmt, 3));

        std::string payload = ColumnText(stmt, 4);
        record.data = nlohmann::json::parse(payload, nullptr, false);
        if (record.data.is_discarded()) {
            LOG_WARN("SqliteStore: Unparseable payload in {} record {}", record.collection, record.record_id);
            record.data = nlohmann::json::object();
        }
        results.push_back(std::move(record));
    }

    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw StorageError(std::string("SqliteStore: query failed: ") + sqlite3_errmsg(db_));
    }
    return results;
}

size_t SqliteStore::Count(const std::string& collection) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_ || !stmt_count_) return 0;

    sqlite3_reset(stmt_count_);
    sqlite3_bind_text(stmt_count_, 1, collection.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt_count_) == SQLITE_ROW) {
        return static_cast<size_t>(sqlite3_column_int64(stmt_count_, 0));
    }
    return 0;
}

} // namespace filesentry
