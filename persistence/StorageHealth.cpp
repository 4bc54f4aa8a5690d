#include "persistence/StorageHealth.hpp"
#include "core/Logger.hpp"

namespace filesentry {

void StorageHealth::RecordFailure(const std::string& operation, const std::string& message) {
    audit_failures_.fetch_add(1);
    LOG_ERROR("Storage write failed ({}): {}", operation, message);
    Logger::Fallback("audit write failed (" + operation + "): " + message);
}

void StorageHealth::RecordBlobFailure(const std::string& key, const std::string& message) {
    blob_failures_.fetch_add(1);
    LOG_ERROR("Blob write failed (key={}): {}", key, message);
    Logger::Fallback("blob write failed (" + key + "): " + message);
}

} // namespace filesentry
