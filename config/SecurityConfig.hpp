#pragma once

#include "config/PolicyTables.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace filesentry {

class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

struct DetectionConfig {
    bool enable_malware_detection{true};
    bool enable_pii_detection{true};
    bool enable_behavior_analysis{true};
    double entropy_threshold{7.5};
    size_t url_count_threshold{20};
    size_t header_tolerance{100};
};

struct LimitsConfig {
    uint64_t max_scan_size{50ull * 1024 * 1024};
    uint64_t scan_timeout_ms{30000};
    size_t content_sample_bytes{256 * 1024};
    size_t worker_threads{0};  // 0 selects ThreadPool::DefaultThreadCount()
};

struct PolicyConfig {
    uint32_t auto_quarantine_threshold{85};
};

struct NotificationConfig {
    bool enabled{true};
    bool email_enabled{false};
    std::vector<std::string> email_recipients;
    bool webhook_enabled{false};
    std::string webhook_url;
};

struct QuarantineConfig {
    uint32_t retention_days{30};
    uint32_t review_deadline_days{7};
    std::string access_level{"security"};
    bool review_required{true};
};

struct PersistenceConfig {
    std::string database_path{"data/filesentry.db"};
    std::string blob_root{"data/blobs"};
    std::string audit_hmac_key{"filesentry-default-hmac-key-change-in-production"};
};

struct LoggingConfig {
    std::string file{"logs/filesentry.log"};
    std::string level{"info"};
    size_t max_file_size{10 * 1024 * 1024};
    size_t max_files{5};
};

struct IntelConfig {
    std::string path;  // optional YAML intel file
    uint64_t cache_ttl_ms{5 * 60 * 1000};
};

struct SecurityConfig {
    DetectionConfig detection;
    LimitsConfig limits;
    PolicyConfig policy;
    NotificationConfig notifications;
    QuarantineConfig quarantine;
    PersistenceConfig persistence;
    LoggingConfig logging;
    IntelConfig intel;
    PolicyTables tables;
};

// Reads a YAML file; keys absent from the file keep their defaults.
// Throws ConfigurationError on unreadable files or invalid values.
SecurityConfig LoadSecurityConfig(const std::string& path);

// Throws ConfigurationError describing the first violated constraint.
void ValidateSecurityConfig(const SecurityConfig& config);

} // namespace filesentry
