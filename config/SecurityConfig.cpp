#include "config/SecurityConfig.hpp"
#include <yaml-cpp/yaml.h>

namespace filesentry {

namespace {

template<typename T>
void ReadScalar(const YAML::Node& node, const char* key, T& target) {
    if (node && node[key]) {
        target = node[key].as<T>();
    }
}

void LoadWeights(const YAML::Node& node, SeverityWeights& weights) {
    ReadScalar(node, "info", weights.info);
    ReadScalar(node, "low", weights.low);
    ReadScalar(node, "medium", weights.medium);
    ReadScalar(node, "high", weights.high);
    ReadScalar(node, "critical", weights.critical);
}

void LoadThresholds(const YAML::Node& node, RecommendationThresholds& thresholds) {
    ReadScalar(node, "block", thresholds.block);
    ReadScalar(node, "quarantine", thresholds.quarantine);
    ReadScalar(node, "review", thresholds.review);
    ReadScalar(node, "warn", thresholds.warn);
}

void LoadMaskTokens(const YAML::Node& node, MaskTokens& masks) {
    if (!node) return;
    ReadScalar(node, "threat", masks.threat_placeholder);
    ReadScalar(node, "default", masks.default_pii);
    if (node["pii"]) {
        for (const auto& entry : node["pii"]) {
            auto name = entry.first.as<std::string>();
            auto type = PIITypeFromString(name);
            if (!type) {
                throw ConfigurationError("Unknown PII type in mask_tokens: " + name);
            }
            masks.pii[*type] = entry.second.as<std::string>();
        }
    }
}

} // namespace

SecurityConfig LoadSecurityConfig(const std::string& path) {
    SecurityConfig config;
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& ex) {
        throw ConfigurationError("Failed to load config " + path + ": " + ex.what());
    }

    try {
        if (auto detection = root["detection"]) {
            ReadScalar(detection, "enable_malware_detection", config.detection.enable_malware_detection);
            ReadScalar(detection, "enable_pii_detection", config.detection.enable_pii_detection);
            ReadScalar(detection, "enable_behavior_analysis", config.detection.enable_behavior_analysis);
            ReadScalar(detection, "entropy_threshold", config.detection.entropy_threshold);
            ReadScalar(detection, "url_count_threshold", config.detection.url_count_threshold);
            ReadScalar(detection, "header_tolerance", config.detection.header_tolerance);
        }

        if (auto limits = root["limits"]) {
            ReadScalar(limits, "max_scan_size", config.limits.max_scan_size);
            ReadScalar(limits, "scan_timeout_ms", config.limits.scan_timeout_ms);
            ReadScalar(limits, "content_sample_bytes", config.limits.content_sample_bytes);
            ReadScalar(limits, "worker_threads", config.limits.worker_threads);
        }

        if (auto policy = root["policy"]) {
            ReadScalar(policy, "auto_quarantine_threshold", config.policy.auto_quarantine_threshold);
            LoadWeights(policy["severity_weights"], config.tables.weights);
            LoadThresholds(policy["recommendation_thresholds"], config.tables.thresholds);
            LoadMaskTokens(policy["mask_tokens"], config.tables.masks);
        }

        if (auto notifications = root["notifications"]) {
            ReadScalar(notifications, "enabled", config.notifications.enabled);
            if (auto email = notifications["email"]) {
                ReadScalar(email, "enabled", config.notifications.email_enabled);
                ReadScalar(email, "recipients", config.notifications.email_recipients);
            }
            if (auto webhook = notifications["webhook"]) {
                ReadScalar(webhook, "enabled", config.notifications.webhook_enabled);
                ReadScalar(webhook, "url", config.notifications.webhook_url);
            }
        }

        if (auto quarantine = root["quarantine"]) {
            ReadScalar(quarantine, "retention_days", config.quarantine.retention_days);
            ReadScalar(quarantine, "review_deadline_days", config.quarantine.review_deadline_days);
            ReadScalar(quarantine, "access_level", config.quarantine.access_level);
            ReadScalar(quarantine, "review_required", config.quarantine.review_required);
        }

        if (auto persistence = root["persistence"]) {
            ReadScalar(persistence, "database_path", config.persistence.database_path);
            ReadScalar(persistence, "blob_root", config.persistence.blob_root);
            ReadScalar(persistence, "audit_hmac_key", config.persistence.audit_hmac_key);
        }

        if (auto logging = root["logging"]) {
            ReadScalar(logging, "file", config.logging.file);
            ReadScalar(logging, "level", config.logging.level);
            ReadScalar(logging, "max_file_size", config.logging.max_file_size);
            ReadScalar(logging, "max_files", config.logging.max_files);
        }

        if (auto intel = root["intel"]) {
            ReadScalar(intel, "path", config.intel.path);
            ReadScalar(intel, "cache_ttl_ms", config.intel.cache_ttl_ms);
        }
    } catch (const YAML::Exception& ex) {
        throw ConfigurationError("Invalid value in config " + path + ": " + ex.what());
    }

    ValidateSecurityConfig(config);
    return config;
}

void ValidateSecurityConfig(const SecurityConfig& config) {
    const auto& w = config.tables.weights;
    if (!(w.info < w.low && w.low < w.medium && w.medium < w.high && w.high < w.critical)) {
        throw ConfigurationError("severity_weights must be strictly increasing from info to critical");
    }
    if (w.info < 0.0) {
        throw ConfigurationError("severity_weights must not be negative");
    }

    const auto& t = config.tables.thresholds;
    if (!(t.block > t.quarantine && t.quarantine > t.review && t.review > t.warn)) {
        throw ConfigurationError("recommendation_thresholds must be strictly decreasing from block to warn");
    }
    if (t.block > 100) {
        throw ConfigurationError("recommendation_thresholds.block must be at most 100");
    }

    if (config.limits.max_scan_size == 0) {
        throw ConfigurationError("limits.max_scan_size must be positive");
    }
    if (config.limits.content_sample_bytes == 0) {
        throw ConfigurationError("limits.content_sample_bytes must be positive");
    }
    if (config.limits.content_sample_bytes > config.limits.max_scan_size) {
        throw ConfigurationError("limits.content_sample_bytes must not exceed limits.max_scan_size");
    }
    if (config.limits.scan_timeout_ms == 0) {
        throw ConfigurationError("limits.scan_timeout_ms must be positive");
    }
    if (config.policy.auto_quarantine_threshold > 100) {
        throw ConfigurationError("policy.auto_quarantine_threshold must be at most 100");
    }
    if (config.detection.entropy_threshold <= 0.0 || config.detection.entropy_threshold > 8.0) {
        throw ConfigurationError("detection.entropy_threshold must be in (0, 8]");
    }
    if (config.notifications.webhook_enabled && config.notifications.webhook_url.empty()) {
        throw ConfigurationError("notifications.webhook.url is required when the webhook channel is enabled");
    }
    if (config.persistence.audit_hmac_key.empty()) {
        throw ConfigurationError("persistence.audit_hmac_key must not be empty");
    }
}

} // namespace filesentry
