#include "config/SecurityConfig.hpp"
#include "core/Logger.hpp"
#include "core/Util.hpp"
#include "orchestrator/SecurityOrchestrator.hpp"
#include "persistence/FileBlobStore.hpp"
#include "persistence/SqliteStore.hpp"
#include "response/NotificationChannel.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

namespace filesentry {

namespace {

constexpr int kExitAllowed = 0;
constexpr int kExitFailure = 1;
constexpr int kExitBlocked = 2;

struct CommandLine {
    std::string command;
    std::string file;
    std::string config_path{"config/filesentry.yaml"};
    std::string actor{"cli"};
};

void PrintUsage() {
    std::cerr << "Usage:\n"
              << "  filesentry scan <file> [--config <path>] [--actor <id>]\n"
              << "  filesentry verify-audit [--config <path>]\n";
}

bool ParseCommandLine(int argc, char* argv[], CommandLine& cmd) {
    if (argc < 2) {
        return false;
    }
    cmd.command = argv[1];

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            cmd.config_path = argv[++i];
        } else if (arg == "--actor" && i + 1 < argc) {
            cmd.actor = argv[++i];
        } else if (!arg.empty() && arg[0] != '-' && cmd.file.empty()) {
            cmd.file = arg;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return false;
        }
    }

    if (cmd.command == "scan") {
        return !cmd.file.empty();
    }
    return cmd.command == "verify-audit";
}

// Logging is configured from the file, so nothing may log before this returns.
SecurityConfig LoadConfig(const std::string& path, bool& used_defaults) {
    used_defaults = !std::filesystem::exists(path);
    if (used_defaults) {
        SecurityConfig config;
        ValidateSecurityConfig(config);
        return config;
    }
    return LoadSecurityConfig(path);
}

void InitializeLogging(const LoggingConfig& logging) {
    Logger::Initialize(logging.file, logging.max_file_size, logging.max_files);
    Logger::SetLevel(LogLevelFromString(logging.level));
}

std::vector<uint8_t> ReadFileBytes(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open " + path);
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

int RunScan(const CommandLine& cmd, const SecurityConfig& config) {
    SqliteStore store;
    if (!store.Initialize(config.persistence.database_path)) {
        LOG_CRITICAL("Failed to open database {}", config.persistence.database_path);
        return kExitFailure;
    }
    FileBlobStore blobs(config.persistence.blob_root);
    LogNotificationChannel notifier;

    std::vector<uint8_t> bytes;
    try {
        bytes = ReadFileBytes(cmd.file);
    } catch (const std::exception& ex) {
        LOG_ERROR("{}", ex.what());
        return kExitFailure;
    }

    FileMetadata metadata;
    metadata.file_id = std::filesystem::absolute(cmd.file).string();
    metadata.file_name = std::filesystem::path(cmd.file).filename().string();
    metadata.uploader_id = cmd.actor;

    ActorContext actor;
    actor.actor_id = cmd.actor;
    actor.source = "cli";

    SecurityOrchestrator orchestrator(config, &store, &blobs, &notifier);
    UnifiedSecurityResult result = orchestrator.ScanAndRespond(bytes, metadata, actor);

    nlohmann::json output = result;
    std::cout << DumpJson(output, 2) << std::endl;

    if (!result.error.empty()) {
        return kExitFailure;
    }
    return result.blocked ? kExitBlocked : kExitAllowed;
}

int RunVerifyAudit(const SecurityConfig& config) {
    SqliteStore store;
    if (!store.Initialize(config.persistence.database_path)) {
        LOG_CRITICAL("Failed to open database {}", config.persistence.database_path);
        return kExitFailure;
    }

    StorageHealth health;
    AuditLogger audit(&store, config.persistence.audit_hmac_key, &health);
    audit.Initialize();

    bool intact = audit.VerifyIntegrity();
    nlohmann::json output = {
        {"intact", intact},
        {"entries", audit.GetEntryCount()}
    };
    std::cout << DumpJson(output, 2) << std::endl;
    return intact ? kExitAllowed : kExitFailure;
}

} // namespace

} // namespace filesentry

int main(int argc, char* argv[]) {
    filesentry::CommandLine cmd;
    if (!filesentry::ParseCommandLine(argc, argv, cmd)) {
        filesentry::PrintUsage();
        return filesentry::kExitFailure;
    }

    try {
        bool used_defaults = false;
        filesentry::SecurityConfig config = filesentry::LoadConfig(cmd.config_path, used_defaults);
        filesentry::InitializeLogging(config.logging);
        if (used_defaults) {
            LOG_WARN("Config file {} not found, using defaults", cmd.config_path);
        } else {
            LOG_INFO("Loaded configuration from {}", cmd.config_path);
        }

        int code = cmd.command == "scan"
            ? filesentry::RunScan(cmd, config)
            : filesentry::RunVerifyAudit(config);

        filesentry::Logger::Shutdown();
        return code;
    } catch (const std::exception& ex) {
        LOG_CRITICAL("Fatal error: {}", ex.what());
        filesentry::Logger::Shutdown();
        return filesentry::kExitFailure;
    }
}
