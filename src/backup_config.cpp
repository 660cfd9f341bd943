#include "backup_config.hpp"
#include "time_format.hpp"
#include <filesystem>
#include <format>
#include <fstream>
#include <mutex>
#include <print>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

std::mutex gLogMutex;

std::string timestampNow() {
    return formatLocalTime(std::chrono::system_clock::now(), "%Y-%m-%d %H:%M:%S");
}

std::vector<std::string> readStringArray(const Json::Value& array) {
    std::vector<std::string> values;
    for (const auto& item : array) {
        values.push_back(item.asString());
    }
    return values;
}

} // namespace

BackupConfig::BackupConfig()
    : sourcePath(fs::current_path().string()),
      cronExpression("0 0 */7 * *"),
      maxBackups(5),
      checkInterval(std::chrono::seconds(60)) {}

BackupConfig::BackupConfig(const std::string& configFile) : BackupConfig() {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        throw std::runtime_error(std::format("Failed to open config file: {}", configFile));
    }
    Json::Value configJson;
    Json::Reader reader;
    if (!reader.parse(file, configJson)) {
        throw std::runtime_error(
            std::format("Failed to parse config file: {}: {}", configFile, reader.getFormattedErrorMessages()));
    }
    load(configJson);
}

BackupConfig BackupConfig::fromJson(const Json::Value& configJson) {
    BackupConfig config;
    config.load(configJson);
    return config;
}

void BackupConfig::load(const Json::Value& configJson) {
    if (!configJson.isObject()) {
        throw std::runtime_error("Configuration root must be a JSON object");
    }

    std::string source = configJson.get("source_path", "").asString();
    if (!source.empty()) {
        sourcePath = source;
    }
    backupPath = configJson.get("backup_path", "").asString();
    cronExpression = configJson.get("cron_expression", cronExpression).asString();

    maxBackups = configJson.get("max_backups", maxBackups).asInt();
    if (maxBackups < 1) {
        throw std::runtime_error(std::format("max_backups must be at least 1, got {}", maxBackups));
    }

    excludeDirs = readStringArray(configJson["exclude_dirs"]);
    excludeExtensions = readStringArray(configJson["exclude_extensions"]);

    int intervalSeconds = configJson.get("check_interval_seconds", 60).asInt();
    if (intervalSeconds < 1) {
        throw std::runtime_error(std::format("check_interval_seconds must be at least 1, got {}", intervalSeconds));
    }
    checkInterval = std::chrono::seconds(intervalSeconds);

    logFile = configJson.get("log_file", "").asString();
    errorLogFile = configJson.get("error_log_file", "").asString();
    telegramConfig = configJson["telegram"];
}

void BackupConfig::appendToFile(const std::string& path, const std::string& entry) const {
    if (path.empty()) {
        return;
    }
    std::ofstream log(path, std::ios::app);
    if (log.is_open()) {
        log << entry << '\n';
        log.flush();
    } else {
        std::println(stderr, "Error: Cannot write to log file: {}", path);
    }
}

void BackupConfig::logMessage(const std::string& message) const {
    std::string logEntry = std::format("[{}] {}", timestampNow(), message);
    std::lock_guard<std::mutex> lock(gLogMutex);
    std::println("{}", logEntry);
    appendToFile(logFile, logEntry);
}

void BackupConfig::logWarning(const std::string& message) const {
    std::string logEntry = std::format("[{}] WARNING: {}", timestampNow(), message);
    std::lock_guard<std::mutex> lock(gLogMutex);
    std::println(stderr, "{}", logEntry);
    appendToFile(logFile, logEntry);
}

void BackupConfig::logError(const std::string& message) const {
    std::string logEntry = std::format("[{}] ERROR: {}", timestampNow(), message);
    std::lock_guard<std::mutex> lock(gLogMutex);
    std::println(stderr, "{}", logEntry);
    appendToFile(errorLogFile.empty() ? logFile : errorLogFile, logEntry);
}

std::string BackupConfig::getBackupDir() const {
    fs::path source = fs::absolute(sourcePath).lexically_normal();
    if (!source.has_filename()) {
        source = source.parent_path();
    }
    fs::path parent = source.parent_path();

    if (backupPath.empty()) {
        return parent.string();
    }
    fs::path configured(backupPath);
    if (configured.is_absolute()) {
        return configured.lexically_normal().string();
    }
    return (parent / configured).lexically_normal().string();
}

ExclusionRuleSet BackupConfig::getExclusionRules() const {
    return ExclusionRuleSet::withDefaults(excludeDirs, excludeExtensions);
}
