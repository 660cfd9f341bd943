#include "retention.hpp"
#include "file_backup.hpp"
#include "time_format.hpp"
#include <algorithm>
#include <filesystem>
#include <format>
#include <tuple>
#include <utility>

namespace fs = std::filesystem;

RetentionManager::RetentionManager(const BackupConfig& config, Remover remover)
    : config(config), remover(std::move(remover)) {
    if (!this->remover) {
        this->remover = [](const fs::path& path, std::error_code& ec) { return fs::remove(path, ec); };
    }
}

std::expected<std::vector<BackupFileRecord>, BackupError>
RetentionManager::listBackups(const std::string& backupDir) const {
    std::vector<BackupFileRecord> records;
    std::error_code ec;
    if (!fs::exists(backupDir, ec)) {
        return records;
    }

    fs::directory_iterator it(backupDir, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::string name = it->path().filename().string();
        std::error_code entryEc;
        if (!isBackupFileName(name) || !it->is_regular_file(entryEc)) {
            continue;
        }
        BackupFileRecord record;
        record.fileName = name;
        record.path = fs::absolute(it->path()).string();
        record.sizeBytes = it->file_size(entryEc);
        auto modified = entryEc ? fs::file_time_type() : it->last_write_time(entryEc);
        if (entryEc) {
            // Deleted between listing and stat.
            config.logWarning(std::format("Skipping backup that cannot be inspected: {} (error: {})", record.path,
                                          entryEc.message()));
            continue;
        }
        record.modified = toSystemTime(modified);
        records.push_back(std::move(record));
    }
    if (ec) {
        std::string errorMsg = std::format("Failed to list backup directory: {} (error: {})", backupDir, ec.message());
        config.logError(errorMsg);
        return std::unexpected(BackupError{BackupErrorKind::IOError, errorMsg});
    }

    std::sort(records.begin(), records.end(), [](const BackupFileRecord& a, const BackupFileRecord& b) {
        return std::tie(a.modified, a.fileName) < std::tie(b.modified, b.fileName);
    });
    return records;
}

std::expected<RetentionReport, BackupError> RetentionManager::enforce(const std::string& backupDir,
                                                                      int maxBackups) const {
    if (maxBackups < 1) {
        std::string errorMsg = std::format("Retention count must be at least 1, got {}", maxBackups);
        config.logError(errorMsg);
        return std::unexpected(BackupError{BackupErrorKind::InvalidConfiguration, errorMsg});
    }

    auto backups = listBackups(backupDir);
    if (!backups) {
        return std::unexpected(backups.error());
    }

    RetentionReport report;
    if (backups->size() <= static_cast<std::size_t>(maxBackups)) {
        return report;
    }

    std::size_t surplus = backups->size() - static_cast<std::size_t>(maxBackups);
    for (std::size_t i = 0; i < surplus; ++i) {
        const auto& record = (*backups)[i];
        std::error_code ec;
        if (remover(record.path, ec) && !ec) {
            config.logMessage(std::format("Removed old backup: {}", record.path));
            report.deleted.push_back(record.fileName);
            continue;
        }
        std::string reason = ec ? ec.message() : "file no longer exists";
        std::string errorMsg = std::format("Failed to remove old backup: {} (error: {})", record.path, reason);
        config.logWarning(errorMsg);
        report.failures.push_back({record.fileName, BackupError{BackupErrorKind::DeletionFailure, errorMsg}});
    }
    return report;
}
