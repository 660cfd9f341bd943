#include "backup_api.hpp"
#include "time_format.hpp"
#include <algorithm>
#include <format>
#include <iterator>

std::string BackupAPI::manualBackup(Backup& backup, bool isAdministrator) {
    return formatOutcome(backup.triggerManual(isAdministrator));
}

std::string BackupAPI::formatOutcome(const Backup::Outcome& outcome) {
    if (!outcome) {
        switch (outcome.error().kind) {
        case BackupErrorKind::PermissionDenied:
            return "You are not an administrator; manual backup is not allowed.";
        case BackupErrorKind::Busy:
            return "A backup is already running, please try again later.";
        default:
            return std::format("Backup failed [{}]: {}", toString(outcome.error().kind), outcome.error().message);
        }
    }

    const ArchiveResult& archive = outcome->archive;
    std::string reply = std::format("Backup completed!\nFile: {}\nLocation: {}\nSize: {}\nFiles: {}",
                                    archive.fileName, archive.archivePath, formatSize(archive.sizeBytes),
                                    archive.filesAdded);
    if (archive.skippedEntries > 0) {
        reply += std::format(" ({} unreadable entries skipped)", archive.skippedEntries);
    }
    if (!outcome->retention.deleted.empty()) {
        reply += std::format("\nRemoved old backups: {}", outcome->retention.deleted.size());
    }
    for (const auto& warning : outcome->warnings) {
        reply += std::format("\nWarning: {}", warning);
    }
    return reply;
}

std::string BackupAPI::status(const Backup& backup) {
    std::string backupDir = backup.getConfig().getBackupDir();
    auto records = backup.status();
    if (!records) {
        return std::format("Failed to read backup status: {}", records.error().message);
    }
    if (records->empty()) {
        return std::format("No backups found in {}", backupDir);
    }

    std::string reply = std::format("Backup directory: {}\nTotal backups: {}\n", backupDir, records->size());
    std::size_t shown = std::min(records->size(), kStatusListLimit);
    for (std::size_t i = 0; i < shown; ++i) {
        const auto& record = (*records)[i];
        reply += std::format("\n{}. {}\n   Size: {}\n   Time: {}", i + 1, record.fileName,
                             formatSize(record.sizeBytes), formatLocalTime(record.modified, "%Y-%m-%d %H:%M:%S"));
    }
    if (records->size() > shown) {
        reply += std::format("\n\n... and {} more backups", records->size() - shown);
    }
    return reply;
}

std::string BackupAPI::formatSize(std::uintmax_t bytes) {
    static const char* units[] = {"KB", "MB", "GB"};
    if (bytes < 1024) {
        return std::format("{} B", bytes);
    }
    double value = static_cast<double>(bytes) / 1024.0;
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(units)) {
        value /= 1024.0;
        ++unit;
    }
    return std::format("{:.2f} {}", value, units[unit]);
}
