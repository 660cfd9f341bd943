/**
 * @file retention.hpp
 * @brief Listing of existing backup archives and count-based retention.
 *
 * Only files following the backup_YYYYMMDD_HHMMSS.zip pattern are considered; other
 * files in the backup directory are never listed or deleted. Records are re-read from
 * the filesystem on every call.
 */

#ifndef RETENTION_HPP
#define RETENTION_HPP

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include "backup_config.hpp"
#include "backup_error.hpp"

/**
 * @brief One backup archive found on disk.
 */
struct BackupFileRecord {
    std::string fileName;                          ///< Archive file name.
    std::string path;                              ///< Absolute path.
    std::uintmax_t sizeBytes = 0;                  ///< Size on disk.
    std::chrono::system_clock::time_point modified; ///< Last modification time.

    bool operator==(const BackupFileRecord&) const = default;
};

/**
 * @brief A retention deletion that did not succeed.
 */
struct DeletionFailure {
    std::string fileName; ///< Archive that could not be deleted.
    BackupError error;    ///< DeletionFailure with the underlying reason.
};

/**
 * @brief Outcome of one retention pass.
 */
struct RetentionReport {
    std::vector<std::string> deleted;      ///< Names of deleted archives, oldest first.
    std::vector<DeletionFailure> failures; ///< Archives that could not be deleted.
};

/**
 * @brief Keeps only the newest archives in a backup directory.
 */
class RetentionManager {
public:
    /**
     * @brief Deletes one archive; returns false and sets the error code on failure.
     */
    using Remover = std::function<bool(const std::filesystem::path&, std::error_code&)>;

    /**
     * @param config Configuration providing the log sink. Must outlive the manager.
     * @param remover Deletion primitive; defaults to std::filesystem::remove.
     */
    explicit RetentionManager(const BackupConfig& config, Remover remover = {});

    /**
     * @brief Lists backup archives, oldest first.
     *
     * Archives are ordered by modification time, ties broken by file name. A missing
     * directory yields an empty list.
     *
     * @param backupDir Directory to scan.
     * @return std::expected<std::vector<BackupFileRecord>, BackupError> Archives or IOError.
     */
    std::expected<std::vector<BackupFileRecord>, BackupError> listBackups(const std::string& backupDir) const;

    /**
     * @brief Deletes the oldest archives until at most @p maxBackups remain.
     *
     * A failed deletion is logged and reported but does not stop the remaining ones.
     *
     * @param backupDir Directory to prune.
     * @param maxBackups Number of archives to keep (>= 1).
     * @return std::expected<RetentionReport, BackupError> Deleted names and failures, or
     *         InvalidConfiguration / IOError when the pass could not start.
     */
    std::expected<RetentionReport, BackupError> enforce(const std::string& backupDir, int maxBackups) const;

private:
    const BackupConfig& config; ///< Log sink.
    Remover remover;            ///< Deletes a single archive.
};

#endif // RETENTION_HPP
