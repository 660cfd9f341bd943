/**
 * @file file_backup.hpp
 * @brief Defines file backup strategies for autobackup.
 *
 * Provides the interface for turning a source tree into a single archive and the zip
 * implementation built on libarchive. The zip strategy walks the tree depth-first,
 * consults a PathFilter before descending into directories and before adding files,
 * and streams file contents into the archive in fixed-size chunks.
 *
 * @note Requires libarchive. Install via apt on Linux or Homebrew on macOS.
 */

#ifndef FILE_BACKUP_HPP
#define FILE_BACKUP_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include "backup_config.hpp"
#include "backup_error.hpp"
#include "path_filter.hpp"

/**
 * @brief Everything one backup run needs to produce an archive.
 */
struct ArchiveTask {
    std::string sourceRoot;     ///< Root of the tree to archive.
    std::string destinationDir; ///< Directory receiving the archive.
    ExclusionRuleSet rules;     ///< Exclusion rules for this run.
    std::string archiveName;    ///< Generated file name (see makeArchiveName).
};

/**
 * @brief Outcome of a successful archive build.
 */
struct ArchiveResult {
    std::string archivePath;            ///< Absolute path of the written archive.
    std::string fileName;               ///< Archive file name.
    std::uintmax_t sizeBytes = 0;       ///< Compressed size on disk.
    std::chrono::milliseconds duration{0}; ///< Wall time spent building.
    std::size_t filesAdded = 0;         ///< Number of files stored.
    std::size_t skippedEntries = 0;     ///< Unreadable entries left out.
};

/**
 * @brief Generates the archive name for a run started at @p when.
 *
 * @return std::string Name of the form backup_YYYYMMDD_HHMMSS.zip in local time.
 */
std::string makeArchiveName(std::chrono::system_clock::time_point when);

/**
 * @brief Tells whether a file name follows the backup_YYYYMMDD_HHMMSS.zip pattern.
 */
bool isBackupFileName(const std::string& name);

/**
 * @brief Interface for file backup strategies.
 */
class FileBackupStrategy {
public:
    virtual ~FileBackupStrategy() = default;

    /**
     * @brief Builds the archive described by @p task.
     *
     * @param task Source, destination, rules and archive name for this run.
     * @return std::expected<ArchiveResult, BackupError> The written archive, or
     *         NameCollision / IOError. No partial file is left behind on failure.
     */
    virtual std::expected<ArchiveResult, BackupError> execute(const ArchiveTask& task) = 0;
};

/**
 * @brief Deflate zip backup strategy.
 *
 * Unreadable files and subdirectories are skipped and counted; an unreadable source
 * root or a failed archive write aborts the run and removes the partial archive.
 * Existing backup archives inside the destination directory are never archived, so
 * a destination nested under the source does not grow recursively.
 */
class ZipFileBackupStrategy : public FileBackupStrategy {
public:
    /**
     * @brief Constructs a zip backup strategy.
     *
     * @param config Configuration providing the log sink. Must outlive the strategy.
     */
    explicit ZipFileBackupStrategy(const BackupConfig& config);

    std::expected<ArchiveResult, BackupError> execute(const ArchiveTask& task) override;

private:
    const BackupConfig& config; ///< Log sink.
};

#endif // FILE_BACKUP_HPP
