/**
 * @file file_backup.cpp
 * @brief Zip file backup strategy implementation for autobackup.
 *
 * Implements filtered, streamed zip archives with std::filesystem and libarchive.
 */

#include "file_backup.hpp"
#include "time_format.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <vector>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kChunkSize = 64 * 1024;
constexpr const char* kArchivePrefix = "backup_";
constexpr const char* kArchiveExtension = ".zip";

enum class AddOutcome {
    Added,
    Skipped,
    Fatal
};

// Owns the libarchive writer and the output descriptor of one run.
struct ArchiveHandle {
    struct archive* writer = nullptr;
    int fd = -1;

    ArchiveHandle() = default;
    ArchiveHandle(const ArchiveHandle&) = delete;
    ArchiveHandle& operator=(const ArchiveHandle&) = delete;

    ~ArchiveHandle() { release(); }

    void release() {
        if (writer) {
            archive_write_free(writer);
            writer = nullptr;
        }
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
};

std::string archiveError(struct archive* writer) {
    const char* message = archive_error_string(writer);
    return message ? message : "unknown libarchive error";
}

} // namespace

std::string makeArchiveName(std::chrono::system_clock::time_point when) {
    return kArchivePrefix + formatLocalTime(when, "%Y%m%d_%H%M%S") + kArchiveExtension;
}

bool isBackupFileName(const std::string& name) {
    // backup_YYYYMMDD_HHMMSS.zip
    static const std::string pattern = "backup_########_######.zip";
    if (name.size() != pattern.size()) {
        return false;
    }
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] == '#') {
            if (!std::isdigit(static_cast<unsigned char>(name[i]))) {
                return false;
            }
        } else if (pattern[i] != name[i]) {
            return false;
        }
    }
    return true;
}

ZipFileBackupStrategy::ZipFileBackupStrategy(const BackupConfig& config) : config(config) {}

std::expected<ArchiveResult, BackupError> ZipFileBackupStrategy::execute(const ArchiveTask& task) {
    auto started = std::chrono::steady_clock::now();
    fs::path sourceRoot = fs::absolute(task.sourceRoot).lexically_normal();
    fs::path destinationDir = fs::absolute(task.destinationDir).lexically_normal();
    fs::path outputPath = destinationDir / task.archiveName;

    config.logMessage(std::format("Starting backup of {} to {}", sourceRoot.string(), outputPath.string()));

    std::error_code ec;
    if (!fs::is_directory(sourceRoot, ec)) {
        std::string errorMsg = ec ? std::format("Source directory is not accessible: {} (error: {})",
                                                sourceRoot.string(), ec.message())
                                  : std::format("Source directory is not accessible: {}", sourceRoot.string());
        config.logError(errorMsg);
        return std::unexpected(BackupError{BackupErrorKind::IOError, errorMsg});
    }

    fs::create_directories(destinationDir, ec);
    if (ec) {
        std::string errorMsg = std::format("Failed to create backup directory: {} (error: {})",
                                           destinationDir.string(), ec.message());
        config.logError(errorMsg);
        return std::unexpected(BackupError{BackupErrorKind::IOError, errorMsg});
    }

    ArchiveHandle handle;
    handle.fd = ::open(outputPath.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (handle.fd < 0) {
        int err = errno;
        if (err == EEXIST) {
            std::string errorMsg = std::format("Backup file already exists: {}", outputPath.string());
            config.logError(errorMsg);
            return std::unexpected(BackupError{BackupErrorKind::NameCollision, errorMsg});
        }
        std::string errorMsg = std::format("Failed to create archive file: {} (error: {})", outputPath.string(),
                                           std::strerror(err));
        config.logError(errorMsg);
        return std::unexpected(BackupError{BackupErrorKind::IOError, errorMsg});
    }

    auto fail = [&](const std::string& errorMsg) -> std::expected<ArchiveResult, BackupError> {
        config.logError(errorMsg);
        handle.release();
        std::error_code removeEc;
        fs::remove(outputPath, removeEc);
        if (removeEc) {
            config.logError(std::format("Failed to remove partial archive: {} (error: {})", outputPath.string(),
                                        removeEc.message()));
        }
        return std::unexpected(BackupError{BackupErrorKind::IOError, errorMsg});
    };

    handle.writer = archive_write_new();
    if (!handle.writer) {
        return fail(std::format("Failed to allocate archive writer for {}", outputPath.string()));
    }
    if (archive_write_set_format_zip(handle.writer) != ARCHIVE_OK ||
        archive_write_set_options(handle.writer, "zip:compression=deflate") != ARCHIVE_OK ||
        archive_write_open_fd(handle.writer, handle.fd) != ARCHIVE_OK) {
        return fail(std::format("Failed to open archive file: {} (error: {})", outputPath.string(),
                                archiveError(handle.writer)));
    }

    PathFilter filter(task.rules);
    fs::path destinationCanonical = fs::weakly_canonical(destinationDir, ec);
    std::vector<char> buffer(kChunkSize);
    ArchiveResult result;

    // A file that fails on its first read is skipped. Once its header is in the
    // archive the entry cannot be dropped, so a later read error fails the run.
    auto addFile = [&](const fs::path& file, const std::string& entryName, std::string& fatalMsg) {
        std::ifstream input(file, std::ios::binary);
        if (!input) {
            config.logWarning(std::format("Skipping unreadable file: {} (error: {})", file.string(), std::strerror(errno)));
            return AddOutcome::Skipped;
        }
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (input.bad()) {
            config.logWarning(std::format("Skipping unreadable file: {}", file.string()));
            return AddOutcome::Skipped;
        }
        std::streamsize count = input.gcount();

        std::error_code statEc;
        auto fileSize = fs::file_size(file, statEc);
        if (statEc) {
            config.logWarning(std::format("Skipping file that vanished during backup: {} (error: {})", file.string(),
                                          statEc.message()));
            return AddOutcome::Skipped;
        }
        auto modified = fs::last_write_time(file, statEc);
        auto perms = fs::status(file, statEc).permissions();

        std::unique_ptr<struct archive_entry, decltype(&archive_entry_free)> entry(archive_entry_new(),
                                                                                  &archive_entry_free);
        archive_entry_set_pathname(entry.get(), entryName.c_str());
        archive_entry_set_size(entry.get(), static_cast<la_int64_t>(fileSize));
        archive_entry_set_filetype(entry.get(), AE_IFREG);
        archive_entry_set_perm(entry.get(), statEc ? 0644 : static_cast<int>(perms & fs::perms::all));
        if (!statEc) {
            archive_entry_set_mtime(entry.get(), std::chrono::system_clock::to_time_t(toSystemTime(modified)), 0);
        }

        int headerStatus = archive_write_header(handle.writer, entry.get());
        if (headerStatus == ARCHIVE_FATAL) {
            fatalMsg = std::format("Failed to write archive entry for {} (error: {})", file.string(),
                                   archiveError(handle.writer));
            return AddOutcome::Fatal;
        }
        if (headerStatus == ARCHIVE_FAILED) {
            config.logWarning(std::format("Skipping file rejected by archive writer: {} (error: {})", file.string(),
                                          archiveError(handle.writer)));
            return AddOutcome::Skipped;
        }
        if (headerStatus == ARCHIVE_WARN) {
            config.logWarning(std::format("Archive warning for {}: {}", file.string(), archiveError(handle.writer)));
        }

        while (count > 0) {
            if (archive_write_data(handle.writer, buffer.data(), static_cast<size_t>(count)) < 0) {
                fatalMsg = std::format("Failed to write archive data for {} (error: {})", file.string(),
                                       archiveError(handle.writer));
                return AddOutcome::Fatal;
            }
            if (!input) {
                break;
            }
            input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            count = input.gcount();
        }
        if (input.bad()) {
            fatalMsg = std::format("Read error while archiving {}, entry would be truncated", file.string());
            return AddOutcome::Fatal;
        }
        return AddOutcome::Added;
    };

    std::vector<fs::path> pending{sourceRoot};
    while (!pending.empty()) {
        fs::path dir = pending.back();
        pending.pop_back();

        std::error_code dirEc;
        fs::directory_iterator it(dir, dirEc);
        if (dirEc) {
            if (dir == sourceRoot) {
                return fail(std::format("Failed to read source directory: {} (error: {})", dir.string(), dirEc.message()));
            }
            config.logWarning(std::format("Skipping unreadable directory: {} (error: {})", dir.string(), dirEc.message()));
            ++result.skippedEntries;
            continue;
        }

        std::error_code canonicalEc;
        bool inDestination = fs::weakly_canonical(dir, canonicalEc) == destinationCanonical && !canonicalEc;

        for (; !dirEc && it != fs::directory_iterator(); it.increment(dirEc)) {
            const fs::path& path = it->path();
            std::error_code entryEc;
            auto status = it->status(entryEc);
            if (entryEc) {
                config.logWarning(std::format("Skipping entry that cannot be inspected: {} (error: {})", path.string(),
                                              entryEc.message()));
                ++result.skippedEntries;
                continue;
            }

            if (fs::is_directory(status)) {
                // Symlinked directories are not followed.
                if (it->is_symlink(entryEc) || filter.shouldExclude(path, true)) {
                    continue;
                }
                pending.push_back(path);
                continue;
            }
            if (!fs::is_regular_file(status) || filter.shouldExclude(path, false)) {
                continue;
            }

            std::string name = path.filename().string();
            if (inDestination && (name == task.archiveName || isBackupFileName(name))) {
                continue;
            }

            std::string fatalMsg;
            switch (addFile(path, path.lexically_relative(sourceRoot).generic_string(), fatalMsg)) {
            case AddOutcome::Added:
                ++result.filesAdded;
                break;
            case AddOutcome::Skipped:
                ++result.skippedEntries;
                break;
            case AddOutcome::Fatal:
                return fail(fatalMsg);
            }
        }
        if (dirEc) {
            config.logWarning(std::format("Directory listing interrupted: {} (error: {})", dir.string(), dirEc.message()));
            ++result.skippedEntries;
        }
    }

    if (archive_write_close(handle.writer) != ARCHIVE_OK) {
        return fail(std::format("Failed to finalize archive: {} (error: {})", outputPath.string(),
                                archiveError(handle.writer)));
    }
    archive_write_free(handle.writer);
    handle.writer = nullptr;
    int closeStatus = ::close(handle.fd);
    handle.fd = -1;
    if (closeStatus != 0) {
        return fail(std::format("Failed to close archive file: {} (error: {})", outputPath.string(),
                                std::strerror(errno)));
    }

    result.archivePath = outputPath.string();
    result.fileName = task.archiveName;
    result.sizeBytes = fs::file_size(outputPath, ec);
    if (ec) {
        return fail(std::format("Failed to stat archive file: {} (error: {})", outputPath.string(), ec.message()));
    }
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

    config.logMessage(std::format("File backup completed: {} ({} bytes, {} files, {} skipped, {} ms)",
                                  result.archivePath, result.sizeBytes, result.filesAdded, result.skippedEntries,
                                  result.duration.count()));
    return result;
}
