/**
 * @file backup_config.hpp
 * @brief Configuration management for the autobackup system.
 *
 * Defines the configuration class holding the source tree, destination directory,
 * cron schedule, retention count, exclusion additions and notification settings.
 * The same class carries the log sink used by every component.
 *
 * @note Configuration is loaded from a JSON file. Paths may be absolute or relative;
 * a relative backup_path is resolved against the parent of source_path.
 */

#ifndef BACKUP_CONFIG_HPP
#define BACKUP_CONFIG_HPP

#include <chrono>
#include <string>
#include <vector>
#include <json/json.h>
#include "path_filter.hpp"

/**
 * @brief Configuration class for the backup system.
 *
 * Loads and manages settings from a JSON configuration file, providing defaults and
 * validation. A default-constructed instance holds the built-in defaults.
 */
class BackupConfig {
public:
    /**
     * @brief Constructs a configuration holding the defaults.
     *
     * The source path defaults to the current working directory.
     */
    BackupConfig();

    /**
     * @brief Constructs a configuration instance from a JSON file.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws std::runtime_error If the file is unreadable, malformed or holds invalid values.
     */
    explicit BackupConfig(const std::string& configFile);

    /**
     * @brief Builds a configuration from an already parsed JSON document.
     *
     * @throws std::runtime_error If a value is out of range.
     */
    static BackupConfig fromJson(const Json::Value& configJson);

    /**
     * @brief Logs a message to stdout and the configured log file.
     */
    void logMessage(const std::string& message) const;

    /**
     * @brief Logs a warning to stderr and the configured log file.
     */
    void logWarning(const std::string& message) const;

    /**
     * @brief Logs an error to stderr and the configured error log file.
     */
    void logError(const std::string& message) const;

    /**
     * @brief Returns the directory receiving the archives.
     *
     * An empty backup_path means one level above the source root; a relative one is
     * resolved against that same parent.
     *
     * @return std::string Absolute, normalized directory path.
     */
    std::string getBackupDir() const;

    /**
     * @brief Returns the default exclusion rules extended with the configured additions.
     */
    ExclusionRuleSet getExclusionRules() const;

    std::string sourcePath;                     ///< Root of the tree to archive.
    std::string backupPath;                     ///< Destination directory; empty for the default.
    std::string cronExpression;                 ///< Five-field cron schedule.
    int maxBackups;                             ///< Number of archives to retain (>= 1).
    std::vector<std::string> excludeDirs;       ///< Extra directory names to exclude.
    std::vector<std::string> excludeExtensions; ///< Extra file suffixes to exclude.
    std::chrono::milliseconds checkInterval;    ///< Scheduler polling period.
    std::string logFile;                        ///< Path to the log file; empty for console only.
    std::string errorLogFile;                   ///< Path to the error log file; empty for console only.
    Json::Value telegramConfig;                 ///< Telegram configuration for notifications.

private:
    void load(const Json::Value& configJson);
    void appendToFile(const std::string& path, const std::string& entry) const;
};

#endif // BACKUP_CONFIG_HPP
