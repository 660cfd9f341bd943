/**
 * @file backup_api.hpp
 * @brief Command surface of the autobackup system.
 *
 * Turns the two host commands (manual backup, status) into calls on a Backup and
 * renders their results as reply text. The host supplies the administrator flag;
 * only plain data crosses this boundary.
 */

#ifndef BACKUP_API_HPP
#define BACKUP_API_HPP

#include <cstdint>
#include <string>
#include "backup.hpp"

/**
 * @brief API for the backup commands.
 */
class BackupAPI {
public:
    /**
     * @brief Number of archives shown in a status reply.
     */
    static constexpr std::size_t kStatusListLimit = 5;

    /**
     * @brief Handles the manual backup command.
     *
     * @param backup Backup instance to run.
     * @param isAdministrator Whether the caller is an administrator.
     * @return std::string Reply text: a refusal, a busy notice, the failure reason or
     *         the name, location and size of the new archive.
     */
    static std::string manualBackup(Backup& backup, bool isAdministrator);

    /**
     * @brief Handles the status command, open to every caller.
     *
     * @return std::string The backup directory, the archive count and the newest
     *         archives with size and timestamp.
     */
    static std::string status(const Backup& backup);

    /**
     * @brief Renders the outcome of a backup run as reply text.
     */
    static std::string formatOutcome(const Backup::Outcome& outcome);

    /**
     * @brief Formats a byte count as B, KB, MB or GB.
     */
    static std::string formatSize(std::uintmax_t bytes);
};

#endif // BACKUP_API_HPP
