/**
 * @file backup_error.hpp
 * @brief Error values reported by the autobackup engine.
 *
 * Every fallible operation returns std::expected<T, BackupError>. The kind tells the
 * caller how to surface the failure (operator message, user reply, warning only).
 */

#ifndef BACKUP_ERROR_HPP
#define BACKUP_ERROR_HPP

#include <string>

/**
 * @brief Classification of backup failures.
 */
enum class BackupErrorKind {
    InvalidExpression,    ///< Cron expression rejected at parse time.
    InvalidConfiguration, ///< Configuration value outside its allowed range.
    PermissionDenied,     ///< Manual trigger from a non-administrator caller.
    IOError,              ///< Unwritable destination, disk full, unreadable source root.
    NameCollision,        ///< An archive with the generated name already exists.
    DeletionFailure,      ///< Retention could not delete one archive.
    Busy                  ///< Another backup run is in flight.
};

/**
 * @brief A failure kind paired with a human-readable detail.
 */
struct BackupError {
    BackupErrorKind kind; ///< Failure classification.
    std::string message;  ///< Detail naming the operation, path and underlying error.
};

/**
 * @brief Returns the stable name of an error kind (e.g. "NameCollision").
 */
std::string toString(BackupErrorKind kind);

#endif // BACKUP_ERROR_HPP
