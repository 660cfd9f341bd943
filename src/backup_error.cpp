#include "backup_error.hpp"

std::string toString(BackupErrorKind kind) {
    switch (kind) {
    case BackupErrorKind::InvalidExpression:
        return "InvalidExpression";
    case BackupErrorKind::InvalidConfiguration:
        return "InvalidConfiguration";
    case BackupErrorKind::PermissionDenied:
        return "PermissionDenied";
    case BackupErrorKind::IOError:
        return "IOError";
    case BackupErrorKind::NameCollision:
        return "NameCollision";
    case BackupErrorKind::DeletionFailure:
        return "DeletionFailure";
    case BackupErrorKind::Busy:
        return "Busy";
    }
    return "Unknown";
}
