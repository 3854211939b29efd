#include "core/shared/write_error.h"

namespace elf {

QString errorKindToString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None:        return QStringLiteral("none");
    case ErrorKind::Validation:  return QStringLiteral("validation");
    case ErrorKind::Security:    return QStringLiteral("security");
    case ErrorKind::Storage:     return QStringLiteral("storage");
    case ErrorKind::Filesystem:  return QStringLiteral("filesystem");
    case ErrorKind::LockTimeout: return QStringLiteral("lock_timeout");
    case ErrorKind::History:     return QStringLiteral("history");
    case ErrorKind::Dependency:  return QStringLiteral("dependency");
    }
    return QStringLiteral("unknown");
}

int exitCodeFor(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None:        return exit_code::kSuccess;
    case ErrorKind::Validation:  return exit_code::kValidationError;
    case ErrorKind::Security:    return exit_code::kSecurityError;
    case ErrorKind::Storage:     return exit_code::kStorageError;
    case ErrorKind::Filesystem:  return exit_code::kFilesystemError;
    case ErrorKind::LockTimeout: return exit_code::kLockError;
    case ErrorKind::History:     return exit_code::kHistoryError;
    case ErrorKind::Dependency:  return exit_code::kDependencyError;
    }
    return exit_code::kUnknownError;
}

QString WriteError::toString() const
{
    return QStringLiteral("%1 error in %2%3: %4")
        .arg(errorKindToString(kind),
             step.isEmpty() ? QStringLiteral("unknown step") : step,
             transient ? QStringLiteral(" (transient)") : QString(),
             message);
}

bool setError(WriteError* error, ErrorKind kind, const QString& step,
              const QString& message, bool transient)
{
    if (error) {
        error->kind = kind;
        error->step = step;
        error->message = message;
        error->transient = transient;
    }
    return false;
}

} // namespace elf
