#pragma once

#include <QString>

namespace elf {

// Error taxonomy for the record write path.
enum class ErrorKind {
    None,
    Validation,   // bad input; nothing written yet
    Security,     // symlink / hardlink / escape detected; nothing written
    Storage,      // SQLite failure (busy/locked is transient, the rest permanent)
    Filesystem,   // document could not be created or written
    LockTimeout,  // advisory lock not acquired within its timeout
    History,      // git stage/commit failed after one retry
    Dependency,   // required tool or store missing (git, database)
};

QString errorKindToString(ErrorKind kind);

// Process exit codes used by CLI wrappers. Values match the legacy shell
// tooling so existing callers keep interpreting them the same way.
namespace exit_code {
constexpr int kSuccess = 0;
constexpr int kInputError = 1;
constexpr int kStorageError = 2;
constexpr int kHistoryError = 3;
constexpr int kFilesystemError = 4;
constexpr int kDependencyError = 5;
constexpr int kSecurityError = 6;
constexpr int kValidationError = 7;
constexpr int kLockError = 8;
constexpr int kUnknownError = 99;
} // namespace exit_code

int exitCodeFor(ErrorKind kind);

// Error reported by a write-path component through its `WriteError*`
// out-parameter. `step` names the component that failed.
struct WriteError {
    ErrorKind kind = ErrorKind::None;
    QString step;
    QString message;
    bool transient = false;

    bool isSet() const { return kind != ErrorKind::None; }
    QString toString() const;
};

// Fill *error if the caller asked for it. Always returns false so callers
// can write `return setError(...)`.
bool setError(WriteError* error, ErrorKind kind, const QString& step,
              const QString& message, bool transient = false);

} // namespace elf
