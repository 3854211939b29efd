#pragma once

#include "core/shared/write_error.h"

#include <QString>

namespace elf {

// PathGuard -- symlink / hardlink / escape checks run immediately before a
// document is created.
//
// Rejection table (evaluated in order, all Security errors):
//   1. root missing, not a directory, or a symlink
//   2. target lexically outside root
//   3. any existing directory between root and the target's parent is a
//      symlink (lstat, component by component)
//   4. the canonical parent escapes the canonical root
//   5. the target exists and is a symlink
//   6. the target exists with more than one hard link
//
// An existing regular single-link target passes here; the exclusive create
// in DocumentWriter reports it. checkSafe() holds no state and must be
// re-run right before every write, however recently it last passed.
class PathGuard {
public:
    static bool checkSafe(const QString& root, const QString& target, WriteError* error);

    // Re-verify an opened descriptor: regular file with exactly one link.
    static bool verifyOpenedFile(int fd, const QString& target, WriteError* error);

    // Report why an exclusive create of `name` under the directory `dirFd`
    // hit an existing entry. Always returns false: a symlink, a hardlinked or
    // a non-regular entry is a Security error (it appeared after checkSafe()
    // passed), a plain regular file is a Filesystem error and sets
    // *plainFile.
    static bool rejectExistingEntry(int dirFd, const QString& name, const QString& target,
                                    WriteError* error, bool* plainFile = nullptr);

    // lstat-based: true when `path` exists and is a symbolic link.
    static bool isSymlink(const QString& path);
};

} // namespace elf
