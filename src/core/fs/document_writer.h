#pragma once

#include "core/shared/write_error.h"

#include <QByteArray>
#include <QString>
#include <QStringList>

namespace elf {

// DocumentWriter -- exclusive, symlink-safe creation of record documents
// under one documents root.
//
// write():
//   1. create missing parent directories (0700)
//   2. PathGuard::checkSafe() as the last step before the syscall
//   3. open(parent, O_DIRECTORY|O_NOFOLLOW), then
//      openat(O_CREAT|O_EXCL|O_NOFOLLOW) with mode 0644
//   4. PathGuard::verifyOpenedFile() on the new descriptor
//   5. write everything or unlink the partial file
//
// remove() only deletes files this writer created, never follows symlinks,
// and prunes the directories write() had to create when they are empty.
class DocumentWriter {
public:
    explicit DocumentWriter(const QString& documentsRoot);

    bool write(const QString& absolutePath, const QByteArray& content, WriteError* error);
    bool remove(const QString& absolutePath, WriteError* error);

    const QString& documentsRoot() const { return m_root; }
    const QStringList& writtenFiles() const { return m_written; }

    // True when the last write() failed only because a plain regular file
    // already had that name.
    bool lastWriteCollided() const { return m_lastCollided; }

    static constexpr unsigned kFileMode = 0644;
    static constexpr unsigned kDirectoryMode = 0700;

private:
    bool ensureParentDirectories(const QString& parent, WriteError* error);

    QString m_root;
    QStringList m_written;
    QStringList m_createdDirs;
    bool m_lastCollided = false;
};

} // namespace elf
