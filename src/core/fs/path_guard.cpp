#include "core/fs/path_guard.h"
#include "core/fs/record_paths.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>

namespace elf {

namespace {

const QString kStep = QStringLiteral("path_guard");

bool rejectPath(WriteError* error, const QString& path, const QString& reason)
{
    LOG_WARN(elfFs, "Refusing write to %s: %s", qUtf8Printable(path), qUtf8Printable(reason));
    return setError(error, ErrorKind::Security, kStep,
                    QStringLiteral("%1: %2").arg(reason, path));
}

} // namespace

bool PathGuard::isSymlink(const QString& path)
{
    struct stat st{};
    const QByteArray pathUtf8 = QFile::encodeName(path);
    return ::lstat(pathUtf8.constData(), &st) == 0 && S_ISLNK(st.st_mode);
}

bool PathGuard::checkSafe(const QString& root, const QString& target, WriteError* error)
{
    const QString cleanRoot = QDir::cleanPath(QDir(root).absolutePath());
    const QString cleanTarget = QDir::cleanPath(QDir(target).absolutePath());

    struct stat st{};
    const QByteArray rootUtf8 = QFile::encodeName(cleanRoot);
    if (::lstat(rootUtf8.constData(), &st) != 0) {
        return rejectPath(error, cleanRoot, QStringLiteral("document root does not exist"));
    }
    if (S_ISLNK(st.st_mode)) {
        return rejectPath(error, cleanRoot, QStringLiteral("document root is a symlink"));
    }
    if (!S_ISDIR(st.st_mode)) {
        return rejectPath(error, cleanRoot, QStringLiteral("document root is not a directory"));
    }

    if (cleanTarget == cleanRoot || !RecordPaths::isWithin(cleanRoot, cleanTarget)) {
        return rejectPath(error, cleanTarget, QStringLiteral("target escapes the document root"));
    }

    // Walk every directory from just below root down to the parent.
    const QString parent = QFileInfo(cleanTarget).absolutePath();
    const QString relativeParent = QDir(cleanRoot).relativeFilePath(parent);
    QString current = cleanRoot;
    const QStringList components = relativeParent == QLatin1String(".")
                                       ? QStringList()
                                       : relativeParent.split(QLatin1Char('/'), Qt::SkipEmptyParts);
    for (const QString& component : components) {
        current += QLatin1Char('/') + component;
        const QByteArray currentUtf8 = QFile::encodeName(current);
        if (::lstat(currentUtf8.constData(), &st) != 0) {
            // Not created yet; nothing beneath it can exist either.
            break;
        }
        if (S_ISLNK(st.st_mode)) {
            return rejectPath(error, current, QStringLiteral("directory is a symlink"));
        }
        if (!S_ISDIR(st.st_mode)) {
            return rejectPath(error, current, QStringLiteral("path component is not a directory"));
        }
    }

    // Canonical containment catches anything the component walk could not
    // see (e.g. a bind mount or a symlinked ancestor swapped in meanwhile).
    const QString canonicalRoot = QFileInfo(cleanRoot).canonicalFilePath();
    const QString canonicalParent = QFileInfo(parent).canonicalFilePath();
    if (!canonicalParent.isEmpty() && !RecordPaths::isWithin(canonicalRoot, canonicalParent)) {
        return rejectPath(error, parent, QStringLiteral("parent directory resolves outside the document root"));
    }

    const QByteArray targetUtf8 = QFile::encodeName(cleanTarget);
    if (::lstat(targetUtf8.constData(), &st) == 0) {
        if (S_ISLNK(st.st_mode)) {
            return rejectPath(error, cleanTarget, QStringLiteral("target is a symlink"));
        }
        if (st.st_nlink > 1) {
            return rejectPath(error, cleanTarget,
                              QStringLiteral("target has %1 hard links").arg(static_cast<qulonglong>(st.st_nlink)));
        }
    } else if (errno != ENOENT) {
        return setError(error, ErrorKind::Filesystem, kStep,
                        QStringLiteral("cannot stat %1: %2")
                            .arg(cleanTarget, QString::fromLocal8Bit(std::strerror(errno))));
    }

    return true;
}

bool PathGuard::rejectExistingEntry(int dirFd, const QString& name, const QString& target,
                                    WriteError* error, bool* plainFile)
{
    if (plainFile) *plainFile = false;
    struct stat st{};
    const QByteArray nameUtf8 = QFile::encodeName(name);
    if (::fstatat(dirFd, nameUtf8.constData(), &st, AT_SYMLINK_NOFOLLOW) != 0) {
        return setError(error, ErrorKind::Filesystem, kStep,
                        QStringLiteral("cannot stat existing %1: %2")
                            .arg(target, QString::fromLocal8Bit(std::strerror(errno))));
    }
    if (S_ISLNK(st.st_mode)) {
        return rejectPath(error, target, QStringLiteral("target became a symlink after the check"));
    }
    if (!S_ISREG(st.st_mode)) {
        return rejectPath(error, target, QStringLiteral("target is not a regular file"));
    }
    if (st.st_nlink > 1) {
        return rejectPath(error, target,
                          QStringLiteral("target has %1 hard links").arg(static_cast<qulonglong>(st.st_nlink)));
    }
    if (plainFile) *plainFile = true;
    return setError(error, ErrorKind::Filesystem, kStep,
                    QStringLiteral("document already exists: %1").arg(target));
}

bool PathGuard::verifyOpenedFile(int fd, const QString& target, WriteError* error)
{
    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        return setError(error, ErrorKind::Filesystem, kStep,
                        QStringLiteral("fstat failed for %1: %2")
                            .arg(target, QString::fromLocal8Bit(std::strerror(errno))));
    }
    if (!S_ISREG(st.st_mode)) {
        return rejectPath(error, target, QStringLiteral("opened descriptor is not a regular file"));
    }
    if (st.st_nlink != 1) {
        return rejectPath(error, target,
                          QStringLiteral("opened file has %1 hard links").arg(static_cast<qulonglong>(st.st_nlink)));
    }
    return true;
}

} // namespace elf
