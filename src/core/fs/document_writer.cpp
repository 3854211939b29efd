#include "core/fs/document_writer.h"
#include "core/fs/path_guard.h"
#include "core/fs/record_paths.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace elf {

namespace {

const QString kStep = QStringLiteral("document");

QString errnoText(int err)
{
    return QString::fromLocal8Bit(std::strerror(err));
}

// Closes the descriptor on every exit path.
class FdCloser {
public:
    explicit FdCloser(int fd) : m_fd(fd) {}
    ~FdCloser() { if (m_fd >= 0) ::close(m_fd); }
    FdCloser(const FdCloser&) = delete;
    FdCloser& operator=(const FdCloser&) = delete;

    int get() const { return m_fd; }
    int release() { const int fd = m_fd; m_fd = -1; return fd; }

private:
    int m_fd;
};

} // namespace

DocumentWriter::DocumentWriter(const QString& documentsRoot)
    : m_root(QDir::cleanPath(QDir(documentsRoot).absolutePath()))
{
}

bool DocumentWriter::ensureParentDirectories(const QString& parent, WriteError* error)
{
    if (!RecordPaths::isWithin(m_root, parent)) {
        return setError(error, ErrorKind::Security, kStep,
                        QStringLiteral("parent directory escapes the document root: %1").arg(parent));
    }

    const QString relative = QDir(m_root).relativeFilePath(parent);
    if (relative == QLatin1String(".")) {
        return true;
    }

    QString current = m_root;
    for (const QString& component : relative.split(QLatin1Char('/'), Qt::SkipEmptyParts)) {
        current += QLatin1Char('/') + component;
        const QByteArray currentUtf8 = QFile::encodeName(current);
        if (::mkdir(currentUtf8.constData(), kDirectoryMode) == 0) {
            m_createdDirs.append(current);
            LOG_DEBUG(elfFs, "Created directory %s", qUtf8Printable(current));
            continue;
        }
        if (errno != EEXIST) {
            return setError(error, ErrorKind::Filesystem, kStep,
                            QStringLiteral("cannot create directory %1: %2")
                                .arg(current, errnoText(errno)));
        }
        // Never descend through a symlink, or the next mkdir lands outside.
        struct stat st{};
        if (::lstat(currentUtf8.constData(), &st) != 0) {
            return setError(error, ErrorKind::Filesystem, kStep,
                            QStringLiteral("cannot stat %1: %2").arg(current, errnoText(errno)));
        }
        if (S_ISLNK(st.st_mode) || !S_ISDIR(st.st_mode)) {
            LOG_WARN(elfFs, "Refusing to create directories below %s", qUtf8Printable(current));
            return setError(error, ErrorKind::Security, kStep,
                            QStringLiteral("path component is a symlink or not a directory: %1")
                                .arg(current));
        }
    }
    return true;
}

bool DocumentWriter::write(const QString& absolutePath, const QByteArray& content,
                           WriteError* error)
{
    QElapsedTimer timer;
    timer.start();
    m_lastCollided = false;

    const QString target = QDir::cleanPath(absolutePath);
    const QFileInfo targetInfo(target);
    const QString parent = targetInfo.absolutePath();
    const QString name = targetInfo.fileName();

    if (name.isEmpty() || !RecordPaths::isWithin(m_root, target) || target == m_root) {
        return setError(error, ErrorKind::Security, kStep,
                        QStringLiteral("document path escapes the document root: %1").arg(target));
    }

    if (!ensureParentDirectories(parent, error)) {
        return false;
    }

    // Last check before the write syscall, even if it passed earlier.
    if (!PathGuard::checkSafe(m_root, target, error)) {
        return false;
    }

    const QByteArray parentUtf8 = QFile::encodeName(parent);
    FdCloser dirFd(::open(parentUtf8.constData(), O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC));
    if (dirFd.get() < 0) {
        const int err = errno;
        if (err == ELOOP || err == ENOTDIR) {
            return setError(error, ErrorKind::Security, kStep,
                            QStringLiteral("parent directory changed to a symlink: %1").arg(parent));
        }
        return setError(error, ErrorKind::Filesystem, kStep,
                        QStringLiteral("cannot open directory %1: %2").arg(parent, errnoText(err)));
    }

    const QByteArray nameUtf8 = QFile::encodeName(name);
    FdCloser fileFd(::openat(dirFd.get(), nameUtf8.constData(),
                             O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, kFileMode));
    if (fileFd.get() < 0) {
        const int err = errno;
        if (err == EEXIST) {
            // O_EXCL refuses a symlink with EEXIST, not ELOOP.
            return PathGuard::rejectExistingEntry(dirFd.get(), name, target, error,
                                                  &m_lastCollided);
        }
        if (err == ELOOP) {
            return setError(error, ErrorKind::Security, kStep,
                            QStringLiteral("target is a symlink: %1").arg(target));
        }
        return setError(error, ErrorKind::Filesystem, kStep,
                        QStringLiteral("cannot create %1: %2").arg(target, errnoText(err)));
    }

    auto discardPartial = [&]() {
        ::close(fileFd.release());
        if (::unlinkat(dirFd.get(), nameUtf8.constData(), 0) != 0 && errno != ENOENT) {
            LOG_ERROR(elfFs, "Failed to remove partial document %s: %s",
                      qUtf8Printable(target), std::strerror(errno));
        }
    };

    // umask may have narrowed the create mode; pin it exactly.
    if (::fchmod(fileFd.get(), kFileMode) != 0) {
        const int err = errno;
        discardPartial();
        return setError(error, ErrorKind::Filesystem, kStep,
                        QStringLiteral("cannot set mode on %1: %2").arg(target, errnoText(err)));
    }

    if (!PathGuard::verifyOpenedFile(fileFd.get(), target, error)) {
        discardPartial();
        return false;
    }

    qint64 offset = 0;
    while (offset < content.size()) {
        const ssize_t n = ::write(fileFd.get(), content.constData() + offset,
                                  static_cast<size_t>(content.size() - offset));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int err = errno;
            discardPartial();
            return setError(error, ErrorKind::Filesystem, kStep,
                            QStringLiteral("write to %1 failed: %2").arg(target, errnoText(err)));
        }
        if (n == 0) {
            discardPartial();
            return setError(error, ErrorKind::Filesystem, kStep,
                            QStringLiteral("short write to %1 (%2 of %3 bytes)")
                                .arg(target)
                                .arg(offset)
                                .arg(content.size()));
        }
        offset += n;
    }

    if (::fsync(fileFd.get()) != 0) {
        LOG_WARN(elfFs, "fsync failed for %s: %s", qUtf8Printable(target), std::strerror(errno));
    }
    if (::close(fileFd.release()) != 0) {
        const int err = errno;
        if (::unlinkat(dirFd.get(), nameUtf8.constData(), 0) != 0 && errno != ENOENT) {
            LOG_ERROR(elfFs, "Failed to remove unflushed document %s", qUtf8Printable(target));
        }
        return setError(error, ErrorKind::Filesystem, kStep,
                        QStringLiteral("close of %1 failed: %2").arg(target, errnoText(err)));
    }

    m_written.append(target);
    LOG_INFO(elfFs, "Wrote %s (%lld bytes, %lld ms)", qUtf8Printable(target),
             static_cast<long long>(content.size()), static_cast<long long>(timer.elapsed()));
    return true;
}

bool DocumentWriter::remove(const QString& absolutePath, WriteError* error)
{
    const QString target = QDir::cleanPath(absolutePath);
    if (!m_written.contains(target)) {
        return setError(error, ErrorKind::Filesystem, kStep,
                        QStringLiteral("refusing to remove a file this writer did not create: %1")
                            .arg(target));
    }

    struct stat st{};
    const QByteArray targetUtf8 = QFile::encodeName(target);
    if (::lstat(targetUtf8.constData(), &st) != 0) {
        if (errno == ENOENT) {
            LOG_WARN(elfFs, "Document already gone: %s", qUtf8Printable(target));
            m_written.removeAll(target);
            return true;
        }
        return setError(error, ErrorKind::Filesystem, kStep,
                        QStringLiteral("cannot stat %1: %2").arg(target, errnoText(errno)));
    }
    if (S_ISLNK(st.st_mode)) {
        return setError(error, ErrorKind::Security, kStep,
                        QStringLiteral("refusing to remove symlink: %1").arg(target));
    }

    if (::unlink(targetUtf8.constData()) != 0 && errno != ENOENT) {
        return setError(error, ErrorKind::Filesystem, kStep,
                        QStringLiteral("cannot remove %1: %2").arg(target, errnoText(errno)));
    }
    m_written.removeAll(target);
    LOG_INFO(elfFs, "Removed %s", qUtf8Printable(target));

    // Deepest first; a directory another writer has populated stays.
    for (int i = m_createdDirs.size() - 1; i >= 0; --i) {
        const QByteArray dirUtf8 = QFile::encodeName(m_createdDirs.at(i));
        if (::rmdir(dirUtf8.constData()) == 0) {
            m_createdDirs.removeAt(i);
        }
    }
    return true;
}

} // namespace elf
