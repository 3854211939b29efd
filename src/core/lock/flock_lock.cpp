#include "core/lock/flock_lock.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace elf {

namespace {

const QString kStep = QStringLiteral("lock");

} // namespace

FlockLock::FlockLock(const QString& lockPath, int pollIntervalMs)
    : AdvisoryLock(lockPath, pollIntervalMs)
{
}

FlockLock::~FlockLock()
{
    release();
}

bool FlockLock::acquire(int timeoutMs, WriteError* error)
{
    if (isHeld()) {
        return true;
    }

    QElapsedTimer timer;
    timer.start();
    m_lastWaitMs = 0;

    const QString parent = QFileInfo(m_lockPath).absolutePath();
    if (!QDir().mkpath(parent)) {
        return setError(error, ErrorKind::Filesystem, kStep,
                        QStringLiteral("cannot create lock directory %1").arg(parent));
    }

    const QByteArray pathUtf8 = QFile::encodeName(m_lockPath);
    const int fd = ::open(pathUtf8.constData(), O_RDWR | O_CREAT | O_CLOEXEC | O_NOFOLLOW, 0600);
    if (fd < 0) {
        return setError(error, ErrorKind::Filesystem, kStep,
                        QStringLiteral("cannot open lock file %1: %2")
                            .arg(m_lockPath, QString::fromLocal8Bit(std::strerror(errno))));
    }

    int attempts = 0;
    while (true) {
        ++attempts;
        if (::flock(fd, LOCK_EX | LOCK_NB) == 0) {
            m_fd = fd;
            m_lastWaitMs = timer.elapsed();
            LOG_DEBUG(elfLock, "flock acquired %s after %lld ms (%d attempts)",
                      qUtf8Printable(m_lockPath), static_cast<long long>(m_lastWaitMs), attempts);
            return true;
        }

        const int err = errno;
        if (err == EINTR) {
            continue;
        }
        if (err != EWOULDBLOCK && err != EAGAIN) {
            ::close(fd);
            return setError(error, ErrorKind::Dependency, kStep,
                            QStringLiteral("flock failed on %1: %2")
                                .arg(m_lockPath, QString::fromLocal8Bit(std::strerror(err))));
        }

        const qint64 remaining = static_cast<qint64>(timeoutMs) - timer.elapsed();
        if (remaining <= 0) {
            ::close(fd);
            m_lastWaitMs = timer.elapsed();
            LOG_WARN(elfLock, "flock timed out on %s after %lld ms",
                     qUtf8Printable(m_lockPath), static_cast<long long>(m_lastWaitMs));
            return setError(error, ErrorKind::LockTimeout, kStep,
                            QStringLiteral("timed out after %1 ms waiting for %2")
                                .arg(timeoutMs)
                                .arg(m_lockPath),
                            true);
        }
        QThread::msleep(static_cast<unsigned long>(
            std::min<qint64>(remaining, std::max(1, m_pollIntervalMs))));
    }
}

void FlockLock::release()
{
    if (m_fd < 0) {
        return;
    }
    if (::flock(m_fd, LOCK_UN) != 0) {
        LOG_WARN(elfLock, "flock unlock failed on %s: %s",
                 qUtf8Printable(m_lockPath), std::strerror(errno));
    }
    ::close(m_fd);
    m_fd = -1;
    LOG_DEBUG(elfLock, "flock released %s", qUtf8Printable(m_lockPath));
}

} // namespace elf
