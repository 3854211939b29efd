#include "core/lock/advisory_lock.h"
#include "core/lock/flock_lock.h"
#include "core/lock/mkdir_lock.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>

#ifdef Q_OS_UNIX
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#endif

namespace elf {

AdvisoryLock::AdvisoryLock(const QString& lockPath, int pollIntervalMs)
    : m_lockPath(QDir::cleanPath(lockPath))
    , m_pollIntervalMs(pollIntervalMs)
{
}

LockStrategy probeLockStrategy(const QString& lockPath)
{
#ifdef Q_OS_UNIX
    const QString probePath = QDir::cleanPath(lockPath) + QStringLiteral(".probe");
    QDir().mkpath(QFileInfo(probePath).absolutePath());

    const QByteArray probeUtf8 = QFile::encodeName(probePath);
    const int fd = ::open(probeUtf8.constData(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd < 0) {
        LOG_WARN(elfLock, "Lock probe could not open %s (%s), using mkdir locks",
                 qUtf8Printable(probePath), std::strerror(errno));
        return LockStrategy::Mkdir;
    }

    LockStrategy strategy = LockStrategy::Flock;
    if (::flock(fd, LOCK_EX | LOCK_NB) == 0) {
        ::flock(fd, LOCK_UN);
    } else if (errno != EWOULDBLOCK && errno != EAGAIN) {
        LOG_INFO(elfLock, "flock unsupported on %s (%s), using mkdir locks",
                 qUtf8Printable(probePath), std::strerror(errno));
        strategy = LockStrategy::Mkdir;
    }
    ::close(fd);
    return strategy;
#else
    Q_UNUSED(lockPath);
    return LockStrategy::Mkdir;
#endif
}

std::unique_ptr<AdvisoryLock> createAdvisoryLock(const QString& lockPath,
                                                 LockStrategy strategy,
                                                 int pollIntervalMs)
{
    if (strategy == LockStrategy::Auto) {
        strategy = probeLockStrategy(lockPath);
    }

    if (strategy == LockStrategy::Flock) {
        return std::make_unique<FlockLock>(
            lockPath, pollIntervalMs > 0 ? pollIntervalMs : FlockLock::kDefaultPollIntervalMs);
    }
    return std::make_unique<MkdirLock>(
        lockPath, pollIntervalMs > 0 ? pollIntervalMs : MkdirLock::kDefaultPollIntervalMs);
}

} // namespace elf
