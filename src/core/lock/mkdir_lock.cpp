#include "core/lock/mkdir_lock.h"
#include "core/shared/logging.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QSysInfo>
#include <QThread>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace elf {

namespace {

const QString kStep = QStringLiteral("lock");

qint64 ageMs(const QString& path)
{
    const QFileInfo info(path);
    if (!info.exists()) {
        return -1;
    }
    return info.lastModified().msecsTo(QDateTime::currentDateTime());
}

} // namespace

MkdirLock::MkdirLock(const QString& lockPath, int pollIntervalMs)
    : AdvisoryLock(lockPath, pollIntervalMs)
{
}

MkdirLock::~MkdirLock()
{
    release();
}

bool MkdirLock::processIsAlive(qint64 pid)
{
    if (pid <= 0) {
        return false;
    }
    // EPERM: the process exists but belongs to someone else.
    return ::kill(static_cast<pid_t>(pid), 0) == 0 || errno == EPERM;
}

std::optional<MkdirLock::Owner> MkdirLock::readOwner(const QString& ownerFile)
{
    QFile file(ownerFile);
    if (!file.open(QIODevice::ReadOnly)) {
        return std::nullopt;
    }
    const QList<QByteArray> lines = file.readAll().split('\n');
    if (lines.isEmpty()) {
        return std::nullopt;
    }
    bool ok = false;
    Owner owner;
    owner.pid = lines.at(0).trimmed().toLongLong(&ok);
    if (!ok || owner.pid <= 0) {
        return std::nullopt;
    }
    if (lines.size() > 1) {
        owner.host = QString::fromUtf8(lines.at(1).trimmed());
    }
    return owner;
}

bool MkdirLock::writeOwner(WriteError* error)
{
    QFile file(ownerPath());
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return setError(error, ErrorKind::Filesystem, kStep,
                        QStringLiteral("cannot write lock owner %1").arg(ownerPath()));
    }
    const QByteArray content = QByteArray::number(QCoreApplication::applicationPid())
        + '\n' + QSysInfo::machineHostName().toUtf8() + '\n';
    if (file.write(content) != content.size()) {
        file.close();
        return setError(error, ErrorKind::Filesystem, kStep,
                        QStringLiteral("short write to lock owner %1").arg(ownerPath()));
    }
    file.close();
    return true;
}

bool MkdirLock::removeToken()
{
    QFile::remove(ownerPath());
    const QByteArray tokenUtf8 = QFile::encodeName(tokenPath());
    if (::rmdir(tokenUtf8.constData()) != 0 && errno != ENOENT) {
        LOG_WARN(elfLock, "Failed to remove lock token %s: %s",
                 qUtf8Printable(tokenPath()), std::strerror(errno));
        return false;
    }
    return true;
}

bool MkdirLock::statToken(TokenState* state) const
{
    struct stat st{};
    const QByteArray tokenUtf8 = QFile::encodeName(tokenPath());
    if (::lstat(tokenUtf8.constData(), &st) != 0 || !S_ISDIR(st.st_mode)) {
        return false;
    }
    state->device = static_cast<quint64>(st.st_dev);
    state->inode = static_cast<quint64>(st.st_ino);
    state->mtime = static_cast<qint64>(st.st_mtime);
    return true;
}

std::optional<MkdirLock::TokenState> MkdirLock::staleToken() const
{
    TokenState state;
    if (!statToken(&state)) {
        return std::nullopt;
    }
    state.owner = readOwner(ownerPath());

    bool stale = false;
    if (state.owner.has_value()) {
        const bool sameHost = state.owner->host.isEmpty()
            || state.owner->host == QSysInfo::machineHostName();
        stale = sameHost && !processIsAlive(state.owner->pid);
    } else {
        stale = ageMs(tokenPath()) > kOwnerlessGraceMs;
    }
    if (!stale) {
        return std::nullopt;
    }
    return state;
}

bool MkdirLock::reclaimToken(const TokenState& seen)
{
    const QByteArray guardUtf8 = QFile::encodeName(reclaimGuardPath());
    if (::mkdir(guardUtf8.constData(), 0700) != 0) {
        // Someone else is reclaiming.
        return false;
    }

    // Between the staleness verdict and the guard the token may have been
    // reclaimed by someone else and re-created by a live acquirer. Only the
    // exact directory that was judged stale, still stale, may be removed.
    bool unchanged = false;
    TokenState current;
    if (statToken(&current)) {
        current.owner = readOwner(ownerPath());
        unchanged = current.device == seen.device
            && current.inode == seen.inode
            && current.mtime == seen.mtime;
        if (unchanged && seen.owner.has_value()) {
            unchanged = current.owner.has_value()
                && current.owner->pid == seen.owner->pid
                && !processIsAlive(current.owner->pid);
        } else if (unchanged) {
            unchanged = !current.owner.has_value()
                && ageMs(tokenPath()) > kOwnerlessGraceMs;
        }
    }

    bool reclaimed = false;
    if (unchanged) {
        LOG_WARN(elfLock, "Reclaiming stale lock %s (owner pid %lld)",
                 qUtf8Printable(tokenPath()),
                 static_cast<long long>(seen.owner.has_value() ? seen.owner->pid : 0));
        reclaimed = removeToken();
    } else {
        LOG_DEBUG(elfLock, "Lock token %s changed hands before reclaim, leaving it",
                  qUtf8Printable(tokenPath()));
    }

    ::rmdir(guardUtf8.constData());
    return reclaimed;
}

bool MkdirLock::tryReclaimStale()
{
    // A guard left by a reclaimer that died mid-way.
    const qint64 guardAge = ageMs(reclaimGuardPath());
    if (guardAge > kReclaimGuardStaleMs) {
        LOG_WARN(elfLock, "Removing abandoned reclaim guard %s (%lld ms old)",
                 qUtf8Printable(reclaimGuardPath()), static_cast<long long>(guardAge));
        const QByteArray guardUtf8 = QFile::encodeName(reclaimGuardPath());
        ::rmdir(guardUtf8.constData());
    }

    const std::optional<TokenState> seen = staleToken();
    if (!seen.has_value()) {
        return false;
    }
    return reclaimToken(*seen);
}

bool MkdirLock::acquire(int timeoutMs, WriteError* error)
{
    if (m_held) {
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

    const QByteArray tokenUtf8 = QFile::encodeName(tokenPath());
    int attempts = 0;
    while (true) {
        ++attempts;
        if (::mkdir(tokenUtf8.constData(), 0700) == 0) {
            if (!writeOwner(error)) {
                removeToken();
                return false;
            }
            m_held = true;
            m_lastWaitMs = timer.elapsed();
            LOG_DEBUG(elfLock, "mkdir lock acquired %s after %lld ms (%d attempts)",
                      qUtf8Printable(tokenPath()), static_cast<long long>(m_lastWaitMs), attempts);
            return true;
        }

        const int err = errno;
        if (err != EEXIST) {
            return setError(error, ErrorKind::Filesystem, kStep,
                            QStringLiteral("cannot create lock token %1: %2")
                                .arg(tokenPath(), QString::fromLocal8Bit(std::strerror(err))));
        }

        if (tryReclaimStale()) {
            continue;
        }

        const qint64 remaining = static_cast<qint64>(timeoutMs) - timer.elapsed();
        if (remaining <= 0) {
            m_lastWaitMs = timer.elapsed();
            LOG_WARN(elfLock, "mkdir lock timed out on %s after %lld ms",
                     qUtf8Printable(tokenPath()), static_cast<long long>(m_lastWaitMs));
            return setError(error, ErrorKind::LockTimeout, kStep,
                            QStringLiteral("timed out after %1 ms waiting for %2")
                                .arg(timeoutMs)
                                .arg(tokenPath()),
                            true);
        }
        QThread::msleep(static_cast<unsigned long>(
            std::min<qint64>(remaining, std::max(1, m_pollIntervalMs))));
    }
}

void MkdirLock::release()
{
    if (!m_held) {
        return;
    }
    m_held = false;

    const std::optional<Owner> owner = readOwner(ownerPath());
    if (owner.has_value() && owner->pid != QCoreApplication::applicationPid()) {
        LOG_WARN(elfLock, "Lock token %s now owned by pid %lld, leaving it",
                 qUtf8Printable(tokenPath()), static_cast<long long>(owner->pid));
        return;
    }
    if (removeToken()) {
        LOG_DEBUG(elfLock, "mkdir lock released %s", qUtf8Printable(tokenPath()));
    }
}

} // namespace elf
