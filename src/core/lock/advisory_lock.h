#pragma once

#include "core/shared/settings.h"
#include "core/shared/write_error.h"

#include <QString>
#include <memory>

namespace elf {

// AdvisoryLock -- cross-process mutual exclusion around history commits.
//
// Implementations poll with a bounded wait: acquire() either holds the
// lock or fails with LockTimeout once timeoutMs has elapsed. A held lock
// is released by release() or by the destructor, so no exit path through
// the owning scope leaves it behind.
class AdvisoryLock {
public:
    explicit AdvisoryLock(const QString& lockPath, int pollIntervalMs);
    virtual ~AdvisoryLock() = default;

    AdvisoryLock(const AdvisoryLock&) = delete;
    AdvisoryLock& operator=(const AdvisoryLock&) = delete;

    // Returns true immediately when already held by this object.
    virtual bool acquire(int timeoutMs, WriteError* error) = 0;
    virtual void release() = 0;
    virtual bool isHeld() const = 0;
    virtual LockStrategy strategy() const = 0;

    const QString& lockPath() const { return m_lockPath; }
    int pollIntervalMs() const { return m_pollIntervalMs; }

    // Time spent waiting in the most recent acquire().
    qint64 lastWaitMs() const { return m_lastWaitMs; }

protected:
    QString m_lockPath;
    int m_pollIntervalMs = 0;
    qint64 m_lastWaitMs = 0;
};

// Decide which strategy works for the directory holding lockPath:
// Flock when the filesystem honours flock(2), Mkdir otherwise.
LockStrategy probeLockStrategy(const QString& lockPath);

// Build the lock for `strategy` (Auto runs the probe). pollIntervalMs <= 0
// selects the strategy default.
std::unique_ptr<AdvisoryLock> createAdvisoryLock(const QString& lockPath,
                                                 LockStrategy strategy,
                                                 int pollIntervalMs = 0);

} // namespace elf
