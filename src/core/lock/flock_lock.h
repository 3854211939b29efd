#pragma once

#include "core/lock/advisory_lock.h"

namespace elf {

// FlockLock -- flock(LOCK_EX | LOCK_NB) on the lock file, polled until the
// deadline. The kernel drops the lock when the descriptor closes, so a
// crashed holder never leaves it behind. Every instance opens its own
// descriptor, which makes two instances in one process contend like two
// processes do.
class FlockLock : public AdvisoryLock {
public:
    static constexpr int kDefaultPollIntervalMs = 50;

    explicit FlockLock(const QString& lockPath, int pollIntervalMs = kDefaultPollIntervalMs);
    ~FlockLock() override;

    bool acquire(int timeoutMs, WriteError* error) override;
    void release() override;
    bool isHeld() const override { return m_fd >= 0; }
    LockStrategy strategy() const override { return LockStrategy::Flock; }

private:
    int m_fd = -1;
};

} // namespace elf
