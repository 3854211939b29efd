#pragma once

#include "core/lock/advisory_lock.h"

#include <optional>

namespace elf {

// MkdirLock -- atomic directory creation as the lock token, for
// filesystems without working flock(2).
//
//   <lockPath>.dir/          token; exists while the lock is held
//   <lockPath>.dir/owner     "<pid>\n<host>\n" of the holder
//   <lockPath>.dir.reclaim/  guard held while a stale token is removed
//
// A token whose owner is a dead process on this host is reclaimed under
// the guard, so two waiters never both delete a token and both proceed.
// A token without an owner file is given kOwnerlessGraceMs to get one.
// Reclaim removes only the directory that was judged stale: if the token
// was replaced in the meantime (other inode or mtime) it is left alone.
class MkdirLock : public AdvisoryLock {
public:
    static constexpr int kDefaultPollIntervalMs = 1000;
    static constexpr int kOwnerlessGraceMs = 5000;
    static constexpr int kReclaimGuardStaleMs = 60000;

    struct Owner {
        qint64 pid = 0;
        QString host;
    };

    // Identity of a token directory at the time it was judged stale.
    struct TokenState {
        quint64 device = 0;
        quint64 inode = 0;
        qint64 mtime = 0;
        std::optional<Owner> owner;
    };

    explicit MkdirLock(const QString& lockPath, int pollIntervalMs = kDefaultPollIntervalMs);
    ~MkdirLock() override;

    bool acquire(int timeoutMs, WriteError* error) override;
    void release() override;
    bool isHeld() const override { return m_held; }
    LockStrategy strategy() const override { return LockStrategy::Mkdir; }

    QString tokenPath() const { return m_lockPath + QStringLiteral(".dir"); }
    QString ownerPath() const { return tokenPath() + QStringLiteral("/owner"); }
    QString reclaimGuardPath() const { return tokenPath() + QStringLiteral(".reclaim"); }

    static std::optional<Owner> readOwner(const QString& ownerFile);
    static bool processIsAlive(qint64 pid);

    // The current token if it is stale (dead owner on this host, or no owner
    // past the grace period), std::nullopt otherwise.
    std::optional<TokenState> staleToken() const;

    // Remove the token under the reclaim guard, provided it is still the
    // one described by `seen` and still stale.
    bool reclaimToken(const TokenState& seen);

private:
    bool writeOwner(WriteError* error);
    bool tryReclaimStale();
    bool statToken(TokenState* state) const;
    bool removeToken();

    bool m_held = false;
};

} // namespace elf
