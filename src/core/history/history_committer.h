#pragma once

#include "core/shared/write_error.h"

#include <QString>
#include <QStringList>

namespace elf {

class AdvisoryLock;

// HistoryCommitter -- records documents and the index in the git working
// copy at repoDir. git runs as a child process bounded by timeoutMs.
//
// Only the given paths are staged and committed (`git commit -- <paths>`),
// so anything else sitting in the index is never captured. "Nothing to
// commit" counts as success.
class HistoryCommitter {
public:
    struct GitResult {
        bool started = false;
        bool timedOut = false;
        int exitCode = -1;
        QString stdoutText;
        QString stderrText;

        bool ok() const { return started && !timedOut && exitCode == 0; }
        QString summary() const;
    };

    HistoryCommitter(const QString& repoDir, int timeoutMs);

    static bool isGitAvailable();

    // True when repoDir is inside a git working tree.
    bool isRepository() const;

    // True when the repository has at least one commit.
    bool hasHead() const;

    // Stage and commit `paths` (relative to repoDir). The caller must hold
    // `lock`. A failure other than "nothing to commit" is retried once after
    // `lock` is released and re-acquired within lockTimeoutMs.
    bool commit(const QStringList& paths, const QString& message,
                AdvisoryLock& lock, int lockTimeoutMs, WriteError* error);

    // Single stage + commit attempt, no retry.
    bool commitOnce(const QStringList& paths, const QString& message, WriteError* error);

    // Remove `paths` from the index again (rollback of a failed commit).
    bool unstage(const QStringList& paths, WriteError* error);

    // Paths this committer has staged and not yet committed or unstaged.
    const QStringList& stagedPaths() const { return m_staged; }
    bool lastCommitWasNoop() const { return m_lastNoop; }

    GitResult runGit(const QStringList& args) const;

    const QString& repoDir() const { return m_repoDir; }

private:
    static bool isNothingToCommit(const GitResult& result);

    QString m_repoDir;
    int m_timeoutMs = 10000;
    QStringList m_staged;
    bool m_lastNoop = false;
};

} // namespace elf
