#include "core/history/history_committer.h"
#include "core/lock/advisory_lock.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QElapsedTimer>
#include <QProcess>
#include <QProcessEnvironment>
#include <QStandardPaths>

namespace elf {

namespace {

const QString kStep = QStringLiteral("history");
const QString kGit = QStringLiteral("git");

} // anonymous namespace

QString HistoryCommitter::GitResult::summary() const
{
    if (!started) {
        return QStringLiteral("git could not be started");
    }
    if (timedOut) {
        return QStringLiteral("git timed out");
    }
    const QString text = stderrText.trimmed().isEmpty() ? stdoutText.trimmed()
                                                        : stderrText.trimmed();
    return QStringLiteral("exit %1: %2").arg(exitCode).arg(text.left(300));
}

HistoryCommitter::HistoryCommitter(const QString& repoDir, int timeoutMs)
    : m_repoDir(QDir::cleanPath(QDir(repoDir).absolutePath()))
    , m_timeoutMs(timeoutMs > 0 ? timeoutMs : 10000)
{
}

bool HistoryCommitter::isGitAvailable()
{
    return !QStandardPaths::findExecutable(kGit).isEmpty();
}

HistoryCommitter::GitResult HistoryCommitter::runGit(const QStringList& args) const
{
    QStringList fullArgs{QStringLiteral("-C"), m_repoDir};
    fullArgs += args;

    QProcess process;
    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    env.insert(QStringLiteral("LC_ALL"), QStringLiteral("C"));
    env.insert(QStringLiteral("GIT_TERMINAL_PROMPT"), QStringLiteral("0"));
    process.setProcessEnvironment(env);
    process.start(kGit, fullArgs);

    GitResult result;
    if (!process.waitForStarted(m_timeoutMs)) {
        LOG_ERROR(elfHistory, "Failed to start git: %s", qUtf8Printable(process.errorString()));
        return result;
    }
    result.started = true;

    if (!process.waitForFinished(m_timeoutMs)) {
        process.kill();
        process.waitForFinished();
        result.timedOut = true;
        LOG_ERROR(elfHistory, "git %s timed out after %d ms",
                  qUtf8Printable(args.value(0)), m_timeoutMs);
        return result;
    }

    result.exitCode = process.exitStatus() == QProcess::NormalExit ? process.exitCode() : -1;
    result.stdoutText = QString::fromUtf8(process.readAllStandardOutput());
    result.stderrText = QString::fromUtf8(process.readAllStandardError());
    return result;
}

bool HistoryCommitter::isRepository() const
{
    const GitResult result = runGit({QStringLiteral("rev-parse"),
                                     QStringLiteral("--is-inside-work-tree")});
    return result.ok() && result.stdoutText.trimmed() == QLatin1String("true");
}

bool HistoryCommitter::hasHead() const
{
    return runGit({QStringLiteral("rev-parse"), QStringLiteral("--verify"),
                   QStringLiteral("-q"), QStringLiteral("HEAD")}).ok();
}

bool HistoryCommitter::isNothingToCommit(const GitResult& result)
{
    if (!result.started || result.timedOut || result.exitCode != 1) {
        return false;
    }
    const QString text = result.stdoutText + result.stderrText;
    return text.contains(QLatin1String("nothing to commit"))
        || text.contains(QLatin1String("no changes added to commit"))
        || text.contains(QLatin1String("nothing added to commit"));
}

bool HistoryCommitter::commitOnce(const QStringList& paths, const QString& message,
                                  WriteError* error)
{
    m_lastNoop = false;
    if (paths.isEmpty()) {
        m_lastNoop = true;
        return true;
    }

    QStringList addArgs{QStringLiteral("add"), QStringLiteral("--")};
    addArgs += paths;
    const GitResult added = runGit(addArgs);
    if (!added.ok()) {
        LOG_ERROR(elfHistory, "git add failed: %s", qUtf8Printable(added.summary()));
        return setError(error, added.started ? ErrorKind::History : ErrorKind::Dependency, kStep,
                        QStringLiteral("git add failed: %1").arg(added.summary()),
                        added.timedOut);
    }
    for (const QString& path : paths) {
        if (!m_staged.contains(path)) {
            m_staged.append(path);
        }
    }

    QStringList commitArgs{QStringLiteral("commit"), QStringLiteral("-q"),
                           QStringLiteral("-m"), message, QStringLiteral("--")};
    commitArgs += paths;
    const GitResult committed = runGit(commitArgs);
    if (committed.ok()) {
        m_staged.clear();
        return true;
    }
    if (isNothingToCommit(committed)) {
        LOG_INFO(elfHistory, "Nothing to commit for %lld path(s)",
                 static_cast<long long>(paths.size()));
        m_staged.clear();
        m_lastNoop = true;
        return true;
    }

    LOG_WARN(elfHistory, "git commit failed: %s", qUtf8Printable(committed.summary()));
    return setError(error, ErrorKind::History, kStep,
                    QStringLiteral("git commit failed: %1").arg(committed.summary()),
                    true);
}

bool HistoryCommitter::commit(const QStringList& paths, const QString& message,
                              AdvisoryLock& lock, int lockTimeoutMs, WriteError* error)
{
    QElapsedTimer timer;
    timer.start();

    WriteError firstError;
    if (commitOnce(paths, message, &firstError)) {
        LOG_INFO(elfHistory, "Committed %lld path(s) in %lld ms",
                 static_cast<long long>(paths.size()), static_cast<long long>(timer.elapsed()));
        return true;
    }
    if (firstError.kind == ErrorKind::Dependency) {
        if (error) *error = firstError;
        return false;
    }

    // One retry, after giving anyone queued on the lock a turn.
    LOG_WARN(elfHistory, "Retrying commit after lock re-acquisition: %s",
             qUtf8Printable(firstError.message));
    lock.release();
    if (!lock.acquire(lockTimeoutMs, error)) {
        return false;
    }

    WriteError secondError;
    if (commitOnce(paths, message, &secondError)) {
        LOG_INFO(elfHistory, "Committed %lld path(s) on retry in %lld ms",
                 static_cast<long long>(paths.size()), static_cast<long long>(timer.elapsed()));
        return true;
    }

    LOG_ERROR(elfHistory, "Commit failed twice: %s", qUtf8Printable(secondError.message));
    secondError.transient = false;
    if (error) *error = secondError;
    return false;
}

bool HistoryCommitter::unstage(const QStringList& requested, WriteError* error)
{
    // `requested` may be stagedPaths() itself.
    const QStringList paths = requested;
    if (paths.isEmpty()) {
        return true;
    }

    QStringList args;
    if (hasHead()) {
        args = {QStringLiteral("reset"), QStringLiteral("-q"), QStringLiteral("HEAD"),
                QStringLiteral("--")};
    } else {
        args = {QStringLiteral("rm"), QStringLiteral("--cached"), QStringLiteral("-q"),
                QStringLiteral("--ignore-unmatch"), QStringLiteral("--")};
    }
    args += paths;

    const GitResult result = runGit(args);
    if (!result.ok()) {
        LOG_ERROR(elfHistory, "Unstage failed: %s", qUtf8Printable(result.summary()));
        return setError(error, ErrorKind::History, kStep,
                        QStringLiteral("unstage failed: %1").arg(result.summary()));
    }

    for (const QString& path : paths) {
        m_staged.removeAll(path);
    }
    LOG_INFO(elfHistory, "Unstaged %lld path(s)", static_cast<long long>(paths.size()));
    return true;
}

} // namespace elf
