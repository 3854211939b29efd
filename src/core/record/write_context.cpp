#include "core/record/write_context.h"
#include "core/fs/path_guard.h"
#include "core/index/sqlite_store.h"
#include "core/shared/logging.h"

#include <QCoreApplication>
#include <QDir>
#include <QUuid>

namespace elf {

namespace {

const QString kStep = QStringLiteral("preflight");

} // namespace

std::unique_ptr<WriteContext> WriteContext::open(const RecorderSettings& settings,
                                                 WriteError* error)
{
    QString openError;
    auto store = SQLiteStore::open(settings.resolvedDbPath(), settings.sqliteBusyTimeoutMs,
                                   &openError);
    if (!store.has_value()) {
        setError(error, ErrorKind::Dependency, QStringLiteral("index"),
                 QStringLiteral("cannot open index: %1").arg(openError));
        return nullptr;
    }

    std::unique_ptr<AdvisoryLock> lock;
    if (settings.historyEnabled) {
        lock = createAdvisoryLock(settings.resolvedLockPath(), settings.lockStrategy,
                                  settings.lockPollIntervalMs);
        LOG_DEBUG(elfLock, "Using %s lock at %s",
                  qUtf8Printable(lockStrategyToString(lock->strategy())),
                  qUtf8Printable(lock->lockPath()));
    }

    return std::make_unique<WriteContext>(
        settings, std::make_unique<SQLiteStore>(std::move(*store)), std::move(lock));
}

WriteContext::WriteContext(RecorderSettings settings,
                           std::unique_ptr<RecordStore> store,
                           std::unique_ptr<AdvisoryLock> lock)
    : m_settings(std::move(settings))
    , m_store(std::move(store))
    , m_lock(std::move(lock))
    , m_history(m_settings.baseDir, m_settings.gitTimeoutMs)
{
}

SQLiteStore* WriteContext::sqliteStore()
{
    return dynamic_cast<SQLiteStore*>(m_store.get());
}

QString WriteContext::newCorrelationId()
{
    return QStringLiteral("%1-%2")
        .arg(QCoreApplication::applicationPid())
        .arg(QUuid::createUuid().toString(QUuid::WithoutBraces).left(8));
}

bool WriteContext::preflight(WriteError* error)
{
    if (m_preflightPassed) {
        return true;
    }

    if (!m_store) {
        return setError(error, ErrorKind::Dependency, kStep, QStringLiteral("no index store"));
    }

    const QString documentsRoot = m_settings.resolvedDocumentsRoot();
    if (PathGuard::isSymlink(documentsRoot)) {
        return setError(error, ErrorKind::Security, kStep,
                        QStringLiteral("documents root is a symlink: %1").arg(documentsRoot));
    }
    if (!QDir().mkpath(documentsRoot)) {
        return setError(error, ErrorKind::Filesystem, kStep,
                        QStringLiteral("cannot create documents root %1").arg(documentsRoot));
    }

    if (m_settings.historyEnabled) {
        if (!m_lock) {
            return setError(error, ErrorKind::Dependency, kStep,
                            QStringLiteral("history enabled but no lock configured"));
        }
        if (!HistoryCommitter::isGitAvailable()) {
            return setError(error, ErrorKind::Dependency, kStep,
                            QStringLiteral("git executable not found in PATH"));
        }
        if (!m_history.isRepository()) {
            return setError(error, ErrorKind::Dependency, kStep,
                            QStringLiteral("%1 is not a git working copy").arg(m_settings.baseDir));
        }
    }

    m_preflightPassed = true;
    return true;
}

} // namespace elf
