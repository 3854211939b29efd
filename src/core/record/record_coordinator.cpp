#include "core/record/record_coordinator.h"
#include "core/fs/document_writer.h"
#include "core/fs/record_paths.h"
#include "core/index/index_writer.h"
#include "core/record/document_renderer.h"
#include "core/record/rollback_coordinator.h"
#include "core/record/sanitizer.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QDir>
#include <QElapsedTimer>

namespace elf {

namespace {

using StepKind = RollbackCoordinator::StepKind;

constexpr int kCollisionSuffixLength = 8;

// Stamps the correlation id on every log line for the duration of a call.
class CorrelationScope {
public:
    explicit CorrelationScope(const QString& id) { setLogCorrelationId(id); }
    ~CorrelationScope() { setLogCorrelationId(QString()); }
    CorrelationScope(const CorrelationScope&) = delete;
    CorrelationScope& operator=(const CorrelationScope&) = delete;
};

void addTiming(RecordResult& result, const QString& step, const QElapsedTimer& timer)
{
    result.timings.append(StepTiming{step, timer.elapsed()});
}

// Undo our staging, but only while holding the history lock: a failed
// commit retry may have left it released, and without it the reset could
// touch index entries another writer has staged meanwhile. If the lock
// cannot be had back within timeoutMs, nothing is unstaged.
bool unstageHoldingLock(HistoryCommitter& history, AdvisoryLock* lock, int timeoutMs,
                        WriteError* error)
{
    const QStringList staged = history.stagedPaths();
    if (staged.isEmpty()) {
        return true;
    }
    if (lock && !lock->isHeld()) {
        LOG_INFO(elfRecord, "Re-acquiring history lock to unstage %lld path(s)",
                 static_cast<long long>(staged.size()));
        WriteError lockError;
        if (!lock->acquire(timeoutMs, &lockError)) {
            LOG_ERROR(elfRecord, "Unstage skipped, history lock unavailable: %s",
                      qUtf8Printable(lockError.message));
            return setError(error, ErrorKind::LockTimeout, QStringLiteral("unstage"),
                            QStringLiteral("history lock not held (%1); still staged: %2")
                                .arg(lockError.message, staged.join(QLatin1Char(' '))));
        }
    }
    return history.unstage(staged, error);
}

} // namespace

QString recordStateToString(RecordState state)
{
    switch (state) {
    case RecordState::Validating:      return QStringLiteral("validating");
    case RecordState::WritingDocument: return QStringLiteral("writing_document");
    case RecordState::WritingIndex:    return QStringLiteral("writing_index");
    case RecordState::LockWait:        return QStringLiteral("lock_wait");
    case RecordState::Committing:      return QStringLiteral("committing");
    case RecordState::Done:            return QStringLiteral("done");
    case RecordState::RollingBack:     return QStringLiteral("rolling_back");
    case RecordState::Failed:          return QStringLiteral("failed");
    case RecordState::Rejected:        return QStringLiteral("rejected");
    }
    return QStringLiteral("unknown");
}

QString recordStatusToString(RecordStatus status)
{
    switch (status) {
    case RecordStatus::Done:               return QStringLiteral("done");
    case RecordStatus::SavedNotHistorized: return QStringLiteral("saved_not_historized");
    case RecordStatus::Rejected:           return QStringLiteral("rejected");
    case RecordStatus::Failed:             return QStringLiteral("failed");
    }
    return QStringLiteral("unknown");
}

int RecordResult::exitCode() const
{
    if (ok()) {
        return exit_code::kSuccess;
    }
    return exitCodeFor(error.kind);
}

RecordCoordinator::RecordCoordinator(WriteContext& context)
    : m_context(context)
{
}

QString RecordCoordinator::commitMessage(const LearningRecord& record)
{
    QString title = record.title;
    if (title.size() > 72) {
        title = title.left(69) + QStringLiteral("...");
    }
    return QStringLiteral("%1(%2): %3")
        .arg(learningTypeToString(record.type), record.domain.left(40), title);
}

void RecordCoordinator::transition(RecordResult& result, RecordState next)
{
    LOG_DEBUG(elfRecord, "%s -> %s", qUtf8Printable(recordStateToString(m_state)),
              qUtf8Printable(recordStateToString(next)));
    m_state = next;
    result.transitions.append(next);
}

RecordResult& RecordCoordinator::fail(RecordResult& result, const WriteError& error,
                                      RollbackCoordinator& rollback)
{
    const RecordState failedIn = m_state;
    result.error = error;
    result.status = RecordStatus::Failed;

    LOG_ERROR(elfRecord, "record failed in %s: %s",
              qUtf8Printable(recordStateToString(failedIn)),
              qUtf8Printable(error.toString()));

    transition(result, RecordState::RollingBack);
    QElapsedTimer timer;
    timer.start();
    const RollbackCoordinator::Report report = rollback.rollback();
    addTiming(result, QStringLiteral("rollback"), timer);

    result.rolledBack = report.attempted;
    result.rollbackComplete = report.complete;
    result.rollbackFailures = report.failures;
    if (result.rollbackComplete) {
        result.id = 0;
    }

    // Security errors abort before anything is written, so this also holds
    // for them; storage and later errors are retryable only once the undo
    // is confirmed.
    result.safeToRetry = report.complete;
    if (!report.complete) {
        LOG_ERROR(elfRecord, "Residual state after failed record; manual cleanup needed: %s",
                  qUtf8Printable(report.failures.join(QStringLiteral("; "))));
    }

    transition(result, RecordState::Failed);
    return result;
}

RecordResult RecordCoordinator::record(const RecordInput& input)
{
    if (m_context.correlationId().isEmpty()) {
        m_context.setCorrelationId(WriteContext::newCorrelationId());
    }
    const CorrelationScope scope(m_context.correlationId());
    const RecorderSettings& settings = m_context.settings();

    RecordResult result;
    result.correlationId = m_context.correlationId();
    m_state = RecordState::Validating;
    result.transitions.append(m_state);

    QElapsedTimer total;
    total.start();
    QElapsedTimer timer;

    // ── Validating ──────────────────────────────────────────
    timer.start();
    WriteError error;
    const QDateTime createdAt = QDateTime::currentDateTimeUtc();
    std::optional<LearningRecord> sanitized = Sanitizer::sanitizeRecord(input, createdAt, &error);
    if (!sanitized.has_value()) {
        addTiming(result, QStringLiteral("validate"), timer);
        result.error = error;
        result.status = RecordStatus::Rejected;
        result.safeToRetry = true;
        LOG_WARN(elfRecord, "record rejected: %s", qUtf8Printable(error.toString()));
        transition(result, RecordState::Rejected);
        return result;
    }
    if (!m_context.preflight(&error)) {
        // Valid input, unusable environment. Nothing was written yet, so
        // there is nothing to roll back.
        addTiming(result, QStringLiteral("validate"), timer);
        result.error = error;
        result.status = RecordStatus::Failed;
        result.safeToRetry = true;
        LOG_WARN(elfRecord, "preflight failed: %s", qUtf8Printable(error.toString()));
        transition(result, RecordState::Failed);
        return result;
    }
    LearningRecord record = std::move(*sanitized);

    const QString documentsRoot = settings.resolvedDocumentsRoot();
    result.absolutePath = RecordPaths::absoluteDocumentPath(documentsRoot, record);
    record.filepath = RecordPaths::toStoredPath(settings.baseDir, result.absolutePath);
    result.filepath = record.filepath;
    addTiming(result, QStringLiteral("validate"), timer);

    RollbackCoordinator rollback;
    DocumentWriter documents(documentsRoot);
    IndexWriter index(m_context.store(), settings);

    // ── Document ────────────────────────────────────────────
    transition(result, RecordState::WritingDocument);
    timer.restart();
    bool written = documents.write(result.absolutePath, DocumentRenderer::render(record), &error);
    if (!written && documents.lastWriteCollided()) {
        // Another title with the same slug in the same second.
        const QString suffix = Sanitizer::hashToken(record.title + m_context.correlationId(),
                                                    kCollisionSuffixLength);
        LOG_INFO(elfRecord, "%s exists, retrying with suffix %s",
                 qUtf8Printable(result.filepath), qUtf8Printable(suffix));
        result.absolutePath = RecordPaths::absoluteDocumentPath(documentsRoot, record, suffix);
        record.filepath = RecordPaths::toStoredPath(settings.baseDir, result.absolutePath);
        result.filepath = record.filepath;
        written = documents.write(result.absolutePath, DocumentRenderer::render(record), &error);
    }
    if (!written) {
        addTiming(result, QStringLiteral("document"), timer);
        return fail(result, error, rollback);
    }
    const QString documentPath = result.absolutePath;
    rollback.push(StepKind::DocumentWritten, documentPath,
                  [&documents, documentPath](WriteError* undoError) {
                      return documents.remove(documentPath, undoError);
                  });
    addTiming(result, QStringLiteral("document"), timer);

    // ── Index ───────────────────────────────────────────────
    transition(result, RecordState::WritingIndex);
    timer.restart();
    const std::optional<int64_t> id = index.insert(record, &error);
    addTiming(result, QStringLiteral("index"), timer);
    if (!id.has_value()) {
        return fail(result, error, rollback);
    }
    record.id = *id;
    result.id = *id;
    const LearningType type = record.type;
    rollback.push(StepKind::IndexInserted,
                  QStringLiteral("%1 row %2").arg(learningTypeToString(type)).arg(*id),
                  [&index, type, rowId = *id](WriteError* undoError) {
                      return index.remove(type, rowId, undoError);
                  });

    if (!settings.historyEnabled) {
        rollback.clear();
        result.status = RecordStatus::Done;
        transition(result, RecordState::Done);
        LOG_INFO(elfRecord, "Recorded %s id=%lld at %s in %lld ms (history disabled)",
                 qUtf8Printable(learningTypeToString(type)), static_cast<long long>(*id),
                 qUtf8Printable(result.filepath), static_cast<long long>(total.elapsed()));
        return result;
    }

    // Keeps the record but reports the missing commit.
    auto degrade = [&](const WriteError& cause) -> RecordResult& {
        LOG_WARN(elfRecord, "Saved id=%lld but not historized: %s",
                 static_cast<long long>(*id), qUtf8Printable(cause.toString()));
        WriteError unstageError;
        if (!unstageHoldingLock(m_context.history(), m_context.lock(), settings.lockTimeoutMs,
                                &unstageError)) {
            LOG_ERROR(elfRecord, "Unstage after history failure failed: %s",
                      qUtf8Printable(unstageError.toString()));
            result.rollbackComplete = false;
            result.rollbackFailures.append(
                QStringLiteral("%1: %2").arg(RollbackCoordinator::stepKindToString(
                                                 StepKind::HistoryStaged),
                                             unstageError.toString()));
        }
        if (AdvisoryLock* lock = m_context.lock()) {
            lock->release();
        }
        rollback.clear();
        result.error = cause;
        result.status = RecordStatus::SavedNotHistorized;
        result.safeToRetry = false;
        transition(result, RecordState::Done);
        return result;
    };
    const bool degradeOnHistoryFailure =
        settings.historyFailurePolicy == HistoryFailurePolicy::Degrade;

    // ── Lock ────────────────────────────────────────────────
    transition(result, RecordState::LockWait);
    timer.restart();
    AdvisoryLock* lock = m_context.lock();
    if (!lock->acquire(settings.lockTimeoutMs, &error)) {
        addTiming(result, QStringLiteral("lock_wait"), timer);
        if (degradeOnHistoryFailure && error.kind == ErrorKind::LockTimeout) {
            return degrade(error);
        }
        return fail(result, error, rollback);
    }
    rollback.push(StepKind::LockHeld, lock->lockPath(), [lock](WriteError*) {
        lock->release();
        return true;
    });
    addTiming(result, QStringLiteral("lock_wait"), timer);

    // ── Commit ──────────────────────────────────────────────
    transition(result, RecordState::Committing);
    timer.restart();

    WriteError checkpointError;
    if (!index.checkpoint(&checkpointError)) {
        // The commit goes ahead; the row may then only be in the -wal file.
        LOG_WARN(elfRecord, "Committing %s without a complete checkpoint: %s",
                 qUtf8Printable(settings.resolvedDbPath()),
                 qUtf8Printable(checkpointError.message));
    }

    QStringList paths{result.filepath};
    const QString dbStored = RecordPaths::toStoredPath(settings.baseDir, settings.resolvedDbPath());
    if (!QDir::isAbsolutePath(dbStored)) {
        paths.append(dbStored);
    } else {
        LOG_WARN(elfRecord, "Index %s lies outside the history working copy; not committed",
                 qUtf8Printable(dbStored));
    }
    if (QDir::isAbsolutePath(result.filepath)) {
        paths.removeFirst();
        LOG_WARN(elfRecord, "Document %s lies outside the history working copy; not committed",
                 qUtf8Printable(result.filepath));
    }

    HistoryCommitter& history = m_context.history();
    rollback.push(StepKind::HistoryStaged, paths.join(QLatin1Char(' ')),
                  [&history, lock, timeoutMs = settings.lockTimeoutMs](WriteError* undoError) {
                      return unstageHoldingLock(history, lock, timeoutMs, undoError);
                  });

    if (!history.commit(paths, commitMessage(record), *lock, settings.lockTimeoutMs, &error)) {
        addTiming(result, QStringLiteral("commit"), timer);
        if (degradeOnHistoryFailure) {
            return degrade(error);
        }
        return fail(result, error, rollback);
    }
    addTiming(result, QStringLiteral("commit"), timer);

    rollback.forget(StepKind::HistoryStaged);
    lock->release();
    rollback.clear();

    result.historized = true;
    result.status = RecordStatus::Done;
    transition(result, RecordState::Done);
    LOG_INFO(elfRecord, "Recorded %s id=%lld at %s in %lld ms",
             qUtf8Printable(learningTypeToString(type)), static_cast<long long>(*id),
             qUtf8Printable(result.filepath), static_cast<long long>(total.elapsed()));
    return result;
}

} // namespace elf
