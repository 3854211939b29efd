#include "core/index/index_writer.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QRandomGenerator>
#include <QThread>

#include <algorithm>
#include <sqlite3.h>

namespace elf {

namespace {

const QString kStep = QStringLiteral("index");

} // namespace

IndexWriter::IndexWriter(RecordStore& store, const RetryPolicy& policy)
    : m_store(store)
    , m_policy(policy)
{
    m_policy.maxAttempts = std::max(1, m_policy.maxAttempts);
    m_policy.backoffBaseMs = std::max(0, m_policy.backoffBaseMs);
    m_policy.backoffCapMs = std::max(0, m_policy.backoffCapMs);
    m_policy.jitterMs = std::max(0, m_policy.jitterMs);
}

IndexWriter::IndexWriter(RecordStore& store, const RecorderSettings& settings)
    : IndexWriter(store, RetryPolicy{settings.insertMaxAttempts,
                                     settings.insertBackoffBaseMs,
                                     settings.insertBackoffCapMs,
                                     settings.insertJitterMs})
{
}

bool IndexWriter::isTransient(int code)
{
    const int primary = code & 0xff;
    return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}

int IndexWriter::backoffDelayMs(int retry, int baseMs, int capMs)
{
    if (retry < 1 || baseMs <= 0) {
        return 0;
    }
    // Shift bounded so the doubling cannot overflow before the cap applies.
    const int shift = std::min(retry - 1, 20);
    const int64_t delay = static_cast<int64_t>(baseMs) << shift;
    return static_cast<int>(std::min<int64_t>(delay, capMs));
}

void IndexWriter::sleepBeforeRetry(int retry) const
{
    int delay = backoffDelayMs(retry, m_policy.backoffBaseMs, m_policy.backoffCapMs);
    if (m_policy.jitterMs > 0) {
        delay += static_cast<int>(QRandomGenerator::global()->bounded(m_policy.jitterMs + 1));
    }
    delay = std::min(delay, m_policy.backoffCapMs);
    if (delay > 0) {
        QThread::msleep(static_cast<unsigned long>(delay));
    }
}

StoreResult IndexWriter::runWithRetry(const char* operation,
                                      const std::function<StoreResult()>& step)
{
    StoreResult result;
    m_lastAttempts = 0;
    for (int attempt = 1; attempt <= m_policy.maxAttempts; ++attempt) {
        if (attempt > 1) {
            sleepBeforeRetry(attempt - 1);
        }
        m_lastAttempts = attempt;
        result = step();
        if (!isTransient(result.code)) {
            break;
        }
        LOG_WARN(elfIndex, "%s: database busy (attempt %d/%d): %s",
                 operation, attempt, m_policy.maxAttempts, qUtf8Printable(result.message));
    }
    return result;
}

std::optional<int64_t> IndexWriter::insert(const LearningRecord& record, WriteError* error)
{
    QElapsedTimer timer;
    timer.start();

    const StoreResult result = runWithRetry("insert", [this, &record]() {
        return m_store.insertRecord(record);
    });

    if (isTransient(result.code)) {
        LOG_ERROR(elfIndex, "Insert gave up after %d attempts (%lld ms)",
                  m_lastAttempts, static_cast<long long>(timer.elapsed()));
        setError(error, ErrorKind::Storage, kStep,
                 QStringLiteral("database busy after %1 attempts: %2")
                     .arg(m_lastAttempts)
                     .arg(result.message),
                 true);
        return std::nullopt;
    }

    if (result.code != SQLITE_DONE) {
        LOG_ERROR(elfIndex, "Insert failed (rc=%d): %s", result.code,
                  qUtf8Printable(result.message));
        setError(error, ErrorKind::Storage, kStep,
                 QStringLiteral("insert failed (rc=%1): %2").arg(result.code).arg(result.message));
        return std::nullopt;
    }

    // A completed step is not enough: the id must be real and unambiguous.
    if (result.rowId <= 0) {
        LOG_ERROR(elfIndex, "Insert returned invalid id %lld",
                  static_cast<long long>(result.rowId));
        setError(error, ErrorKind::Storage, kStep,
                 QStringLiteral("insert returned invalid id %1").arg(result.rowId));
        return std::nullopt;
    }
    if (result.changes != 1) {
        LOG_ERROR(elfIndex, "Insert changed %d rows, expected 1", result.changes);
        setError(error, ErrorKind::Storage, kStep,
                 QStringLiteral("insert changed %1 rows, expected exactly 1").arg(result.changes));
        return std::nullopt;
    }

    LOG_INFO(elfIndex, "Inserted %s id=%lld in %lld ms (%d attempt%s)",
             qUtf8Printable(learningTypeToString(record.type)),
             static_cast<long long>(result.rowId),
             static_cast<long long>(timer.elapsed()),
             m_lastAttempts, m_lastAttempts == 1 ? "" : "s");
    return result.rowId;
}

bool IndexWriter::remove(LearningType type, int64_t id, WriteError* error)
{
    if (id <= 0) {
        return setError(error, ErrorKind::Storage, kStep,
                        QStringLiteral("cannot remove invalid id %1").arg(id));
    }

    const StoreResult result = runWithRetry("remove", [this, type, id]() {
        return m_store.deleteRecord(type, id);
    });

    if (result.code != SQLITE_DONE) {
        LOG_ERROR(elfIndex, "Remove of id=%lld failed (rc=%d): %s",
                  static_cast<long long>(id), result.code, qUtf8Printable(result.message));
        return setError(error, ErrorKind::Storage, kStep,
                        QStringLiteral("remove of id %1 failed: %2").arg(id).arg(result.message),
                        isTransient(result.code));
    }

    if (result.changes == 0) {
        LOG_WARN(elfIndex, "Remove of id=%lld found no row", static_cast<long long>(id));
    } else {
        LOG_INFO(elfIndex, "Removed %s id=%lld",
                 qUtf8Printable(learningTypeToString(type)), static_cast<long long>(id));
    }
    return true;
}

bool IndexWriter::checkpoint(WriteError* error)
{
    QString message;
    if (!m_store.checkpoint(&message)) {
        return setError(error, ErrorKind::Storage, kStep,
                        QStringLiteral("WAL checkpoint failed: %1").arg(message), true);
    }
    return true;
}

} // namespace elf
