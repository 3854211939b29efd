#pragma once

#include "core/index/record_store.h"
#include "core/shared/settings.h"
#include "core/shared/types.h"
#include "core/shared/write_error.h"

#include <cstdint>
#include <functional>
#include <optional>

namespace elf {

// IndexWriter -- inserts one record into the index with busy-retry.
//
// Only SQLITE_BUSY / SQLITE_LOCKED are retried, with jittered exponential
// backoff (base doubling per attempt, plus jitter, capped). Anything else
// is permanent and returned on the first attempt. A successful step still
// fails unless it produced a positive row id and changed exactly one row.
class IndexWriter {
public:
    struct RetryPolicy {
        int maxAttempts = 5;
        int backoffBaseMs = 100;
        int backoffCapMs = 2000;
        int jitterMs = 100;
    };

    IndexWriter(RecordStore& store, const RetryPolicy& policy);
    IndexWriter(RecordStore& store, const RecorderSettings& settings);

    // Returns the assigned id, or nullopt with a Storage error.
    std::optional<int64_t> insert(const LearningRecord& record, WriteError* error);

    // Delete a row written by insert(). A row that is already gone is
    // treated as removed.
    bool remove(LearningType type, int64_t id, WriteError* error);

    // Best-effort WAL checkpoint before the database file is historized.
    bool checkpoint(WriteError* error);

    // Attempts used by the most recent insert() or remove().
    int lastAttempts() const { return m_lastAttempts; }

    static bool isTransient(int code);

    // Delay before retry number `retry` (1 = first retry), jitter excluded.
    static int backoffDelayMs(int retry, int baseMs, int capMs);

private:
    StoreResult runWithRetry(const char* operation, const std::function<StoreResult()>& step);
    void sleepBeforeRetry(int retry) const;

    RecordStore& m_store;
    RetryPolicy m_policy;
    int m_lastAttempts = 0;
};

} // namespace elf
