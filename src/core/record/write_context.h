#pragma once

#include "core/history/history_committer.h"
#include "core/index/record_store.h"
#include "core/lock/advisory_lock.h"
#include "core/shared/settings.h"
#include "core/shared/write_error.h"

#include <QString>
#include <memory>

namespace elf {

class SQLiteStore;

// WriteContext -- everything one writer process needs, passed explicitly
// to the coordinator instead of living in globals: resolved settings, the
// index connection, the history lock and committer, and the correlation id
// of the call in progress.
class WriteContext {
public:
    // Open the index at settings.resolvedDbPath() and build the lock for the
    // configured strategy. Fails with a Dependency error when the index
    // cannot be opened.
    static std::unique_ptr<WriteContext> open(const RecorderSettings& settings,
                                              WriteError* error);

    // Assemble from parts (tests inject scripted stores and locks).
    // `lock` may be null when history is disabled.
    WriteContext(RecorderSettings settings,
                 std::unique_ptr<RecordStore> store,
                 std::unique_ptr<AdvisoryLock> lock);

    const RecorderSettings& settings() const { return m_settings; }
    RecordStore& store() { return *m_store; }

    // The production store, or nullptr when a substitute was injected.
    SQLiteStore* sqliteStore();

    AdvisoryLock* lock() { return m_lock.get(); }
    HistoryCommitter& history() { return m_history; }

    const QString& correlationId() const { return m_correlationId; }
    void setCorrelationId(const QString& id) { m_correlationId = id; }
    static QString newCorrelationId();

    // Environment checks before any write: documents root present and not
    // a symlink, git available and baseDir a working copy when history is
    // enabled.
    bool preflight(WriteError* error);

private:
    RecorderSettings m_settings;
    std::unique_ptr<RecordStore> m_store;
    std::unique_ptr<AdvisoryLock> m_lock;
    HistoryCommitter m_history;
    QString m_correlationId;
    bool m_preflightPassed = false;
};

} // namespace elf
