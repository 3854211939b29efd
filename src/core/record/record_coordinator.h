#pragma once

#include "core/record/write_context.h"
#include "core/shared/types.h"
#include "core/shared/write_error.h"

#include <QList>
#include <QString>
#include <cstdint>

namespace elf {

class RollbackCoordinator;

// States of one record() call.
//
//   Validating -> WritingDocument -> WritingIndex -> LockWait -> Committing -> Done
//
// Invalid input fails Validating -> Rejected. A failed preflight (valid
// input, unusable environment) goes Validating -> Failed directly, as
// nothing has been written. Every later state fails through RollingBack
// to Failed.
enum class RecordState {
    Validating,
    WritingDocument,
    WritingIndex,
    LockWait,
    Committing,
    Done,
    RollingBack,
    Failed,
    Rejected,
};

QString recordStateToString(RecordState state);

enum class RecordStatus {
    Done,                 // document, row and commit all exist
    SavedNotHistorized,   // degrade policy: document + row kept, no commit
    Rejected,             // invalid input, no side effects
    Failed,               // error after validation, rolled back
};

QString recordStatusToString(RecordStatus status);

struct StepTiming {
    QString step;
    qint64 durationMs = 0;
};

struct RecordResult {
    RecordStatus status = RecordStatus::Failed;
    int64_t id = 0;
    QString filepath;        // stored form, relative to the base directory
    QString absolutePath;
    QString correlationId;
    WriteError error;

    bool rolledBack = false;       // a rollback ran
    bool rollbackComplete = true;  // ... and every undo succeeded
    QStringList rollbackFailures;
    bool safeToRetry = false;      // a verbatim retry cannot duplicate data
    bool historized = false;

    QList<RecordState> transitions;
    QList<StepTiming> timings;

    bool ok() const
    {
        return status == RecordStatus::Done || status == RecordStatus::SavedNotHistorized;
    }
    int exitCode() const;
};

// RecordCoordinator -- runs record() against one WriteContext.
class RecordCoordinator {
public:
    explicit RecordCoordinator(WriteContext& context);

    RecordResult record(const RecordInput& input);

    RecordState state() const { return m_state; }

    static QString commitMessage(const LearningRecord& record);

private:
    void transition(RecordResult& result, RecordState next);
    RecordResult& fail(RecordResult& result, const WriteError& error,
                       RollbackCoordinator& rollback);

    WriteContext& m_context;
    RecordState m_state = RecordState::Validating;
};

} // namespace elf
