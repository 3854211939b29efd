#pragma once

#include "core/shared/write_error.h"

#include <QString>
#include <QStringList>
#include <functional>
#include <iterator>
#include <vector>

namespace elf {

// RollbackCoordinator -- remembers each completed side effect of one
// record() call together with its compensating action.
//
// rollback() undoes the steps in reverse order of completion, except that
// a held lock is always released last so unstaging and row deletion still
// run under it. Undo failures are logged and reported, never propagated:
// the caller keeps reporting the error that triggered the rollback.
class RollbackCoordinator {
public:
    enum class StepKind {
        DocumentWritten,
        IndexInserted,
        LockHeld,
        HistoryStaged,
    };

    using UndoFn = std::function<bool(WriteError*)>;

    struct Report {
        bool attempted = false;
        bool complete = true;      // every undo succeeded
        QStringList undone;        // descriptions, in undo order
        QStringList failures;      // "<description>: <error>"
    };

    static QString stepKindToString(StepKind kind);

    void push(StepKind kind, const QString& description, UndoFn undo);

    // Drop the most recent step of `kind` without undoing it, e.g. a lock
    // released on the normal path. Returns false if none was recorded.
    bool forget(StepKind kind);

    bool has(StepKind kind) const;
    bool isEmpty() const { return m_steps.empty(); }
    int size() const { return static_cast<int>(m_steps.size()); }

    // The record is complete; nothing is to be undone any more.
    void clear() { m_steps.clear(); }

    Report rollback();

private:
    struct Step {
        StepKind kind;
        QString description;
        UndoFn undo;
    };

    bool undoStep(const Step& step, Report& report);

    std::vector<Step> m_steps;
};

} // namespace elf
