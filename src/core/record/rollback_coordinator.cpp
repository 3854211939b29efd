#include "core/record/rollback_coordinator.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>

namespace elf {

QString RollbackCoordinator::stepKindToString(StepKind kind)
{
    switch (kind) {
    case StepKind::DocumentWritten: return QStringLiteral("document");
    case StepKind::IndexInserted:   return QStringLiteral("index");
    case StepKind::LockHeld:        return QStringLiteral("lock");
    case StepKind::HistoryStaged:   return QStringLiteral("staged");
    }
    return QStringLiteral("step");
}

void RollbackCoordinator::push(StepKind kind, const QString& description, UndoFn undo)
{
    m_steps.push_back(Step{kind, description, std::move(undo)});
}

bool RollbackCoordinator::forget(StepKind kind)
{
    for (auto it = m_steps.rbegin(); it != m_steps.rend(); ++it) {
        if (it->kind == kind) {
            m_steps.erase(std::next(it).base());
            return true;
        }
    }
    return false;
}

bool RollbackCoordinator::has(StepKind kind) const
{
    for (const Step& step : m_steps) {
        if (step.kind == kind) {
            return true;
        }
    }
    return false;
}

bool RollbackCoordinator::undoStep(const Step& step, Report& report)
{
    WriteError error;
    const bool ok = step.undo ? step.undo(&error) : true;
    if (ok) {
        report.undone.append(step.description);
        LOG_INFO(elfRecord, "Rolled back %s: %s",
                 qUtf8Printable(stepKindToString(step.kind)),
                 qUtf8Printable(step.description));
        return true;
    }

    report.complete = false;
    const QString detail = error.isSet() ? error.toString() : QStringLiteral("undo failed");
    report.failures.append(QStringLiteral("%1: %2").arg(step.description, detail));
    LOG_ERROR(elfRecord, "Rollback of %s failed (%s): %s",
              qUtf8Printable(stepKindToString(step.kind)),
              qUtf8Printable(step.description),
              qUtf8Printable(detail));
    return false;
}

RollbackCoordinator::Report RollbackCoordinator::rollback()
{
    Report report;
    if (m_steps.empty()) {
        return report;
    }
    report.attempted = true;

    QElapsedTimer timer;
    timer.start();

    // Everything but the lock, newest first.
    for (auto it = m_steps.rbegin(); it != m_steps.rend(); ++it) {
        if (it->kind != StepKind::LockHeld) {
            undoStep(*it, report);
        }
    }
    for (auto it = m_steps.rbegin(); it != m_steps.rend(); ++it) {
        if (it->kind == StepKind::LockHeld) {
            undoStep(*it, report);
        }
    }
    m_steps.clear();

    LOG_INFO(elfRecord, "Rollback %s in %lld ms (%lld undone, %lld failed)",
             report.complete ? "complete" : "INCOMPLETE",
             static_cast<long long>(timer.elapsed()),
             static_cast<long long>(report.undone.size()),
             static_cast<long long>(report.failures.size()));
    return report;
}

} // namespace elf
