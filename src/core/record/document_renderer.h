#pragma once

#include "core/shared/types.h"

#include <QByteArray>

namespace elf {

// Renders the Markdown document for a sanitized record.
// Failures, successes and experiments share the analysis template;
// heuristics get the rule card. Output is UTF-8 and ends with a newline.
class DocumentRenderer {
public:
    static QByteArray render(const LearningRecord& record);

private:
    static QString renderAnalysis(const LearningRecord& record);
    static QString renderHeuristic(const LearningRecord& record);
};

} // namespace elf
