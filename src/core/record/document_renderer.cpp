#include "core/record/document_renderer.h"

namespace elf {

namespace {

QString titleCase(const QString& word)
{
    if (word.isEmpty()) {
        return word;
    }
    return word.left(1).toUpper() + word.mid(1);
}

} // namespace

QByteArray DocumentRenderer::render(const LearningRecord& record)
{
    const QString text = record.isHeuristic() ? renderHeuristic(record)
                                              : renderAnalysis(record);
    return text.toUtf8();
}

QString DocumentRenderer::renderAnalysis(const LearningRecord& record)
{
    const QString created = record.createdAt.toUTC().toString(Qt::ISODate);
    const QString tags = record.tags.isEmpty() ? QStringLiteral("none")
                                               : record.tags.join(QStringLiteral(", "));

    QString out;
    out += QStringLiteral("# %1: %2\n\n").arg(titleCase(learningTypeToString(record.type)),
                                              record.title);
    out += QStringLiteral("**Domain**: %1\n").arg(record.domain);
    out += QStringLiteral("**Severity**: %1\n").arg(record.severity);
    out += QStringLiteral("**Tags**: %1\n").arg(tags);
    out += QStringLiteral("**Created**: %1\n\n").arg(created);

    out += QStringLiteral("## Summary\n\n%1\n\n")
               .arg(record.summary.isEmpty() ? QStringLiteral("_No summary provided._")
                                             : record.summary);
    out += QStringLiteral("## What Happened\n\n[Detailed description]\n\n");
    out += QStringLiteral("## Root Cause\n\n[Analysis]\n\n");
    out += QStringLiteral("## Impact\n\n[Consequences]\n\n");
    out += QStringLiteral("## Prevention\n\n[What to do differently]\n\n");
    out += QStringLiteral("## Related\n\n- **Experiments**:\n- **Heuristics**:\n- **Similar Failures**:\n");
    return out;
}

QString DocumentRenderer::renderHeuristic(const LearningRecord& record)
{
    QString out;
    out += QStringLiteral("# Heuristic: %1\n\n").arg(record.title);
    out += QStringLiteral("**Domain**: %1\n").arg(record.domain);
    out += QStringLiteral("**Confidence**: %1\n").arg(QString::number(record.confidence, 'g', 4));
    out += QStringLiteral("**Source**: %1\n").arg(heuristicSourceToString(record.source));
    out += QStringLiteral("**Created**: %1\n\n")
               .arg(record.createdAt.toUTC().toString(QStringLiteral("yyyy-MM-dd")));
    if (!record.summary.isEmpty()) {
        out += record.summary + QLatin1Char('\n');
    }
    return out;
}

} // namespace elf
