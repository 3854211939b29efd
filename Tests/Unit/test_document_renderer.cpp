#include <QtTest/QtTest>
#include "core/record/document_renderer.h"

using elf::DocumentRenderer;
using elf::LearningRecord;
using elf::LearningType;

class TestDocumentRenderer : public QObject {
    Q_OBJECT

private slots:
    void testFailureTemplate();
    void testExperimentHeading();
    void testHeuristicTemplate();
    void testUtf8Output();
};

void TestDocumentRenderer::testFailureTemplate()
{
    LearningRecord record;
    record.type = LearningType::Failure;
    record.domain = QStringLiteral("testing");
    record.title = QStringLiteral("Timeout in fetch");
    record.summary = QStringLiteral("Upstream hung.");
    record.tags = {QStringLiteral("network"), QStringLiteral("ci")};
    record.severity = 4;
    record.createdAt = QDateTime(QDate(2025, 1, 31), QTime(12, 0, 0), Qt::UTC);

    const QString doc = QString::fromUtf8(DocumentRenderer::render(record));
    QVERIFY(doc.startsWith(QStringLiteral("# Failure: Timeout in fetch\n")));
    QVERIFY(doc.contains(QStringLiteral("**Domain**: testing\n")));
    QVERIFY(doc.contains(QStringLiteral("**Severity**: 4\n")));
    QVERIFY(doc.contains(QStringLiteral("**Tags**: network, ci\n")));
    QVERIFY(doc.contains(QStringLiteral("**Created**: 2025-01-31T12:00:00Z\n")));
    QVERIFY(doc.contains(QStringLiteral("## Summary\n\nUpstream hung.\n")));
    for (const char* section : {"## What Happened", "## Root Cause", "## Impact",
                                "## Prevention", "## Related"}) {
        QVERIFY2(doc.contains(QLatin1String(section)), section);
    }
    QVERIFY(doc.endsWith(QLatin1Char('\n')));
}

void TestDocumentRenderer::testExperimentHeading()
{
    LearningRecord record;
    record.type = LearningType::Experiment;
    record.title = QStringLiteral("Try WAL");
    record.createdAt = QDateTime::currentDateTimeUtc();

    const QString doc = QString::fromUtf8(DocumentRenderer::render(record));
    QVERIFY(doc.startsWith(QStringLiteral("# Experiment: Try WAL\n")));
    QVERIFY(doc.contains(QStringLiteral("**Tags**: none\n")));
    QVERIFY(doc.contains(QStringLiteral("_No summary provided._")));
}

void TestDocumentRenderer::testHeuristicTemplate()
{
    LearningRecord record;
    record.type = LearningType::Heuristic;
    record.domain = QStringLiteral("git");
    record.title = QStringLiteral("Commit only what you wrote");
    record.summary = QStringLiteral("Shared indexes pick up strangers' files.");
    record.confidence = 0.85;
    record.source = elf::HeuristicSource::Failure;
    record.createdAt = QDateTime(QDate(2025, 6, 1), QTime(8, 0, 0), Qt::UTC);

    const QString doc = QString::fromUtf8(DocumentRenderer::render(record));
    QVERIFY(doc.startsWith(QStringLiteral("# Heuristic: Commit only what you wrote\n")));
    QVERIFY(doc.contains(QStringLiteral("**Confidence**: 0.85\n")));
    QVERIFY(doc.contains(QStringLiteral("**Source**: failure\n")));
    QVERIFY(doc.contains(QStringLiteral("**Created**: 2025-06-01\n")));
    QVERIFY(doc.endsWith(QStringLiteral("Shared indexes pick up strangers' files.\n")));
    QVERIFY(!doc.contains(QStringLiteral("Severity")));
}

void TestDocumentRenderer::testUtf8Output()
{
    LearningRecord record;
    record.type = LearningType::Success;
    record.title = QStringLiteral("Café deploy");
    record.createdAt = QDateTime::currentDateTimeUtc();

    const QByteArray bytes = DocumentRenderer::render(record);
    QVERIFY(bytes.contains("Caf\xc3\xa9 deploy"));
}

QTEST_MAIN(TestDocumentRenderer)
#include "test_document_renderer.moc"
