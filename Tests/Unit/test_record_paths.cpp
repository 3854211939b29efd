#include <QtTest/QtTest>
#include "core/fs/record_paths.h"

using elf::LearningRecord;
using elf::LearningType;
using elf::RecordPaths;

namespace {

LearningRecord sampleRecord(LearningType type)
{
    LearningRecord record;
    record.type = type;
    record.domain = QStringLiteral("Testing");
    record.domainSlug = QStringLiteral("testing");
    record.title = QStringLiteral("Timeout in fetch");
    record.titleSlug = QStringLiteral("timeout-in-fetch");
    record.createdAt = QDateTime(QDate(2025, 1, 31), QTime(23, 59, 58), Qt::UTC);
    return record;
}

} // namespace

class TestRecordPaths : public QObject {
    Q_OBJECT

private slots:
    void testFileName();
    void testRelativePathPerType();
    void testAbsolutePath();
    void testStoredPathRelativeToBase();
    void testStoredPathOutsideBase();
    void testIsWithin();
};

void TestRecordPaths::testFileName()
{
    QCOMPARE(RecordPaths::fileName(sampleRecord(LearningType::Failure)),
             QStringLiteral("20250131-235958_timeout-in-fetch.md"));

    // Local-time input is rendered in UTC
    LearningRecord shifted = sampleRecord(LearningType::Failure);
    shifted.createdAt = QDateTime(QDate(2025, 2, 1), QTime(1, 59, 58), QTimeZone(7200));
    QCOMPARE(RecordPaths::fileName(shifted), QStringLiteral("20250131-235958_timeout-in-fetch.md"));

    QCOMPARE(RecordPaths::fileName(shifted, QStringLiteral("0badc0de")),
             QStringLiteral("20250131-235958_timeout-in-fetch-0badc0de.md"));
    QCOMPARE(RecordPaths::relativeDocumentPath(shifted, QStringLiteral("0badc0de")),
             QStringLiteral("failures/testing/20250131-235958_timeout-in-fetch-0badc0de.md"));
}

void TestRecordPaths::testRelativePathPerType()
{
    QCOMPARE(RecordPaths::relativeDocumentPath(sampleRecord(LearningType::Failure)),
             QStringLiteral("failures/testing/20250131-235958_timeout-in-fetch.md"));
    QCOMPARE(RecordPaths::relativeDocumentPath(sampleRecord(LearningType::Success)),
             QStringLiteral("successes/testing/20250131-235958_timeout-in-fetch.md"));
    QCOMPARE(RecordPaths::relativeDocumentPath(sampleRecord(LearningType::Heuristic)),
             QStringLiteral("heuristics/testing/20250131-235958_timeout-in-fetch.md"));
    QCOMPARE(RecordPaths::relativeDocumentPath(sampleRecord(LearningType::Experiment)),
             QStringLiteral("experiments/testing/20250131-235958_timeout-in-fetch.md"));
}

void TestRecordPaths::testAbsolutePath()
{
    QCOMPARE(RecordPaths::absoluteDocumentPath(QStringLiteral("/base/memory/"),
                                               sampleRecord(LearningType::Failure)),
             QStringLiteral("/base/memory/failures/testing/20250131-235958_timeout-in-fetch.md"));
}

void TestRecordPaths::testStoredPathRelativeToBase()
{
    QCOMPARE(RecordPaths::toStoredPath(QStringLiteral("/base"),
                                       QStringLiteral("/base/memory/failures/x/a.md")),
             QStringLiteral("memory/failures/x/a.md"));
    QCOMPARE(RecordPaths::toStoredPath(QStringLiteral("/base/"),
                                       QStringLiteral("/base/./memory//index.db")),
             QStringLiteral("memory/index.db"));
}

void TestRecordPaths::testStoredPathOutsideBase()
{
    QCOMPARE(RecordPaths::toStoredPath(QStringLiteral("/base"),
                                       QStringLiteral("/elsewhere/../other/index.db")),
             QStringLiteral("/other/index.db"));
    // Prefix match must respect component boundaries
    QCOMPARE(RecordPaths::toStoredPath(QStringLiteral("/base"),
                                       QStringLiteral("/base-two/a.md")),
             QStringLiteral("/base-two/a.md"));
}

void TestRecordPaths::testIsWithin()
{
    QVERIFY(RecordPaths::isWithin(QStringLiteral("/a/b"), QStringLiteral("/a/b")));
    QVERIFY(RecordPaths::isWithin(QStringLiteral("/a/b"), QStringLiteral("/a/b/c/d.md")));
    QVERIFY(!RecordPaths::isWithin(QStringLiteral("/a/b"), QStringLiteral("/a/bc/d.md")));
    QVERIFY(!RecordPaths::isWithin(QStringLiteral("/a/b"), QStringLiteral("/a/b/../c/d.md")));
    QVERIFY(!RecordPaths::isWithin(QStringLiteral("/a/b"), QStringLiteral("/a")));
}

QTEST_MAIN(TestRecordPaths)
#include "test_record_paths.moc"
