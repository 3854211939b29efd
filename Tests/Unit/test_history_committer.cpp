#include <QtTest/QtTest>
#include <QTemporaryDir>
#include "core/history/history_committer.h"
#include "core/lock/flock_lock.h"
#include "record_test_utils.h"

using elf::ErrorKind;
using elf::FlockLock;
using elf::HistoryCommitter;
using elf::WriteError;

namespace {

bool writeText(const QString& path, const QByteArray& content)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    return f.write(content) == content.size();
}

bool installFailingHook(const QString& repo)
{
    const QString hook = repo + "/.git/hooks/pre-commit";
    if (!writeText(hook, "#!/bin/sh\necho 'hook says no' >&2\nexit 1\n")) {
        return false;
    }
    return QFile::setPermissions(hook, QFile::ReadOwner | QFile::WriteOwner | QFile::ExeOwner);
}

} // namespace

class TestHistoryCommitter : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void testRepositoryDetection();
    void testCommitOnlyGivenPaths();
    void testNothingToCommitIsSuccess();
    void testFailingCommitRetriedOnceThenFails();
    void testUnstageBeforeFirstCommit();
    void testUnstageWithHead();
};

void TestHistoryCommitter::initTestCase()
{
    if (!HistoryCommitter::isGitAvailable()) {
        QSKIP("git is not installed");
    }
}

void TestHistoryCommitter::testRepositoryDetection()
{
    QTemporaryDir dir;
    HistoryCommitter plain(dir.path(), 10000);
    QVERIFY(!plain.isRepository());

    QVERIFY(elf::test::initGitRepository(dir.path()));
    HistoryCommitter repo(dir.path(), 10000);
    QVERIFY(repo.isRepository());
    QVERIFY(!repo.hasHead());
}

void TestHistoryCommitter::testCommitOnlyGivenPaths()
{
    QTemporaryDir dir;
    QVERIFY(elf::test::initGitRepository(dir.path()));
    HistoryCommitter committer(dir.path(), 10000);
    QVERIFY(writeText(dir.path() + "/seed.md", "seed\n"));
    QVERIFY(committer.commitOnce({QStringLiteral("seed.md")}, QStringLiteral("seed"), nullptr));

    QVERIFY(writeText(dir.path() + "/memory/failures/testing/a.md", "# a\n"));
    QVERIFY(writeText(dir.path() + "/unrelated.txt", "someone else's work\n"));
    // Something another tool staged must not ride along
    QVERIFY(writeText(dir.path() + "/staged-by-other.txt", "x\n"));
    QVERIFY(!elf::test::runGit(dir.path(), {"add", "staged-by-other.txt"}).isNull());

    FlockLock lock(dir.path() + "/.git/elf-history.lock", 10);
    QVERIFY(lock.acquire(1000, nullptr));

    WriteError error;
    QVERIFY2(committer.commit({QStringLiteral("memory/failures/testing/a.md")},
                              QStringLiteral("failure(testing): a"), lock, 1000, &error),
             qPrintable(error.toString()));
    QVERIFY(!committer.lastCommitWasNoop());
    QVERIFY(committer.stagedPaths().isEmpty());

    QCOMPARE(elf::test::gitCommitCount(dir.path()), 2);
    const QString files = elf::test::runGit(dir.path(), {"show", "--name-only", "--format=%s", "HEAD"});
    QVERIFY(files.contains(QStringLiteral("failure(testing): a")));
    QVERIFY(files.contains(QStringLiteral("memory/failures/testing/a.md")));
    QVERIFY(!files.contains(QStringLiteral("staged-by-other.txt")));
    QVERIFY(!files.contains(QStringLiteral("unrelated.txt")));

    // The foreign staged file is still staged, untouched
    QVERIFY(elf::test::gitStatus(dir.path()).contains(QStringLiteral("A  staged-by-other.txt")));
}

void TestHistoryCommitter::testNothingToCommitIsSuccess()
{
    QTemporaryDir dir;
    QVERIFY(elf::test::initGitRepository(dir.path()));
    QVERIFY(writeText(dir.path() + "/a.md", "a\n"));

    HistoryCommitter committer(dir.path(), 10000);
    QVERIFY(committer.commitOnce({QStringLiteral("a.md")}, QStringLiteral("first"), nullptr));
    QVERIFY(!committer.lastCommitWasNoop());

    WriteError error;
    QVERIFY2(committer.commitOnce({QStringLiteral("a.md")}, QStringLiteral("again"), &error),
             qPrintable(error.toString()));
    QVERIFY(committer.lastCommitWasNoop());
    QCOMPARE(elf::test::gitCommitCount(dir.path()), 1);
}

void TestHistoryCommitter::testFailingCommitRetriedOnceThenFails()
{
    QTemporaryDir dir;
    QVERIFY(elf::test::initGitRepository(dir.path()));
    QVERIFY(installFailingHook(dir.path()));
    QVERIFY(writeText(dir.path() + "/a.md", "a\n"));

    HistoryCommitter committer(dir.path(), 10000);
    FlockLock lock(dir.path() + "/.git/elf-history.lock", 10);
    QVERIFY(lock.acquire(1000, nullptr));

    WriteError error;
    QVERIFY(!committer.commit({QStringLiteral("a.md")}, QStringLiteral("m"), lock, 1000, &error));
    QCOMPARE(error.kind, ErrorKind::History);
    QVERIFY(!error.transient);
    QVERIFY(error.message.contains(QStringLiteral("hook says no")));
    // The lock was handed back and re-taken for the retry
    QVERIFY(lock.isHeld());
    QCOMPARE(committer.stagedPaths(), QStringList{QStringLiteral("a.md")});
    QCOMPARE(elf::test::gitCommitCount(dir.path()), 0);
}

void TestHistoryCommitter::testUnstageBeforeFirstCommit()
{
    QTemporaryDir dir;
    QVERIFY(elf::test::initGitRepository(dir.path()));
    QVERIFY(installFailingHook(dir.path()));
    QVERIFY(writeText(dir.path() + "/a.md", "a\n"));

    HistoryCommitter committer(dir.path(), 10000);
    QVERIFY(!committer.commitOnce({QStringLiteral("a.md")}, QStringLiteral("m"), nullptr));
    QVERIFY(elf::test::gitStatus(dir.path()).contains(QStringLiteral("A  a.md")));

    WriteError error;
    QVERIFY2(committer.unstage(committer.stagedPaths(), &error), qPrintable(error.toString()));
    QVERIFY(committer.stagedPaths().isEmpty());
    QCOMPARE(elf::test::gitStatus(dir.path()), QStringLiteral("?? a.md"));
}

void TestHistoryCommitter::testUnstageWithHead()
{
    QTemporaryDir dir;
    QVERIFY(elf::test::initGitRepository(dir.path()));
    QVERIFY(writeText(dir.path() + "/seed.md", "seed\n"));
    HistoryCommitter committer(dir.path(), 10000);
    QVERIFY(committer.commitOnce({QStringLiteral("seed.md")}, QStringLiteral("seed"), nullptr));
    QVERIFY(committer.hasHead());

    QVERIFY(installFailingHook(dir.path()));
    QVERIFY(writeText(dir.path() + "/b.md", "b\n"));
    QVERIFY(!committer.commitOnce({QStringLiteral("b.md")}, QStringLiteral("m"), nullptr));

    QVERIFY(committer.unstage(committer.stagedPaths(), nullptr));
    QCOMPARE(elf::test::gitStatus(dir.path()), QStringLiteral("?? b.md"));
    QCOMPARE(elf::test::gitCommitCount(dir.path()), 1);
}

QTEST_MAIN(TestHistoryCommitter)
#include "test_history_committer.moc"
