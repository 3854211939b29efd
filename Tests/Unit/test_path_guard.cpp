#include <QtTest/QtTest>
#include <QTemporaryDir>
#include "core/fs/path_guard.h"

#include <fcntl.h>
#include <unistd.h>

using elf::ErrorKind;
using elf::PathGuard;
using elf::WriteError;

namespace {

QString writeVictim(const QString& path)
{
    QFile f(path);
    if (f.open(QIODevice::WriteOnly)) {
        f.write("keep");
    }
    return path;
}

QByteArray readAll(const QString& path)
{
    QFile f(path);
    return f.open(QIODevice::ReadOnly) ? f.readAll() : QByteArray();
}

} // namespace

class TestPathGuard : public QObject {
    Q_OBJECT

private slots:
    void testPlainPathAccepted();
    void testMissingRootRejected();
    void testSymlinkRootRejected();
    void testEscapeRejected();
    void testSymlinkedDirectoryRejected();
    void testSymlinkTargetRejected();
    void testHardlinkTargetRejected();
    void testExistingRegularTargetPasses();
    void testVerifyOpenedFile();
    void testRecheckCatchesTargetSwappedToSymlink();
    void testRecheckCatchesAddedHardlink();
    void testRecheckCatchesParentSwappedToSymlink();
    void testExistingEntryClassified();
};

void TestPathGuard::testPlainPathAccepted()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    WriteError error;
    QVERIFY2(PathGuard::checkSafe(dir.path(), dir.path() + "/failures/testing/a.md", &error),
             qPrintable(error.toString()));

    QVERIFY(QDir().mkpath(dir.path() + "/failures/testing"));
    QVERIFY(PathGuard::checkSafe(dir.path(), dir.path() + "/failures/testing/a.md", &error));
}

void TestPathGuard::testMissingRootRejected()
{
    QTemporaryDir dir;
    WriteError error;
    QVERIFY(!PathGuard::checkSafe(dir.path() + "/nope", dir.path() + "/nope/a.md", &error));
    QCOMPARE(error.kind, ErrorKind::Security);
}

void TestPathGuard::testSymlinkRootRejected()
{
    QTemporaryDir dir;
    QVERIFY(QDir().mkpath(dir.path() + "/real"));
    QVERIFY(QFile::link(dir.path() + "/real", dir.path() + "/root"));

    WriteError error;
    QVERIFY(!PathGuard::checkSafe(dir.path() + "/root", dir.path() + "/root/a.md", &error));
    QCOMPARE(error.kind, ErrorKind::Security);
    QVERIFY(error.message.contains(QStringLiteral("symlink")));
    QVERIFY(PathGuard::isSymlink(dir.path() + "/root"));
    QVERIFY(!PathGuard::isSymlink(dir.path() + "/real"));
}

void TestPathGuard::testEscapeRejected()
{
    QTemporaryDir dir;
    const QString root = dir.path() + "/memory";
    QVERIFY(QDir().mkpath(root));

    WriteError error;
    QVERIFY(!PathGuard::checkSafe(root, root + "/../outside.md", &error));
    QCOMPARE(error.kind, ErrorKind::Security);
    QVERIFY(!PathGuard::checkSafe(root, root, &error));
    QVERIFY(!PathGuard::checkSafe(root, dir.path() + "/memory-evil/a.md", &error));
}

void TestPathGuard::testSymlinkedDirectoryRejected()
{
    QTemporaryDir dir;
    QTemporaryDir outside;
    const QString root = dir.path() + "/memory";
    QVERIFY(QDir().mkpath(root + "/failures"));
    QVERIFY(QFile::link(outside.path(), root + "/failures/testing"));

    WriteError error;
    QVERIFY(!PathGuard::checkSafe(root, root + "/failures/testing/a.md", &error));
    QCOMPARE(error.kind, ErrorKind::Security);
    QVERIFY(error.message.contains(QStringLiteral("directory is a symlink")));
}

void TestPathGuard::testSymlinkTargetRejected()
{
    QTemporaryDir dir;
    QTemporaryDir outside;
    const QString victim = outside.path() + "/victim.txt";
    {
        QFile f(victim);
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write("keep");
    }
    QVERIFY(QFile::link(victim, dir.path() + "/a.md"));

    WriteError error;
    QVERIFY(!PathGuard::checkSafe(dir.path(), dir.path() + "/a.md", &error));
    QCOMPARE(error.kind, ErrorKind::Security);

    // Dangling links are rejected too
    QVERIFY(QFile::link(outside.path() + "/missing", dir.path() + "/b.md"));
    QVERIFY(!PathGuard::checkSafe(dir.path(), dir.path() + "/b.md", &error));
    QCOMPARE(error.kind, ErrorKind::Security);
}

void TestPathGuard::testHardlinkTargetRejected()
{
    QTemporaryDir dir;
    const QString original = dir.path() + "/original.md";
    {
        QFile f(original);
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write("x");
    }
    const QString linked = dir.path() + "/linked.md";
    QCOMPARE(::link(QFile::encodeName(original).constData(),
                    QFile::encodeName(linked).constData()), 0);

    WriteError error;
    QVERIFY(!PathGuard::checkSafe(dir.path(), linked, &error));
    QCOMPARE(error.kind, ErrorKind::Security);
    QVERIFY(error.message.contains(QStringLiteral("hard links")));
}

void TestPathGuard::testExistingRegularTargetPasses()
{
    QTemporaryDir dir;
    const QString path = dir.path() + "/exists.md";
    QFile f(path);
    QVERIFY(f.open(QIODevice::WriteOnly));
    f.close();

    QVERIFY(PathGuard::checkSafe(dir.path(), path, nullptr));
}

void TestPathGuard::testVerifyOpenedFile()
{
    QTemporaryDir dir;
    const QString path = dir.path() + "/file.md";
    const int fd = ::open(QFile::encodeName(path).constData(), O_WRONLY | O_CREAT | O_EXCL, 0644);
    QVERIFY(fd >= 0);
    QVERIFY(PathGuard::verifyOpenedFile(fd, path, nullptr));

    QCOMPARE(::link(QFile::encodeName(path).constData(),
                    QFile::encodeName(dir.path() + "/second.md").constData()), 0);
    WriteError error;
    QVERIFY(!PathGuard::verifyOpenedFile(fd, path, &error));
    QCOMPARE(error.kind, ErrorKind::Security);
    ::close(fd);

    const int dirFd = ::open(QFile::encodeName(dir.path()).constData(), O_RDONLY | O_DIRECTORY);
    QVERIFY(dirFd >= 0);
    QVERIFY(!PathGuard::verifyOpenedFile(dirFd, dir.path(), &error));
    ::close(dirFd);
}

void TestPathGuard::testRecheckCatchesTargetSwappedToSymlink()
{
    QTemporaryDir dir;
    QTemporaryDir outside;
    const QString victim = writeVictim(outside.path() + "/victim.txt");
    const QString target = dir.path() + "/a.md";

    WriteError error;
    QVERIFY(PathGuard::checkSafe(dir.path(), target, &error));

    // Swapped in after the check passed
    QVERIFY(QFile::link(victim, target));
    QVERIFY(!PathGuard::checkSafe(dir.path(), target, &error));
    QCOMPARE(error.kind, ErrorKind::Security);
    QVERIFY(error.message.contains(QStringLiteral("symlink")));
    QCOMPARE(readAll(victim), QByteArray("keep"));
}

void TestPathGuard::testRecheckCatchesAddedHardlink()
{
    QTemporaryDir dir;
    const QString target = dir.path() + "/a.md";
    const QString victim = writeVictim(dir.path() + "/victim.txt");

    WriteError error;
    QVERIFY(PathGuard::checkSafe(dir.path(), target, &error));

    QCOMPARE(::link(QFile::encodeName(victim).constData(),
                    QFile::encodeName(target).constData()), 0);
    QVERIFY(!PathGuard::checkSafe(dir.path(), target, &error));
    QCOMPARE(error.kind, ErrorKind::Security);
    QVERIFY(error.message.contains(QStringLiteral("hard links")));
    QCOMPARE(readAll(victim), QByteArray("keep"));
}

void TestPathGuard::testRecheckCatchesParentSwappedToSymlink()
{
    QTemporaryDir dir;
    QTemporaryDir outside;
    const QString root = dir.path() + "/memory";
    QVERIFY(QDir().mkpath(root + "/failures/testing"));
    const QString target = root + "/failures/testing/a.md";

    WriteError error;
    QVERIFY(PathGuard::checkSafe(root, target, &error));

    QVERIFY(QDir().rename(root + "/failures/testing", root + "/failures/moved"));
    QVERIFY(QFile::link(outside.path(), root + "/failures/testing"));
    QVERIFY(!PathGuard::checkSafe(root, target, &error));
    QCOMPARE(error.kind, ErrorKind::Security);
    QVERIFY(!QFileInfo::exists(outside.path() + "/a.md"));
}

void TestPathGuard::testExistingEntryClassified()
{
    QTemporaryDir dir;
    QTemporaryDir outside;
    const QString victim = writeVictim(outside.path() + "/victim.txt");
    QVERIFY(QFile::link(victim, dir.path() + "/symlink.md"));
    QCOMPARE(::link(QFile::encodeName(victim).constData(),
                    QFile::encodeName(dir.path() + "/hardlink.md").constData()), 0);
    writeVictim(dir.path() + "/plain.md");

    const int dirFd = ::open(QFile::encodeName(dir.path()).constData(), O_RDONLY | O_DIRECTORY);
    QVERIFY(dirFd >= 0);

    WriteError error;
    QVERIFY(!PathGuard::rejectExistingEntry(dirFd, QStringLiteral("symlink.md"),
                                            dir.path() + "/symlink.md", &error));
    QCOMPARE(error.kind, ErrorKind::Security);
    QVERIFY(!PathGuard::rejectExistingEntry(dirFd, QStringLiteral("hardlink.md"),
                                            dir.path() + "/hardlink.md", &error));
    QCOMPARE(error.kind, ErrorKind::Security);
    QVERIFY(!PathGuard::rejectExistingEntry(dirFd, QStringLiteral("plain.md"),
                                            dir.path() + "/plain.md", &error));
    QCOMPARE(error.kind, ErrorKind::Filesystem);
    QVERIFY(error.message.contains(QStringLiteral("already exists")));
    ::close(dirFd);

    QCOMPARE(readAll(victim), QByteArray("keep"));
}

QTEST_MAIN(TestPathGuard)
#include "test_path_guard.moc"
