#include <QtTest/QtTest>
#include <QTemporaryDir>
#include "core/shared/settings_manager.h"
#include "core/shared/write_error.h"

using elf::HistoryFailurePolicy;
using elf::LockStrategy;
using elf::RecorderSettings;
using elf::SettingsManager;

namespace {

const char* const kEnvNames[] = {
    "ELF_BASE_DIR", "ELF_DB_PATH", "ELF_LOCK_PATH", "ELF_SQLITE_BUSY_TIMEOUT_MS",
    "ELF_INSERT_MAX_ATTEMPTS", "ELF_INSERT_BACKOFF_BASE_MS", "ELF_LOCK_TIMEOUT_MS",
    "ELF_LOCK_POLL_INTERVAL_MS", "ELF_GIT_TIMEOUT_MS", "ELF_LOCK_STRATEGY",
    "ELF_HISTORY_ENABLED", "ELF_HISTORY_FAILURE_POLICY", "ELF_FILE_LOGGING",
};

void clearEnvironment()
{
    for (const char* name : kEnvNames) {
        qunsetenv(name);
    }
}

} // namespace

class TestSettingsManager : public QObject {
    Q_OBJECT

private slots:
    void init() { clearEnvironment(); }
    void cleanup() { clearEnvironment(); }

    void testDefaults();
    void testResolvePaths();
    void testBaseDirFromEnvironment();
    void testFileOverridesDefaults();
    void testEnvironmentOverridesFile();
    void testInvalidEnvironmentIgnored();
    void testMalformedFileIsError();
    void testSaveAndReload();
    void testExitCodes();
};

void TestSettingsManager::testDefaults()
{
    QTemporaryDir dir;
    QString error;
    const auto settings = SettingsManager::load(dir.path(), &error);
    QVERIFY2(settings.has_value(), qPrintable(error));

    QCOMPARE(settings->baseDir, QDir::cleanPath(dir.path()));
    QCOMPARE(settings->dbPath, QStringLiteral("memory/index.db"));
    QCOMPARE(settings->sqliteBusyTimeoutMs, 10000);
    QCOMPARE(settings->insertMaxAttempts, 5);
    QCOMPARE(settings->insertBackoffBaseMs, 100);
    QCOMPARE(settings->insertBackoffCapMs, 2000);
    QCOMPARE(settings->lockTimeoutMs, 30000);
    QCOMPARE(settings->lockStrategy, LockStrategy::Auto);
    QVERIFY(settings->historyEnabled);
    QCOMPARE(settings->historyFailurePolicy, HistoryFailurePolicy::Rollback);
    QCOMPARE(settings->gitTimeoutMs, 10000);
}

void TestSettingsManager::testResolvePaths()
{
    RecorderSettings settings;
    settings.baseDir = QStringLiteral("/base");
    QCOMPARE(settings.resolvedDbPath(), QStringLiteral("/base/memory/index.db"));
    QCOMPARE(settings.resolvedDocumentsRoot(), QStringLiteral("/base/memory"));
    QCOMPARE(settings.resolvedLockPath(), QStringLiteral("/base/.git/elf-history.lock"));
    QCOMPARE(settings.resolvedLogDir(), QStringLiteral("/base/logs"));

    settings.dbPath = QStringLiteral("/elsewhere/./index.db");
    QCOMPARE(settings.resolvedDbPath(), QStringLiteral("/elsewhere/index.db"));
}

void TestSettingsManager::testBaseDirFromEnvironment()
{
    QTemporaryDir dir;
    qputenv("ELF_BASE_DIR", dir.path().toUtf8());
    const auto settings = SettingsManager::load();
    QVERIFY(settings.has_value());
    QCOMPARE(settings->baseDir, QDir::cleanPath(dir.path()));

    // An explicit base directory wins over the environment
    QTemporaryDir other;
    QCOMPARE(SettingsManager::load(other.path())->baseDir, QDir::cleanPath(other.path()));
}

void TestSettingsManager::testFileOverridesDefaults()
{
    QTemporaryDir dir;
    QFile file(SettingsManager::settingsFilePath(dir.path()));
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(R"({"lockTimeoutMs": 1234, "lockStrategy": "mkdir",
                   "historyFailurePolicy": "degrade", "dbPath": "db/learn.db"})");
    file.close();

    const auto settings = SettingsManager::load(dir.path());
    QVERIFY(settings.has_value());
    QCOMPARE(settings->lockTimeoutMs, 1234);
    QCOMPARE(settings->lockStrategy, LockStrategy::Mkdir);
    QCOMPARE(settings->historyFailurePolicy, HistoryFailurePolicy::Degrade);
    QCOMPARE(settings->resolvedDbPath(), QDir::cleanPath(dir.path() + "/db/learn.db"));
    // Untouched keys keep their defaults
    QCOMPARE(settings->insertMaxAttempts, 5);
}

void TestSettingsManager::testEnvironmentOverridesFile()
{
    QTemporaryDir dir;
    QFile file(SettingsManager::settingsFilePath(dir.path()));
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(R"({"lockTimeoutMs": 1234, "historyEnabled": true})");
    file.close();

    qputenv("ELF_LOCK_TIMEOUT_MS", "777");
    qputenv("ELF_HISTORY_ENABLED", "0");
    qputenv("ELF_LOCK_STRATEGY", "flock");

    const auto settings = SettingsManager::load(dir.path());
    QVERIFY(settings.has_value());
    QCOMPARE(settings->lockTimeoutMs, 777);
    QVERIFY(!settings->historyEnabled);
    QCOMPARE(settings->lockStrategy, LockStrategy::Flock);
}

void TestSettingsManager::testInvalidEnvironmentIgnored()
{
    QTemporaryDir dir;
    qputenv("ELF_LOCK_TIMEOUT_MS", "soon");
    qputenv("ELF_INSERT_MAX_ATTEMPTS", "-3");

    const auto settings = SettingsManager::load(dir.path());
    QVERIFY(settings.has_value());
    QCOMPARE(settings->lockTimeoutMs, 30000);
    QCOMPARE(settings->insertMaxAttempts, 5);
}

void TestSettingsManager::testMalformedFileIsError()
{
    QTemporaryDir dir;
    QFile file(SettingsManager::settingsFilePath(dir.path()));
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{ not json");
    file.close();

    QString error;
    QVERIFY(!SettingsManager::load(dir.path(), &error).has_value());
    QVERIFY(error.contains(QStringLiteral("Malformed")));
}

void TestSettingsManager::testSaveAndReload()
{
    QTemporaryDir dir;
    RecorderSettings settings;
    settings.baseDir = dir.path() + "/nested";
    settings.insertJitterMs = 7;
    settings.gitTimeoutMs = 4321;
    settings.fileLogging = false;
    QVERIFY(SettingsManager::save(settings));

    const auto loaded = SettingsManager::load(settings.baseDir);
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->insertJitterMs, 7);
    QCOMPARE(loaded->gitTimeoutMs, 4321);
    QVERIFY(!loaded->fileLogging);
}

void TestSettingsManager::testExitCodes()
{
    using elf::ErrorKind;
    QCOMPARE(elf::exitCodeFor(ErrorKind::None), 0);
    QCOMPARE(elf::exitCodeFor(ErrorKind::Storage), 2);
    QCOMPARE(elf::exitCodeFor(ErrorKind::History), 3);
    QCOMPARE(elf::exitCodeFor(ErrorKind::Filesystem), 4);
    QCOMPARE(elf::exitCodeFor(ErrorKind::Dependency), 5);
    QCOMPARE(elf::exitCodeFor(ErrorKind::Security), 6);
    QCOMPARE(elf::exitCodeFor(ErrorKind::Validation), 7);
    QCOMPARE(elf::exitCodeFor(ErrorKind::LockTimeout), 8);
}

QTEST_MAIN(TestSettingsManager)
#include "test_settings_manager.moc"
