#include <QtTest/QtTest>

#include "core/index/migration.h"
#include "core/index/schema.h"

#include <sqlite3.h>

class TestMigration : public QObject {
    Q_OBJECT

private slots:
    void testCurrentVersionMissingSettingsDefaultsToZero();
    void testApplyMigrationsUpToV2();
    void testMigrationIsIdempotent();
    void testRejectsDowngrade();
    void testRejectsUnsupportedTargetVersion();
};

namespace {

sqlite3* openV1Database()
{
    sqlite3* db = nullptr;
    if (sqlite3_open(":memory:", &db) != SQLITE_OK) {
        sqlite3_close(db);
        return nullptr;
    }
    if (sqlite3_exec(db, elf::kSchemaV1, nullptr, nullptr, nullptr) != SQLITE_OK
        || sqlite3_exec(db, elf::kDefaultSettings, nullptr, nullptr, nullptr) != SQLITE_OK) {
        sqlite3_close(db);
        return nullptr;
    }
    return db;
}

int countColumn(sqlite3* db, const char* table, const char* column)
{
    const QByteArray sql = QByteArray("SELECT COUNT(*) FROM pragma_table_info('") + table
        + "') WHERE name = '" + column + "'";
    sqlite3_stmt* stmt = nullptr;
    int count = -1;
    if (sqlite3_prepare_v2(db, sql.constData(), -1, &stmt, nullptr) == SQLITE_OK
        && sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

} // namespace

void TestMigration::testCurrentVersionMissingSettingsDefaultsToZero()
{
    sqlite3* db = nullptr;
    QCOMPARE(sqlite3_open(":memory:", &db), SQLITE_OK);
    QVERIFY(db != nullptr);

    QCOMPARE(elf::currentSchemaVersion(db), 0);

    sqlite3_close(db);
}

void TestMigration::testApplyMigrationsUpToV2()
{
    sqlite3* db = openV1Database();
    QVERIFY(db != nullptr);
    QCOMPARE(elf::currentSchemaVersion(db), 1);
    QCOMPARE(countColumn(db, "heuristics", "filepath"), 0);

    QVERIFY(elf::applyMigrations(db, 2));
    QCOMPARE(elf::currentSchemaVersion(db), 2);
    QCOMPARE(countColumn(db, "heuristics", "filepath"), 1);

    sqlite3_stmt* stmt = nullptr;
    QCOMPARE(sqlite3_prepare_v2(
                 db,
                 "SELECT COUNT(*) FROM sqlite_master WHERE type='index' AND name='idx_heuristics_filepath';",
                 -1, &stmt, nullptr),
             SQLITE_OK);
    QCOMPARE(sqlite3_step(stmt), SQLITE_ROW);
    QVERIFY(sqlite3_column_int(stmt, 0) == 1);
    sqlite3_finalize(stmt);

    sqlite3_close(db);
}

void TestMigration::testMigrationIsIdempotent()
{
    sqlite3* db = openV1Database();
    QVERIFY(db != nullptr);

    QVERIFY(elf::applyMigrations(db, elf::kCurrentSchemaVersion));
    QVERIFY(elf::applyMigrations(db, elf::kCurrentSchemaVersion));
    QCOMPARE(elf::currentSchemaVersion(db), elf::kCurrentSchemaVersion);
    QCOMPARE(sqlite3_get_autocommit(db), 1);

    sqlite3_close(db);
}

void TestMigration::testRejectsDowngrade()
{
    sqlite3* db = nullptr;
    QCOMPARE(sqlite3_open(":memory:", &db), SQLITE_OK);
    QVERIFY(db != nullptr);

    QCOMPARE(sqlite3_exec(db,
                          "CREATE TABLE settings (key TEXT PRIMARY KEY, value TEXT NOT NULL);"
                          "INSERT INTO settings (key, value) VALUES ('schema_version', '5');",
                          nullptr, nullptr, nullptr),
             SQLITE_OK);

    QVERIFY(!elf::applyMigrations(db, 2));
    QCOMPARE(elf::currentSchemaVersion(db), 5);

    sqlite3_close(db);
}

void TestMigration::testRejectsUnsupportedTargetVersion()
{
    sqlite3* db = openV1Database();
    QVERIFY(db != nullptr);

    // The 1 -> 2 step is rolled back with the rest of the transaction
    QVERIFY(!elf::applyMigrations(db, 3));
    QCOMPARE(elf::currentSchemaVersion(db), 1);
    QCOMPARE(countColumn(db, "heuristics", "filepath"), 0);
    QCOMPARE(sqlite3_get_autocommit(db), 1);

    sqlite3_close(db);
}

QTEST_MAIN(TestMigration)
#include "test_migration.moc"
