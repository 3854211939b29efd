#include "core/index/migration.h"
#include "core/shared/logging.h"
#include <QByteArray>
#include <sqlite3.h>

namespace elf {

int currentSchemaVersion(sqlite3* db)
{
    const char* sql = "SELECT value FROM settings WHERE key = 'schema_version'";
    sqlite3_stmt* stmt = nullptr;
    int version = 0;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            const char* val = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
            if (val) {
                version = QByteArray(val).toInt();
            }
        }
    }
    sqlite3_finalize(stmt);
    return version;
}

bool applyMigrations(sqlite3* db, int targetVersion)
{
    auto exec = [db](const char* sql) -> bool {
        char* errMsg = nullptr;
        const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            LOG_ERROR(elfIndex, "Migration SQL failed: %s", errMsg ? errMsg : "unknown");
            sqlite3_free(errMsg);
            return false;
        }
        return true;
    };

    // Cheap read-only check first; most opens find the schema current.
    int current = currentSchemaVersion(db);
    if (current > targetVersion) {
        LOG_ERROR(elfIndex, "Schema version %d is newer than app version %d, downgrade not supported",
                  current, targetVersion);
        return false;
    }
    if (current == targetVersion) {
        return true;
    }

    if (!exec("BEGIN IMMEDIATE;")) {
        return false;
    }
    auto fail = [&exec]() {
        exec("ROLLBACK;");
        return false;
    };

    // Another process may have migrated while we waited for the write lock.
    current = currentSchemaVersion(db);
    if (current >= targetVersion) {
        return exec("COMMIT;");
    }

    if (current < 2 && targetVersion >= 2) {
        LOG_INFO(elfIndex, "Applying schema migration 1 -> 2");

        // Heuristics gain a per-record document path, like learnings.
        if (!exec("ALTER TABLE heuristics ADD COLUMN filepath TEXT;")
            || !exec("CREATE UNIQUE INDEX IF NOT EXISTS idx_heuristics_filepath "
                     "ON heuristics(filepath) WHERE filepath IS NOT NULL;")) {
            return fail();
        }

        if (!exec("INSERT OR REPLACE INTO settings (key, value) VALUES ('schema_version', '2');")) {
            return fail();
        }

        current = 2;
    }

    if (current != targetVersion) {
        LOG_ERROR(elfIndex, "Schema migration incomplete: current=%d target=%d",
                  current, targetVersion);
        return fail();
    }

    if (!exec("COMMIT;")) {
        return fail();
    }

    LOG_INFO(elfIndex, "Schema migrations complete: version %d", current);
    return true;
}

} // namespace elf
