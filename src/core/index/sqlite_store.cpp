#include "core/index/sqlite_store.h"
#include "core/index/schema.h"
#include "core/index/migration.h"
#include "core/shared/logging.h"
#include <sqlite3.h>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <cstring>

namespace elf {

namespace {

QString columnText(sqlite3_stmt* stmt, int column)
{
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return text ? QString::fromUtf8(text) : QString();
}

SQLiteStore::LearningRow readLearningRow(sqlite3_stmt* stmt)
{
    SQLiteStore::LearningRow row;
    row.id = sqlite3_column_int64(stmt, 0);
    row.type = columnText(stmt, 1);
    row.filepath = columnText(stmt, 2);
    row.title = columnText(stmt, 3);
    row.summary = columnText(stmt, 4);
    row.tags = columnText(stmt, 5);
    row.domain = columnText(stmt, 6);
    row.severity = sqlite3_column_int(stmt, 7);
    row.createdAt = columnText(stmt, 8);
    return row;
}

} // namespace

SQLiteStore::~SQLiteStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::optional<SQLiteStore> SQLiteStore::open(const QString& dbPath, int busyTimeoutMs,
                                             QString* error)
{
    SQLiteStore store;
    if (!store.init(dbPath, busyTimeoutMs, error)) {
        return std::nullopt;
    }
    return store;
}

bool SQLiteStore::init(const QString& dbPath, int busyTimeoutMs, QString* error)
{
    m_path = QDir::cleanPath(dbPath);

    const QString parentDir = QFileInfo(m_path).absolutePath();
    if (!QDir().mkpath(parentDir)) {
        if (error) {
            *error = QStringLiteral("Failed to create database directory: %1").arg(parentDir);
        }
        LOG_ERROR(elfIndex, "Failed to create database directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    int rc = sqlite3_open(m_path.toUtf8().constData(), &m_db);
    if (rc != SQLITE_OK) {
        if (error) {
            *error = QStringLiteral("Failed to open database %1: %2")
                         .arg(m_path, QString::fromUtf8(sqlite3_errmsg(m_db)));
        }
        LOG_ERROR(elfIndex, "Failed to open database: %s", sqlite3_errmsg(m_db));
        return false;
    }

    // Set busy_timeout FIRST via C API, before running any SQL.
    // This ensures the busy handler is active for all subsequent operations.
    sqlite3_busy_timeout(m_db, busyTimeoutMs);

    // Apply per-connection pragmas (no write lock required)
    if (!execSql(kConnectionPragmas, error)) {
        LOG_ERROR(elfIndex, "Failed to set connection pragmas");
        return false;
    }

    // Check if schema already exists (read-only query on sqlite_master).
    // Concurrent writers opening an initialized index then skip the
    // write-heavy schema creation entirely.
    bool schemaExists = false;
    {
        sqlite3_stmt* stmt = nullptr;
        rc = sqlite3_prepare_v2(m_db,
            "SELECT count(*) FROM sqlite_master WHERE type='table' AND name='learnings'",
            -1, &stmt, nullptr);
        if (rc == SQLITE_OK && sqlite3_step(stmt) == SQLITE_ROW) {
            schemaExists = (sqlite3_column_int(stmt, 0) > 0);
        }
        sqlite3_finalize(stmt);
    }

    if (!schemaExists) {
        // First open: set database-level pragmas (requires write lock)
        if (!execSql(kDatabasePragmas, error)) {
            LOG_ERROR(elfIndex, "Failed to set database pragmas");
            return false;
        }

        // Verify WAL mode is active
        {
            sqlite3_stmt* stmt = nullptr;
            if (sqlite3_prepare_v2(m_db, "PRAGMA journal_mode", -1, &stmt, nullptr) == SQLITE_OK
                && sqlite3_step(stmt) == SQLITE_ROW) {
                const char* mode = reinterpret_cast<const char*>(
                    sqlite3_column_text(stmt, 0));
                if (mode && QString::fromUtf8(mode) != QLatin1String("wal")) {
                    LOG_WARN(elfIndex, "Expected WAL journal mode, got: %s", mode);
                }
            }
            sqlite3_finalize(stmt);
        }

        // Create schema
        if (!execSql(kSchemaV1, error)) {
            LOG_ERROR(elfIndex, "Failed to create schema");
            return false;
        }

        if (!execSql(kDefaultSettings, error)) {
            LOG_ERROR(elfIndex, "Failed to insert default settings");
            return false;
        }
    }

    // Apply any pending migrations (read-only when schema version is current)
    if (!applyMigrations(m_db, kCurrentSchemaVersion)) {
        if (error) {
            *error = QStringLiteral("Schema migration failed for %1").arg(m_path);
        }
        LOG_ERROR(elfIndex, "Migration failed");
        return false;
    }

    // Restrict database file permissions to owner-only (0600)
    QFile dbFile(m_path);
    dbFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);
    QFile walFile(m_path + QStringLiteral("-wal"));
    if (walFile.exists()) {
        walFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);
    }
    QFile shmFile(m_path + QStringLiteral("-shm"));
    if (shmFile.exists()) {
        shmFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);
    }

    LOG_DEBUG(elfIndex, "Database opened: %s", qUtf8Printable(m_path));
    return true;
}

bool SQLiteStore::execSql(const char* sql, QString* error)
{
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        const QString message = QString::fromUtf8(errMsg ? errMsg : "unknown");
        LOG_ERROR(elfIndex, "SQL error: %s", qUtf8Printable(message));
        if (error) {
            *error = message;
        }
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

QString SQLiteStore::timestampToSql(const QDateTime& timestamp)
{
    return timestamp.toUTC().toString(QStringLiteral("yyyy-MM-dd HH:mm:ss"));
}

// ── RecordStore ─────────────────────────────────────────────

StoreResult SQLiteStore::insertRecord(const LearningRecord& record)
{
    StoreResult result;
    if (!m_db) {
        result.code = SQLITE_MISUSE;
        result.message = QStringLiteral("database is not open");
        return result;
    }

    const char* learningSql = R"(
        INSERT INTO learnings (type, filepath, title, summary, tags, domain,
                               severity, created_at, updated_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?8)
    )";
    const char* heuristicSql = R"(
        INSERT INTO heuristics (domain, rule, explanation, source_type,
                                confidence, filepath, created_at, updated_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?7)
    )";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(m_db, record.isHeuristic() ? heuristicSql : learningSql,
                                -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        result.code = rc & 0xff;
        result.message = QString::fromUtf8(sqlite3_errmsg(m_db));
        sqlite3_finalize(stmt);
        return result;
    }

    const QByteArray domainUtf8 = record.domain.toUtf8();
    const QByteArray titleUtf8 = record.title.toUtf8();
    const QByteArray summaryUtf8 = record.summary.toUtf8();
    const QByteArray pathUtf8 = record.filepath.toUtf8();
    const QByteArray createdUtf8 = timestampToSql(record.createdAt).toUtf8();

    if (record.isHeuristic()) {
        const QByteArray sourceUtf8 = heuristicSourceToString(record.source).toUtf8();
        sqlite3_bind_text(stmt, 1, domainUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, titleUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 3, summaryUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 4, sourceUtf8.constData(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_double(stmt, 5, record.confidence);
        sqlite3_bind_text(stmt, 6, pathUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 7, createdUtf8.constData(), -1, SQLITE_STATIC);
    } else {
        const QByteArray typeUtf8 = learningTypeToString(record.type).toUtf8();
        const QByteArray tagsUtf8 = record.tags.join(QLatin1Char(',')).toUtf8();
        sqlite3_bind_text(stmt, 1, typeUtf8.constData(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, pathUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 3, titleUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 4, summaryUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 5, tagsUtf8.constData(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 6, domainUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_int(stmt, 7, record.severity);
        sqlite3_bind_text(stmt, 8, createdUtf8.constData(), -1, SQLITE_STATIC);
    }

    rc = sqlite3_step(stmt);
    result.code = rc & 0xff;
    if (rc == SQLITE_DONE) {
        result.rowId = sqlite3_last_insert_rowid(m_db);
        result.changes = sqlite3_changes(m_db);
    } else {
        result.message = QString::fromUtf8(sqlite3_errmsg(m_db));
    }
    sqlite3_finalize(stmt);
    return result;
}

StoreResult SQLiteStore::deleteRecord(LearningType type, int64_t id)
{
    StoreResult result;
    if (!m_db) {
        result.code = SQLITE_MISUSE;
        result.message = QStringLiteral("database is not open");
        return result;
    }

    const char* sql = type == LearningType::Heuristic
                          ? "DELETE FROM heuristics WHERE id = ?1"
                          : "DELETE FROM learnings WHERE id = ?1";
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        result.code = rc & 0xff;
        result.message = QString::fromUtf8(sqlite3_errmsg(m_db));
        sqlite3_finalize(stmt);
        return result;
    }
    sqlite3_bind_int64(stmt, 1, id);

    rc = sqlite3_step(stmt);
    result.code = rc & 0xff;
    if (rc == SQLITE_DONE) {
        result.rowId = id;
        result.changes = sqlite3_changes(m_db);
    } else {
        result.message = QString::fromUtf8(sqlite3_errmsg(m_db));
    }
    sqlite3_finalize(stmt);
    return result;
}

bool SQLiteStore::checkpoint(QString* error)
{
    if (!m_db) {
        if (error) *error = QStringLiteral("database is not open");
        return false;
    }

    // PASSIVE first: fold what can be folded without waiting on anyone.
    int walFrames = 0;
    int checkpointed = 0;
    int rc = sqlite3_wal_checkpoint_v2(m_db, nullptr, SQLITE_CHECKPOINT_PASSIVE,
                                       &walFrames, &checkpointed);
    if (rc != SQLITE_OK) {
        if (error) *error = QString::fromUtf8(sqlite3_errmsg(m_db));
        LOG_WARN(elfIndex, "WAL checkpoint failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    if (checkpointed >= walFrames) {
        LOG_DEBUG(elfIndex, "WAL checkpoint: %d/%d frames", checkpointed, walFrames);
        return true;
    }

    // A reader on an older snapshot pins the tail of the WAL. FULL waits for
    // it through the busy handler, so this is bounded by busy_timeout.
    LOG_INFO(elfIndex, "Passive checkpoint folded %d/%d frames, retrying in FULL mode",
             checkpointed, walFrames);
    rc = sqlite3_wal_checkpoint_v2(m_db, nullptr, SQLITE_CHECKPOINT_FULL,
                                   &walFrames, &checkpointed);
    if ((rc == SQLITE_OK || (rc & 0xff) == SQLITE_BUSY) && checkpointed >= walFrames
        && walFrames >= 0) {
        LOG_DEBUG(elfIndex, "WAL checkpoint (full): %d/%d frames", checkpointed, walFrames);
        return true;
    }
    if (rc != SQLITE_OK && (rc & 0xff) != SQLITE_BUSY) {
        if (error) *error = QString::fromUtf8(sqlite3_errmsg(m_db));
        LOG_WARN(elfIndex, "WAL checkpoint failed: %s", sqlite3_errmsg(m_db));
        return false;
    }

    // The main file lacks the newest frames; a copy of it alone is stale.
    if (error) {
        *error = QStringLiteral("checkpoint incomplete: %1 of %2 WAL frames folded")
                     .arg(checkpointed)
                     .arg(walFrames);
    }
    LOG_WARN(elfIndex, "WAL checkpoint incomplete: %d/%d frames", checkpointed, walFrames);
    return false;
}

// ── Reads ───────────────────────────────────────────────────

std::optional<SQLiteStore::LearningRow> SQLiteStore::getLearningById(int64_t id)
{
    const char* sql = R"(
        SELECT id, type, filepath, title, summary, tags, domain, severity, created_at
        FROM learnings WHERE id = ?1
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(elfIndex, "getLearningById prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, id);

    std::optional<LearningRow> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = readLearningRow(stmt);
    }
    sqlite3_finalize(stmt);
    return result;
}

std::optional<SQLiteStore::LearningRow> SQLiteStore::getLearningByPath(const QString& filepath)
{
    const char* sql = R"(
        SELECT id, type, filepath, title, summary, tags, domain, severity, created_at
        FROM learnings WHERE filepath = ?1
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(elfIndex, "getLearningByPath prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    const QByteArray pathUtf8 = filepath.toUtf8();
    sqlite3_bind_text(stmt, 1, pathUtf8.constData(), -1, SQLITE_STATIC);

    std::optional<LearningRow> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = readLearningRow(stmt);
    }
    sqlite3_finalize(stmt);
    return result;
}

std::optional<SQLiteStore::HeuristicRow> SQLiteStore::getHeuristicById(int64_t id)
{
    const char* sql = R"(
        SELECT id, domain, rule, explanation, source_type, confidence, filepath
        FROM heuristics WHERE id = ?1
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(elfIndex, "getHeuristicById prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, id);

    std::optional<HeuristicRow> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        HeuristicRow row;
        row.id = sqlite3_column_int64(stmt, 0);
        row.domain = columnText(stmt, 1);
        row.rule = columnText(stmt, 2);
        row.explanation = columnText(stmt, 3);
        row.sourceType = columnText(stmt, 4);
        row.confidence = sqlite3_column_double(stmt, 5);
        row.filepath = columnText(stmt, 6);
        result = row;
    }
    sqlite3_finalize(stmt);
    return result;
}

int64_t SQLiteStore::countRows(const char* sql)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(elfIndex, "count prepare failed: %s", sqlite3_errmsg(m_db));
        return -1;
    }
    int64_t count = -1;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

int64_t SQLiteStore::countLearnings()
{
    return countRows("SELECT COUNT(*) FROM learnings");
}

int64_t SQLiteStore::countHeuristics()
{
    return countRows("SELECT COUNT(*) FROM heuristics");
}

// ── Settings ────────────────────────────────────────────────

std::optional<QString> SQLiteStore::getSetting(const QString& key)
{
    const char* sql = "SELECT value FROM settings WHERE key = ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    const QByteArray keyUtf8 = key.toUtf8();
    sqlite3_bind_text(stmt, 1, keyUtf8.constData(), -1, SQLITE_STATIC);

    std::optional<QString> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = columnText(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return result;
}

bool SQLiteStore::setSetting(const QString& key, const QString& value)
{
    const char* sql = R"(
        INSERT INTO settings (key, value) VALUES (?1, ?2)
        ON CONFLICT(key) DO UPDATE SET value = excluded.value
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    const QByteArray keyUtf8 = key.toUtf8();
    const QByteArray valUtf8 = value.toUtf8();
    sqlite3_bind_text(stmt, 1, keyUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, valUtf8.constData(), -1, SQLITE_STATIC);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

// ── Maintenance ─────────────────────────────────────────────

bool SQLiteStore::integrityCheck(QString* detail) const
{
    if (!m_db) return false;

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(m_db, "PRAGMA integrity_check;", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) return false;

    bool ok = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* result = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        ok = (result && strcmp(result, "ok") == 0);
        if (detail) {
            *detail = QString::fromUtf8(result ? result : "no result");
        }
    }
    sqlite3_finalize(stmt);
    return ok;
}

} // namespace elf
