#pragma once

#include "core/index/record_store.h"
#include "core/shared/types.h"
#include <QString>
#include <optional>
#include <cstdint>

#include <sqlite3.h>

namespace elf {

// SQLiteStore -- owner of one connection to the learnings index.
// Creates schema and applies migrations on open. Each statement runs in
// autocommit mode and is attempted exactly once: busy/locked results are
// returned to the caller, which owns the retry policy.
class SQLiteStore : public RecordStore {
public:
    ~SQLiteStore() override;

    // Move-only (owns sqlite3* handle)
    SQLiteStore(SQLiteStore&& other) noexcept
        : m_db(other.m_db), m_path(std::move(other.m_path)) { other.m_db = nullptr; }
    SQLiteStore& operator=(SQLiteStore&& other) noexcept {
        if (this != &other) {
            if (m_db) sqlite3_close(m_db);
            m_db = other.m_db;
            m_path = std::move(other.m_path);
            other.m_db = nullptr;
        }
        return *this;
    }
    SQLiteStore(const SQLiteStore&) = delete;
    SQLiteStore& operator=(const SQLiteStore&) = delete;

    // Open or create the database at the given path.
    // Creates schema and sets pragmas on first open.
    static std::optional<SQLiteStore> open(const QString& dbPath,
                                           int busyTimeoutMs = 10000,
                                           QString* error = nullptr);

    // ── RecordStore ─────────────────────────────────────────

    StoreResult insertRecord(const LearningRecord& record) override;
    StoreResult deleteRecord(LearningType type, int64_t id) override;
    bool checkpoint(QString* error = nullptr) override;
    QString databasePath() const override { return m_path; }

    // ── Reads (verification and tooling) ────────────────────

    struct LearningRow {
        int64_t id = 0;
        QString type;
        QString filepath;
        QString title;
        QString summary;
        QString tags;
        QString domain;
        int severity = 0;
        QString createdAt;
    };

    struct HeuristicRow {
        int64_t id = 0;
        QString domain;
        QString rule;
        QString explanation;
        QString sourceType;
        double confidence = 0.0;
        QString filepath;
    };

    std::optional<LearningRow> getLearningById(int64_t id);
    std::optional<LearningRow> getLearningByPath(const QString& filepath);
    std::optional<HeuristicRow> getHeuristicById(int64_t id);

    int64_t countLearnings();
    int64_t countHeuristics();

    // ── Settings ────────────────────────────────────────────

    std::optional<QString> getSetting(const QString& key);
    bool setSetting(const QString& key, const QString& value);

    // ── Maintenance ─────────────────────────────────────────

    // Returns true if database passes PRAGMA integrity_check
    bool integrityCheck(QString* detail = nullptr) const;

    // Raw handle for tests
    sqlite3* rawDb() const { return m_db; }

    static QString timestampToSql(const QDateTime& timestamp);

private:
    SQLiteStore() = default;
    bool init(const QString& dbPath, int busyTimeoutMs, QString* error);
    bool execSql(const char* sql, QString* error = nullptr);
    int64_t countRows(const char* sql);

    sqlite3* m_db = nullptr;
    QString m_path;
};

} // namespace elf
