#pragma once

#include <QString>

namespace elf {

enum class LockStrategy {
    Auto,    // probe the filesystem at startup
    Flock,
    Mkdir,
};

QString lockStrategyToString(LockStrategy strategy);
LockStrategy lockStrategyFromString(const QString& str);

// What to do when the record is stored but could not be historized.
enum class HistoryFailurePolicy {
    Rollback,   // remove document + row, report failure
    Degrade,    // keep document + row, report "saved but not historized"
};

QString historyFailurePolicyToString(HistoryFailurePolicy policy);
HistoryFailurePolicy historyFailurePolicyFromString(const QString& str);

struct RecorderSettings {
    // Layout. Relative paths are resolved against baseDir.
    QString baseDir;
    QString dbPath = QStringLiteral("memory/index.db");
    QString documentsRoot = QStringLiteral("memory");
    QString lockPath = QStringLiteral(".git/elf-history.lock");
    QString logDir = QStringLiteral("logs");

    // IndexWriter
    int sqliteBusyTimeoutMs = 10000;
    int insertMaxAttempts = 5;
    int insertBackoffBaseMs = 100;
    int insertBackoffCapMs = 2000;
    int insertJitterMs = 100;

    // AdvisoryLock
    int lockTimeoutMs = 30000;
    int lockPollIntervalMs = 0;   // 0 = strategy default
    LockStrategy lockStrategy = LockStrategy::Auto;

    // HistoryCommitter
    bool historyEnabled = true;
    int gitTimeoutMs = 10000;
    HistoryFailurePolicy historyFailurePolicy = HistoryFailurePolicy::Rollback;

    // Logging
    bool fileLogging = true;

    QString resolve(const QString& path) const;
    QString resolvedDbPath() const { return resolve(dbPath); }
    QString resolvedDocumentsRoot() const { return resolve(documentsRoot); }
    QString resolvedLockPath() const { return resolve(lockPath); }
    QString resolvedLogDir() const { return resolve(logDir); }
};

} // namespace elf
