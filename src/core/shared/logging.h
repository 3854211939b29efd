#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(elfCore)
Q_DECLARE_LOGGING_CATEGORY(elfIndex)
Q_DECLARE_LOGGING_CATEGORY(elfFs)
Q_DECLARE_LOGGING_CATEGORY(elfLock)
Q_DECLARE_LOGGING_CATEGORY(elfHistory)
Q_DECLARE_LOGGING_CATEGORY(elfRecord)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)

namespace elf {

// Route Qt log output to <logDir>/YYYYMMDD.log in addition to stderr.
// Lines look like:
//   [2025-01-31 12:00:00] [INFO] [elf.record] [<correlation>] message
// Only critical messages are echoed to stderr once the sink is installed.
bool installFileLogSink(const QString& logDir, QString* error = nullptr);
void removeFileLogSink();

// Correlation id stamped on every line written by the file sink.
// Each record() call sets its own id; empty means "not inside a call".
void setLogCorrelationId(const QString& correlationId);
QString logCorrelationId();

} // namespace elf
