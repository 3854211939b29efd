#include "core/shared/logging.h"

#include <QDate>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QMutex>
#include <QMutexLocker>

#include <cstdio>

Q_LOGGING_CATEGORY(elfCore, "elf.core")
Q_LOGGING_CATEGORY(elfIndex, "elf.index")
Q_LOGGING_CATEGORY(elfFs, "elf.fs")
Q_LOGGING_CATEGORY(elfLock, "elf.lock")
Q_LOGGING_CATEGORY(elfHistory, "elf.history")
Q_LOGGING_CATEGORY(elfRecord, "elf.record")

namespace elf {

namespace {

QMutex g_sinkMutex;
QString g_logDir;
QString g_correlationId;
QtMessageHandler g_previousHandler = nullptr;
bool g_sinkInstalled = false;

const char* levelName(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:    return "DEBUG";
    case QtInfoMsg:     return "INFO";
    case QtWarningMsg:  return "WARN";
    case QtCriticalMsg: return "ERROR";
    case QtFatalMsg:    return "FATAL";
    }
    return "INFO";
}

void fileSinkHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg)
{
    const QString timestamp =
        QDateTime::currentDateTime().toString(QStringLiteral("yyyy-MM-dd HH:mm:ss"));
    const char* category = context.category ? context.category : "default";

    QString logDir;
    QString correlationId;
    {
        QMutexLocker locker(&g_sinkMutex);
        logDir = g_logDir;
        correlationId = g_correlationId;
    }

    const QString line = QStringLiteral("[%1] [%2] [%3] [%4] %5\n")
                             .arg(timestamp,
                                  QString::fromLatin1(levelName(type)),
                                  QString::fromLatin1(category),
                                  correlationId.isEmpty() ? QStringLiteral("-") : correlationId,
                                  msg);
    const QByteArray lineUtf8 = line.toUtf8();

    if (!logDir.isEmpty()) {
        const QString fileName =
            QDate::currentDate().toString(QStringLiteral("yyyyMMdd")) + QStringLiteral(".log");
        QFile file(QDir(logDir).filePath(fileName));
        // Append mode keeps concurrent writers from clobbering each other's lines.
        if (file.open(QIODevice::WriteOnly | QIODevice::Append)) {
            file.write(lineUtf8);
            file.close();
        }
    }

    if (type == QtCriticalMsg || type == QtFatalMsg) {
        std::fputs(lineUtf8.constData(), stderr);
        std::fflush(stderr);
    }
}

} // namespace

bool installFileLogSink(const QString& logDir, QString* error)
{
    if (logDir.isEmpty()) {
        if (error) {
            *error = QStringLiteral("Log directory is empty");
        }
        return false;
    }
    if (!QDir().mkpath(logDir)) {
        if (error) {
            *error = QStringLiteral("Failed to create log directory: %1").arg(logDir);
        }
        return false;
    }

    QMutexLocker locker(&g_sinkMutex);
    g_logDir = logDir;
    if (!g_sinkInstalled) {
        g_previousHandler = qInstallMessageHandler(fileSinkHandler);
        g_sinkInstalled = true;
    }
    return true;
}

void removeFileLogSink()
{
    QMutexLocker locker(&g_sinkMutex);
    if (!g_sinkInstalled) {
        return;
    }
    qInstallMessageHandler(g_previousHandler);
    g_previousHandler = nullptr;
    g_sinkInstalled = false;
    g_logDir.clear();
}

void setLogCorrelationId(const QString& correlationId)
{
    QMutexLocker locker(&g_sinkMutex);
    g_correlationId = correlationId;
}

QString logCorrelationId()
{
    QMutexLocker locker(&g_sinkMutex);
    return g_correlationId;
}

} // namespace elf
