#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>

namespace elf {

namespace {

void applyIntEnv(const char* name, int& target)
{
    if (!qEnvironmentVariableIsSet(name)) {
        return;
    }
    bool ok = false;
    const int value = qEnvironmentVariableIntValue(name, &ok);
    if (ok && value >= 0) {
        target = value;
    } else {
        LOG_WARN(elfCore, "Ignoring invalid %s=%s", name,
                 qUtf8Printable(qEnvironmentVariable(name)));
    }
}

bool envFlagEnabled(const QString& value)
{
    const QString normalized = value.trimmed().toLower();
    return normalized == QLatin1String("1") || normalized == QLatin1String("true")
        || normalized == QLatin1String("yes") || normalized == QLatin1String("on");
}

void readInt(const QJsonObject& json, const QString& key, int& target)
{
    if (json.contains(key)) {
        target = json.value(key).toInt(target);
    }
}

} // namespace

QString lockStrategyToString(LockStrategy strategy)
{
    switch (strategy) {
    case LockStrategy::Auto:  return QStringLiteral("auto");
    case LockStrategy::Flock: return QStringLiteral("flock");
    case LockStrategy::Mkdir: return QStringLiteral("mkdir");
    }
    return QStringLiteral("auto");
}

LockStrategy lockStrategyFromString(const QString& str)
{
    const QString value = str.trimmed().toLower();
    if (value == QLatin1String("flock")) return LockStrategy::Flock;
    if (value == QLatin1String("mkdir")) return LockStrategy::Mkdir;
    return LockStrategy::Auto;
}

QString historyFailurePolicyToString(HistoryFailurePolicy policy)
{
    switch (policy) {
    case HistoryFailurePolicy::Rollback: return QStringLiteral("rollback");
    case HistoryFailurePolicy::Degrade:  return QStringLiteral("degrade");
    }
    return QStringLiteral("rollback");
}

HistoryFailurePolicy historyFailurePolicyFromString(const QString& str)
{
    if (str.trimmed().toLower() == QLatin1String("degrade")) {
        return HistoryFailurePolicy::Degrade;
    }
    return HistoryFailurePolicy::Rollback;
}

QString RecorderSettings::resolve(const QString& path) const
{
    if (path.isEmpty() || QDir::isAbsolutePath(path)) {
        return QDir::cleanPath(path);
    }
    return QDir::cleanPath(QDir(baseDir).filePath(path));
}

std::optional<RecorderSettings> SettingsManager::load(const QString& baseDir, QString* error)
{
    RecorderSettings settings;
    QString base = baseDir.trimmed();
    if (base.isEmpty()) {
        base = qEnvironmentVariable("ELF_BASE_DIR").trimmed();
    }
    if (base.isEmpty()) {
        base = defaultBaseDir();
    }
    settings.baseDir = QDir::cleanPath(QDir(base).absolutePath());

    const QString filePath = settingsFilePath(settings.baseDir);
    QFile file(filePath);
    if (file.exists()) {
        if (!file.open(QIODevice::ReadOnly)) {
            if (error) {
                *error = QStringLiteral("Failed to open settings file: %1").arg(filePath);
            }
            return std::nullopt;
        }
        const QByteArray rawJson = file.readAll();
        file.close();

        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
        if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
            LOG_WARN(elfCore,
                     "Failed to parse settings JSON (%s): %s",
                     qUtf8Printable(filePath),
                     qUtf8Printable(parseError.errorString()));
            if (error) {
                *error = QStringLiteral("Malformed settings file %1: %2")
                             .arg(filePath, parseError.errorString());
            }
            return std::nullopt;
        }
        settings = fromJson(doc.object(), settings);
    }

    applyEnvironment(settings);
    return settings;
}

bool SettingsManager::save(const RecorderSettings& settings)
{
    const QString filePath = settingsFilePath(settings.baseDir);
    const QString parentDir = QFileInfo(filePath).absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(elfCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(elfCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(elfCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::defaultBaseDir()
{
    return QDir::homePath() + QStringLiteral("/.claude/emergent-learning");
}

QString SettingsManager::settingsFilePath(const QString& baseDir)
{
    return QDir(baseDir).filePath(QStringLiteral("settings.json"));
}

void SettingsManager::applyEnvironment(RecorderSettings& settings)
{
    const QString dbPath = qEnvironmentVariable("ELF_DB_PATH").trimmed();
    if (!dbPath.isEmpty()) {
        settings.dbPath = dbPath;
    }
    const QString lockPath = qEnvironmentVariable("ELF_LOCK_PATH").trimmed();
    if (!lockPath.isEmpty()) {
        settings.lockPath = lockPath;
    }

    applyIntEnv("ELF_SQLITE_BUSY_TIMEOUT_MS", settings.sqliteBusyTimeoutMs);
    applyIntEnv("ELF_INSERT_MAX_ATTEMPTS", settings.insertMaxAttempts);
    applyIntEnv("ELF_INSERT_BACKOFF_BASE_MS", settings.insertBackoffBaseMs);
    applyIntEnv("ELF_LOCK_TIMEOUT_MS", settings.lockTimeoutMs);
    applyIntEnv("ELF_LOCK_POLL_INTERVAL_MS", settings.lockPollIntervalMs);
    applyIntEnv("ELF_GIT_TIMEOUT_MS", settings.gitTimeoutMs);

    if (qEnvironmentVariableIsSet("ELF_LOCK_STRATEGY")) {
        settings.lockStrategy = lockStrategyFromString(qEnvironmentVariable("ELF_LOCK_STRATEGY"));
    }
    if (qEnvironmentVariableIsSet("ELF_HISTORY_ENABLED")) {
        settings.historyEnabled = envFlagEnabled(qEnvironmentVariable("ELF_HISTORY_ENABLED"));
    }
    if (qEnvironmentVariableIsSet("ELF_HISTORY_FAILURE_POLICY")) {
        settings.historyFailurePolicy = historyFailurePolicyFromString(
            qEnvironmentVariable("ELF_HISTORY_FAILURE_POLICY"));
    }
    if (qEnvironmentVariableIsSet("ELF_FILE_LOGGING")) {
        settings.fileLogging = envFlagEnabled(qEnvironmentVariable("ELF_FILE_LOGGING"));
    }
}

QJsonObject SettingsManager::toJson(const RecorderSettings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("dbPath"), settings.dbPath);
    json.insert(QStringLiteral("documentsRoot"), settings.documentsRoot);
    json.insert(QStringLiteral("lockPath"), settings.lockPath);
    json.insert(QStringLiteral("logDir"), settings.logDir);
    json.insert(QStringLiteral("sqliteBusyTimeoutMs"), settings.sqliteBusyTimeoutMs);
    json.insert(QStringLiteral("insertMaxAttempts"), settings.insertMaxAttempts);
    json.insert(QStringLiteral("insertBackoffBaseMs"), settings.insertBackoffBaseMs);
    json.insert(QStringLiteral("insertBackoffCapMs"), settings.insertBackoffCapMs);
    json.insert(QStringLiteral("insertJitterMs"), settings.insertJitterMs);
    json.insert(QStringLiteral("lockTimeoutMs"), settings.lockTimeoutMs);
    json.insert(QStringLiteral("lockPollIntervalMs"), settings.lockPollIntervalMs);
    json.insert(QStringLiteral("lockStrategy"), lockStrategyToString(settings.lockStrategy));
    json.insert(QStringLiteral("historyEnabled"), settings.historyEnabled);
    json.insert(QStringLiteral("gitTimeoutMs"), settings.gitTimeoutMs);
    json.insert(QStringLiteral("historyFailurePolicy"),
                historyFailurePolicyToString(settings.historyFailurePolicy));
    json.insert(QStringLiteral("fileLogging"), settings.fileLogging);
    return json;
}

RecorderSettings SettingsManager::fromJson(const QJsonObject& json, RecorderSettings defaults)
{
    RecorderSettings settings = std::move(defaults);

    settings.dbPath = json.value(QStringLiteral("dbPath")).toString(settings.dbPath);
    settings.documentsRoot =
        json.value(QStringLiteral("documentsRoot")).toString(settings.documentsRoot);
    settings.lockPath = json.value(QStringLiteral("lockPath")).toString(settings.lockPath);
    settings.logDir = json.value(QStringLiteral("logDir")).toString(settings.logDir);

    readInt(json, QStringLiteral("sqliteBusyTimeoutMs"), settings.sqliteBusyTimeoutMs);
    readInt(json, QStringLiteral("insertMaxAttempts"), settings.insertMaxAttempts);
    readInt(json, QStringLiteral("insertBackoffBaseMs"), settings.insertBackoffBaseMs);
    readInt(json, QStringLiteral("insertBackoffCapMs"), settings.insertBackoffCapMs);
    readInt(json, QStringLiteral("insertJitterMs"), settings.insertJitterMs);
    readInt(json, QStringLiteral("lockTimeoutMs"), settings.lockTimeoutMs);
    readInt(json, QStringLiteral("lockPollIntervalMs"), settings.lockPollIntervalMs);
    readInt(json, QStringLiteral("gitTimeoutMs"), settings.gitTimeoutMs);

    if (json.contains(QStringLiteral("lockStrategy"))) {
        settings.lockStrategy =
            lockStrategyFromString(json.value(QStringLiteral("lockStrategy")).toString());
    }
    settings.historyEnabled =
        json.value(QStringLiteral("historyEnabled")).toBool(settings.historyEnabled);
    if (json.contains(QStringLiteral("historyFailurePolicy"))) {
        settings.historyFailurePolicy = historyFailurePolicyFromString(
            json.value(QStringLiteral("historyFailurePolicy")).toString());
    }
    settings.fileLogging =
        json.value(QStringLiteral("fileLogging")).toBool(settings.fileLogging);

    return settings;
}

} // namespace elf
