#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace elf {

// SettingsManager -- JSON save/load for recorder settings.
//
// Resolution order (later wins):
//   1. compiled-in defaults
//   2. <baseDir>/settings.json
//   3. ELF_* environment variables
//
// baseDir itself comes from ELF_BASE_DIR, falling back to
//   ~/.claude/emergent-learning
class SettingsManager {
public:
    // Load settings for baseDir (or the default base directory when empty).
    // A missing settings.json is not an error; a malformed one is.
    static std::optional<RecorderSettings> load(const QString& baseDir = {},
                                                QString* error = nullptr);

    // Save settings to <baseDir>/settings.json.
    static bool save(const RecorderSettings& settings);

    static QString defaultBaseDir();
    static QString settingsFilePath(const QString& baseDir);

    static void applyEnvironment(RecorderSettings& settings);

    static QJsonObject toJson(const RecorderSettings& settings);
    static RecorderSettings fromJson(const QJsonObject& json,
                                     RecorderSettings defaults = {});
};

} // namespace elf
