#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <optional>

namespace rc {

// SettingsManager -- JSON load/save for service settings.
//
// The settings file is the first existing path of:
//   $RECOLLECT_CONFIG_PATH
//   <GenericConfigLocation>/recollect/config.json
//   ~/.recollect.json
//   ./config.json
// With no file present the defaults apply.
class SettingsManager {
public:
    // Returns nullopt with error set when the file exists but is unreadable,
    // malformed, or holds invalid values.
    static std::optional<Settings> load(QString* error = nullptr);
    static std::optional<Settings> loadFrom(const QString& filePath, QString* error = nullptr);

    static bool save(const Settings& settings, const QString& filePath);

    static QStringList searchPaths();
    // First existing search path, or empty.
    static QString settingsFilePath();

    static Settings defaults();

    static QJsonObject toJson(const Settings& settings);
    static std::optional<Settings> fromJson(const QJsonObject& json, QString* error = nullptr);

    // Range checks shared by fromJson and callers building Settings by hand.
    static bool validate(const Settings& settings, QString* error = nullptr);
};

} // namespace rc
