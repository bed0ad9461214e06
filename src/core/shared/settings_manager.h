#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace rw {

// SettingsManager -- JSON save/load for application settings.
//
// Settings are stored as a JSON file at:
//   <GenericDataLocation>/roadwise/settings.json
// ROADWISE_DATA_DIR replaces the directory when set.
class SettingsManager {
public:
    // Load settings from disk. Returns nullopt if file doesn't exist
    // or cannot be parsed.
    static std::optional<Settings> load();
    static std::optional<Settings> loadFromFile(const QString& filePath);

    // Save settings to disk. Creates the directory if it doesn't exist.
    // Returns true on success.
    static bool save(const Settings& settings);
    static bool saveToFile(const Settings& settings, const QString& filePath);

    static QString settingsFilePath();

    // Convert settings to/from JSON. Missing keys keep their defaults, and so
    // do values of the wrong type or out of range (weights outside [0,1],
    // fuzzyMatchFloor outside [0.5,1), defaultTopK below 1), with a warning.
    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);
};

} // namespace rw
