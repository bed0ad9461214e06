#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

#include <limits>

namespace rw {

namespace {

QJsonObject weightsToJson(const ScoringWeights& weights)
{
    QJsonObject json;
    json.insert(QStringLiteral("roadTypeBoost"), weights.roadTypeBoost);
    json.insert(QStringLiteral("defaultRoadTypeBoost"), weights.defaultRoadTypeBoost);
    json.insert(QStringLiteral("environmentBoostCap"), weights.environmentBoostCap);
    json.insert(QStringLiteral("highPriorityWeight"), weights.highPriorityWeight);
    json.insert(QStringLiteral("mediumPriorityWeight"), weights.mediumPriorityWeight);
    json.insert(QStringLiteral("lowPriorityWeight"), weights.lowPriorityWeight);
    json.insert(QStringLiteral("fuzzyMatchFloor"), weights.fuzzyMatchFloor);
    json.insert(QStringLiteral("keywordAlignmentShare"), weights.keywordAlignmentShare);
    return json;
}

// Reads json[key] when it is a number within [lo, hi] (hi exclusive when
// hiExclusive is set). Anything else logs a warning and keeps fallback.
double boundedValue(const QJsonObject& json, const QString& key, double fallback,
                    double lo, double hi, bool hiExclusive = false)
{
    const QJsonValue value = json.value(key);
    if (value.isUndefined() || value.isNull()) {
        return fallback;
    }
    if (!value.isDouble()) {
        LOG_WARN(rwCore, "Settings: %s is not a number; keeping %g",
                 qUtf8Printable(key), fallback);
        return fallback;
    }

    const double parsed = value.toDouble();
    const bool aboveRange = hiExclusive ? parsed >= hi : parsed > hi;
    if (parsed < lo || aboveRange) {
        LOG_WARN(rwCore, "Settings: %s=%g outside [%g, %g%c; keeping %g",
                 qUtf8Printable(key), parsed, lo, hi, hiExclusive ? ')' : ']', fallback);
        return fallback;
    }
    return parsed;
}

ScoringWeights weightsFromJson(const QJsonObject& json)
{
    ScoringWeights weights;
    auto unit = [&json](const char* key, double fallback) {
        return boundedValue(json, QString::fromLatin1(key), fallback, 0.0, 1.0);
    };

    weights.roadTypeBoost = unit("roadTypeBoost", weights.roadTypeBoost);
    weights.defaultRoadTypeBoost = unit("defaultRoadTypeBoost", weights.defaultRoadTypeBoost);
    weights.environmentBoostCap = unit("environmentBoostCap", weights.environmentBoostCap);
    weights.highPriorityWeight = unit("highPriorityWeight", weights.highPriorityWeight);
    weights.mediumPriorityWeight = unit("mediumPriorityWeight", weights.mediumPriorityWeight);
    weights.lowPriorityWeight = unit("lowPriorityWeight", weights.lowPriorityWeight);
    weights.keywordAlignmentShare = unit("keywordAlignmentShare", weights.keywordAlignmentShare);
    // Matching is strictly above the floor, so 1.0 would reject exact matches.
    weights.fuzzyMatchFloor = boundedValue(json, QStringLiteral("fuzzyMatchFloor"),
                                           weights.fuzzyMatchFloor,
                                           kMinFuzzyMatchFloor, 1.0, true);
    return weights;
}

} // namespace

std::optional<Settings> SettingsManager::load()
{
    return loadFromFile(settingsFilePath());
}

std::optional<Settings> SettingsManager::loadFromFile(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(rwCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(rwCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const Settings& settings)
{
    return saveToFile(settings, settingsFilePath());
}

bool SettingsManager::saveToFile(const Settings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(rwCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(rwCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(rwCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString dataDir = qEnvironmentVariable("ROADWISE_DATA_DIR").trimmed();
    if (!dataDir.isEmpty()) {
        return QDir(dataDir).filePath(QStringLiteral("settings.json"));
    }

    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/roadwise/settings.json");
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("kbPath"), settings.kbPath);
    json.insert(QStringLiteral("defaultTopK"), settings.defaults.topK);
    json.insert(QStringLiteral("minScoreThreshold"), settings.defaults.minScoreThreshold);
    json.insert(QStringLiteral("defaultRoadType"), settings.defaults.roadType);
    json.insert(QStringLiteral("weights"), weightsToJson(settings.weights));
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    settings.kbPath = json.value(QStringLiteral("kbPath")).toString(settings.kbPath);
    settings.defaults.topK = static_cast<int>(
        boundedValue(json, QStringLiteral("defaultTopK"), settings.defaults.topK, 1.0,
                     static_cast<double>(std::numeric_limits<int>::max())));
    settings.defaults.minScoreThreshold =
        boundedValue(json, QStringLiteral("minScoreThreshold"),
                     settings.defaults.minScoreThreshold, 0.0, 1.0);
    settings.defaults.roadType = json.value(QStringLiteral("defaultRoadType"))
                                     .toString(settings.defaults.roadType);

    if (json.value(QStringLiteral("weights")).isObject()) {
        settings.weights = weightsFromJson(json.value(QStringLiteral("weights")).toObject());
    }

    return settings;
}

} // namespace rw
