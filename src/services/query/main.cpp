#include "query_service.h"

#include "core/explain/explanation_layer.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTextStream>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitLoadFailed = 1;
constexpr int kExitBadInput = 2;

void printJson(const QJsonObject& json)
{
    QTextStream out(stdout);
    out << QJsonDocument(json).toJson(QJsonDocument::Indented);
}

void printFallback(const QJsonObject& fallback)
{
    QTextStream out(stdout);
    out << fallback.value(QStringLiteral("message")).toString() << '\n';
    for (const QJsonValue& suggestion : fallback.value(QStringLiteral("suggestions")).toArray()) {
        out << "  - " << suggestion.toString() << '\n';
    }
    out << fallback.value(QStringLiteral("fallback_action")).toString() << '\n';
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("roadwise-query"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Recommend road-safety interventions for an observed issue."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption kbOption(QStringLiteral("kb"),
        QStringLiteral("Knowledge base file (.csv, .json, .db)."), QStringLiteral("path"));
    const QCommandLineOption settingsOption(QStringLiteral("settings"),
        QStringLiteral("Settings JSON file."), QStringLiteral("path"));
    const QCommandLineOption roadTypeOption(QStringLiteral("road-type"),
        QStringLiteral("Road type, e.g. urban, highway, rural."), QStringLiteral("type"));
    const QCommandLineOption environmentOption(QStringLiteral("environment"),
        QStringLiteral("Environment context, e.g. curve, school zone."), QStringLiteral("env"));
    const QCommandLineOption topKOption(QStringLiteral("top-k"),
        QStringLiteral("Number of recommendations."), QStringLiteral("k"));
    const QCommandLineOption thresholdOption(QStringLiteral("threshold"),
        QStringLiteral("Minimum confidence in [0, 1]."), QStringLiteral("score"));
    const QCommandLineOption formatOption(QStringLiteral("format"),
        QStringLiteral("Output format: json or text."), QStringLiteral("format"),
        QStringLiteral("json"));
    const QCommandLineOption statsOption(QStringLiteral("stats"),
        QStringLiteral("Print knowledge base statistics and exit."));

    parser.addOptions({kbOption, settingsOption, roadTypeOption, environmentOption,
                       topKOption, thresholdOption, formatOption, statsOption});
    parser.addPositionalArgument(QStringLiteral("issue"),
        QStringLiteral("Description of the observed road safety issue."));
    parser.process(app);

    std::optional<rw::Settings> loaded;
    if (parser.isSet(settingsOption)) {
        const QString settingsPath = parser.value(settingsOption);
        loaded = rw::SettingsManager::loadFromFile(settingsPath);
        if (!loaded) {
            LOG_WARN(rwCore, "Settings file %s missing or unreadable; using defaults",
                     qUtf8Printable(settingsPath));
        }
    } else {
        loaded = rw::SettingsManager::load();
    }
    rw::Settings settings = loaded.value_or(rw::Settings{});
    if (parser.isSet(kbOption)) {
        settings.kbPath = parser.value(kbOption);
    }
    if (settings.kbPath.isEmpty()) {
        LOG_ERROR(rwCore, "No knowledge base configured; pass --kb or set kbPath in settings");
        return kExitLoadFailed;
    }

    rw::QueryService service(settings);
    const rw::KnowledgeBaseLoadResult load = service.loadKnowledgeBase(settings.kbPath);
    if (!load.ok()) {
        QTextStream(stderr) << "Failed to load knowledge base: "
                            << load.errorMessage.value_or(rw::loadStatusToString(load.status))
                            << '\n';
        return kExitLoadFailed;
    }

    if (parser.isSet(statsOption)) {
        printJson(service.handleStats());
        return kExitOk;
    }

    QJsonObject params;
    params.insert(QStringLiteral("query"), parser.positionalArguments().join(QLatin1Char(' ')));
    if (parser.isSet(roadTypeOption)) {
        params.insert(QStringLiteral("road_type"), parser.value(roadTypeOption));
    }
    if (parser.isSet(environmentOption)) {
        params.insert(QStringLiteral("environment"), parser.value(environmentOption));
    }
    if (parser.isSet(topKOption)) {
        bool ok = false;
        const int topK = parser.value(topKOption).toInt(&ok);
        if (!ok) {
            QTextStream(stderr) << "--top-k expects an integer\n";
            return kExitBadInput;
        }
        params.insert(QStringLiteral("top_k"), topK);
    }
    if (parser.isSet(thresholdOption)) {
        bool ok = false;
        const double threshold = parser.value(thresholdOption).toDouble(&ok);
        if (!ok) {
            QTextStream(stderr) << "--threshold expects a number\n";
            return kExitBadInput;
        }
        params.insert(QStringLiteral("threshold"), threshold);
    }

    QString parseError;
    const std::optional<rw::RetrievalRequest> parsed = service.requestFromJson(params, &parseError);
    if (!parsed) {
        QTextStream(stderr) << parseError << '\n';
        return kExitBadInput;
    }
    const rw::RetrievalRequest& request = *parsed;
    const rw::RetrievalOutcome outcome = service.recommend(request);
    const QJsonObject response = rw::ExplanationLayer::buildResponse(request, outcome);

    if (!outcome.ok()) {
        QTextStream(stderr) << response.value(QStringLiteral("message")).toString() << '\n';
        return kExitBadInput;
    }

    if (parser.value(formatOption) == QLatin1String("text")) {
        if (outcome.confident) {
            QTextStream(stdout) << rw::ExplanationLayer::reportText(
                request,
                rw::ExplanationLayer::formatRecommendations(outcome, request.minScoreThreshold))
                                << '\n';
        } else {
            printFallback(response);
        }
    } else {
        printJson(response);
    }

    return kExitOk;
}
