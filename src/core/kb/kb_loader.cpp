#include "core/kb/kb_loader.h"
#include "core/shared/logging.h"

#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonParseError>

#include <sqlite3.h>

namespace rw {

namespace {

const QStringList& requiredColumns()
{
    static const QStringList columns = {
        QStringLiteral("id"),
        QStringLiteral("issue_keywords"),
        QStringLiteral("intervention"),
        QStringLiteral("reference"),
        QStringLiteral("priority"),
    };
    return columns;
}

KnowledgeBaseLoadResult failure(KnowledgeBaseLoadResult::Status status, const QString& message)
{
    KnowledgeBaseLoadResult result;
    result.status = status;
    result.errorMessage = message;
    return result;
}

bool isBlank(const QVariant& value)
{
    return !value.isValid() || value.isNull() || value.toString().trimmed().isEmpty();
}

// Arrays arrive from JSON as QVariantList; everything else is text.
std::optional<std::vector<QString>> listValue(const QVariant& value)
{
    if (!value.isValid() || value.isNull()) {
        return std::vector<QString>{};
    }
    if (value.userType() == QMetaType::QVariantList
        || value.userType() == QMetaType::QStringList) {
        const QStringList items = value.toStringList();
        return std::vector<QString>(items.begin(), items.end());
    }
    return KnowledgeBaseLoader::parseListField(value.toString());
}

struct ParsedRow {
    KnowledgeBaseLoadResult::Status status = KnowledgeBaseLoadResult::Status::Loaded;
    QString errorMessage;
    InterventionRecord record;
};

ParsedRow parseRow(const QVariantMap& row, int rowNumber)
{
    ParsedRow parsed;
    auto fail = [&parsed, rowNumber](KnowledgeBaseLoadResult::Status status,
                                     const QString& message) {
        parsed.status = status;
        parsed.errorMessage = QStringLiteral("row %1: %2").arg(rowNumber).arg(message);
        return parsed;
    };

    for (const QString& column : requiredColumns()) {
        if (!row.contains(column)) {
            return fail(KnowledgeBaseLoadResult::Status::MissingField,
                        QStringLiteral("missing field '%1'").arg(column));
        }
    }

    for (const QString& column : {QStringLiteral("id"), QStringLiteral("intervention"),
                                  QStringLiteral("priority")}) {
        if (isBlank(row.value(column))) {
            return fail(KnowledgeBaseLoadResult::Status::MissingField,
                        QStringLiteral("empty field '%1'").arg(column));
        }
    }

    bool idOk = false;
    const int id = row.value(QStringLiteral("id")).toString().trimmed().toInt(&idOk);
    if (!idOk) {
        return fail(KnowledgeBaseLoadResult::Status::InvalidField,
                    QStringLiteral("id '%1' is not an integer")
                        .arg(row.value(QStringLiteral("id")).toString()));
    }
    parsed.record.id = id;

    const QString priorityText = row.value(QStringLiteral("priority")).toString();
    const std::optional<Priority> priority = priorityFromString(priorityText);
    if (!priority.has_value()) {
        return fail(KnowledgeBaseLoadResult::Status::InvalidField,
                    QStringLiteral("unknown priority '%1'").arg(priorityText));
    }
    parsed.record.priority = *priority;

    const std::optional<std::vector<QString>> keywords =
        listValue(row.value(QStringLiteral("issue_keywords")));
    const std::optional<std::vector<QString>> roadTypes =
        listValue(row.value(QStringLiteral("road_type_tags")));
    const std::optional<std::vector<QString>> environmentTags =
        listValue(row.value(QStringLiteral("environment_tags")));
    if (!keywords.has_value() || !roadTypes.has_value() || !environmentTags.has_value()) {
        return fail(KnowledgeBaseLoadResult::Status::InvalidField,
                    QStringLiteral("malformed list field"));
    }
    parsed.record.issueKeywords = *keywords;
    parsed.record.roadTypes = *roadTypes;
    parsed.record.environmentTags = *environmentTags;

    parsed.record.interventionText = row.value(QStringLiteral("intervention")).toString();
    parsed.record.reference = row.value(QStringLiteral("reference")).toString();
    parsed.record.rationale = row.value(QStringLiteral("rationale")).toString();
    parsed.record.assumptions = row.value(QStringLiteral("assumptions")).toString();
    return parsed;
}

QString columnText(sqlite3_stmt* stmt, int column)
{
    const unsigned char* text = sqlite3_column_text(stmt, column);
    if (!text) {
        return {};
    }
    return QString::fromUtf8(reinterpret_cast<const char*>(text));
}

} // namespace

KnowledgeBaseLoadResult KnowledgeBaseLoader::loadFromFile(const QString& path)
{
    const QString suffix = QFileInfo(path).suffix().toLower();
    KnowledgeBaseLoadResult result;
    if (suffix == QLatin1String("csv")) {
        result = loadFromCsv(path);
    } else if (suffix == QLatin1String("json")) {
        result = loadFromJson(path);
    } else if (suffix == QLatin1String("db") || suffix == QLatin1String("sqlite")
               || suffix == QLatin1String("sqlite3")) {
        result = loadFromSqlite(path);
    } else {
        result = failure(KnowledgeBaseLoadResult::Status::SourceUnreadable,
                         QStringLiteral("Unsupported knowledge base format: %1").arg(path));
    }

    if (result.ok()) {
        LOG_INFO(rwKb, "Loaded %d interventions from %s",
                 result.kb->size(), qUtf8Printable(path));
    } else {
        LOG_WARN(rwKb, "Knowledge base load failed (%s): %s",
                 qUtf8Printable(loadStatusToString(result.status)),
                 qUtf8Printable(result.errorMessage.value_or(QStringLiteral("no details"))));
    }
    return result;
}

KnowledgeBaseLoadResult KnowledgeBaseLoader::loadFromCsv(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return failure(KnowledgeBaseLoadResult::Status::SourceUnreadable,
                       QStringLiteral("Cannot open %1").arg(path));
    }
    return loadFromCsvText(QString::fromUtf8(file.readAll()));
}

KnowledgeBaseLoadResult KnowledgeBaseLoader::loadFromCsvText(const QString& text)
{
    const std::optional<std::vector<QStringList>> table = parseCsv(text);
    if (!table.has_value()) {
        return failure(KnowledgeBaseLoadResult::Status::MalformedSource,
                       QStringLiteral("Unterminated quoted CSV field"));
    }
    if (table->empty()) {
        return failure(KnowledgeBaseLoadResult::Status::MalformedSource,
                       QStringLiteral("CSV has no header row"));
    }

    QStringList header = table->front();
    for (QString& column : header) {
        column = column.trimmed().toLower();
    }
    // Strip a UTF-8 byte order mark carried over into the first column name.
    if (!header.isEmpty() && header.front().startsWith(QChar(0xFEFF))) {
        header.front().remove(0, 1);
    }

    for (const QString& column : requiredColumns()) {
        if (!header.contains(column)) {
            return failure(KnowledgeBaseLoadResult::Status::MissingField,
                           QStringLiteral("CSV header lacks column '%1'").arg(column));
        }
    }

    std::vector<QVariantMap> rows;
    rows.reserve(table->size() - 1);
    for (size_t i = 1; i < table->size(); ++i) {
        const QStringList& fields = (*table)[i];
        if (fields.size() > header.size()) {
            return failure(KnowledgeBaseLoadResult::Status::MalformedSource,
                           QStringLiteral("row %1: %2 fields for %3 columns")
                               .arg(i).arg(fields.size()).arg(header.size()));
        }
        QVariantMap row;
        for (int c = 0; c < header.size(); ++c) {
            row.insert(header[c], c < fields.size() ? fields[c] : QString());
        }
        rows.push_back(std::move(row));
    }

    return loadFromRows(rows);
}

KnowledgeBaseLoadResult KnowledgeBaseLoader::loadFromJson(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return failure(KnowledgeBaseLoadResult::Status::SourceUnreadable,
                       QStringLiteral("Cannot open %1").arg(path));
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return failure(KnowledgeBaseLoadResult::Status::MalformedSource,
                       QStringLiteral("JSON parse error in %1: %2")
                           .arg(path, parseError.errorString()));
    }
    return loadFromJsonDocument(doc);
}

KnowledgeBaseLoadResult KnowledgeBaseLoader::loadFromJsonDocument(const QJsonDocument& doc)
{
    QJsonArray entries;
    if (doc.isArray()) {
        entries = doc.array();
    } else if (doc.isObject()
               && doc.object().value(QStringLiteral("interventions")).isArray()) {
        entries = doc.object().value(QStringLiteral("interventions")).toArray();
    } else {
        return failure(KnowledgeBaseLoadResult::Status::MalformedSource,
                       QStringLiteral("Expected an 'interventions' array"));
    }

    std::vector<QVariantMap> rows;
    rows.reserve(static_cast<size_t>(entries.size()));
    for (int i = 0; i < entries.size(); ++i) {
        if (!entries.at(i).isObject()) {
            return failure(KnowledgeBaseLoadResult::Status::MalformedSource,
                           QStringLiteral("entry %1 is not an object").arg(i + 1));
        }
        rows.push_back(entries.at(i).toObject().toVariantMap());
    }

    return loadFromRows(rows);
}

KnowledgeBaseLoadResult KnowledgeBaseLoader::loadFromSqlite(const QString& dbPath)
{
    if (!QFileInfo::exists(dbPath)) {
        return failure(KnowledgeBaseLoadResult::Status::SourceUnreadable,
                       QStringLiteral("Database not found: %1").arg(dbPath));
    }

    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(dbPath.toUtf8().constData(), &db, SQLITE_OPEN_READONLY, nullptr);
    if (rc != SQLITE_OK) {
        const QString message = QStringLiteral("Failed to open database %1: %2")
                                    .arg(dbPath, QString::fromUtf8(sqlite3_errmsg(db)));
        sqlite3_close(db);
        return failure(KnowledgeBaseLoadResult::Status::SourceUnreadable, message);
    }

    sqlite3_stmt* stmt = nullptr;
    rc = sqlite3_prepare_v2(db, "SELECT * FROM interventions ORDER BY rowid", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        const QString message = QStringLiteral("Cannot read interventions table: %1")
                                    .arg(QString::fromUtf8(sqlite3_errmsg(db)));
        sqlite3_finalize(stmt);
        sqlite3_close(db);
        return failure(KnowledgeBaseLoadResult::Status::MalformedSource, message);
    }

    const int columnCount = sqlite3_column_count(stmt);
    QStringList columns;
    for (int c = 0; c < columnCount; ++c) {
        columns.append(QString::fromUtf8(sqlite3_column_name(stmt, c)).toLower());
    }

    std::vector<QVariantMap> rows;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        QVariantMap row;
        for (int c = 0; c < columnCount; ++c) {
            if (sqlite3_column_type(stmt, c) == SQLITE_NULL) {
                row.insert(columns[c], QVariant());
            } else {
                row.insert(columns[c], columnText(stmt, c));
            }
        }
        rows.push_back(std::move(row));
    }

    const bool stepFailed = (rc != SQLITE_DONE);
    const QString stepError = QString::fromUtf8(sqlite3_errmsg(db));
    sqlite3_finalize(stmt);
    sqlite3_close(db);

    if (stepFailed) {
        return failure(KnowledgeBaseLoadResult::Status::MalformedSource,
                       QStringLiteral("Failed reading interventions: %1").arg(stepError));
    }

    return loadFromRows(rows);
}

KnowledgeBaseLoadResult KnowledgeBaseLoader::loadFromRows(const std::vector<QVariantMap>& rows)
{
    std::vector<InterventionRecord> records;
    records.reserve(rows.size());

    for (size_t i = 0; i < rows.size(); ++i) {
        ParsedRow parsed = parseRow(rows[i], static_cast<int>(i) + 1);
        if (parsed.status != KnowledgeBaseLoadResult::Status::Loaded) {
            return failure(parsed.status, parsed.errorMessage);
        }
        records.push_back(std::move(parsed.record));
    }

    return KnowledgeBase::create(std::move(records));
}

std::optional<std::vector<QStringList>> KnowledgeBaseLoader::parseCsv(const QString& text)
{
    std::vector<QStringList> rows;
    QStringList row;
    QString field;
    bool inQuotes = false;
    bool fieldStarted = false;

    auto endField = [&]() {
        row.append(field);
        field.clear();
        fieldStarted = false;
    };
    auto endRow = [&]() {
        endField();
        // Blank lines produce a single empty field; skip them.
        const bool blank = row.size() == 1 && row.front().trimmed().isEmpty();
        if (!blank) {
            rows.push_back(row);
        }
        row.clear();
    };

    for (int i = 0; i < text.size(); ++i) {
        const QChar ch = text[i];

        if (inQuotes) {
            if (ch == QLatin1Char('"')) {
                if (i + 1 < text.size() && text[i + 1] == QLatin1Char('"')) {
                    field.append(QLatin1Char('"'));
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field.append(ch);
            }
            continue;
        }

        if (ch == QLatin1Char('"') && !fieldStarted) {
            inQuotes = true;
            fieldStarted = true;
        } else if (ch == QLatin1Char(',')) {
            endField();
        } else if (ch == QLatin1Char('\r')) {
            continue;
        } else if (ch == QLatin1Char('\n')) {
            endRow();
        } else {
            field.append(ch);
            fieldStarted = true;
        }
    }

    if (inQuotes) {
        return std::nullopt;
    }
    if (fieldStarted || !field.isEmpty() || !row.isEmpty()) {
        endRow();
    }

    return rows;
}

std::optional<std::vector<QString>> KnowledgeBaseLoader::parseListField(const QString& value)
{
    const QString trimmed = value.trimmed();
    std::vector<QString> items;
    if (trimmed.isEmpty()) {
        return items;
    }
    if (!trimmed.startsWith(QLatin1Char('['))) {
        items.push_back(trimmed);
        return items;
    }
    if (!trimmed.endsWith(QLatin1Char(']'))) {
        return std::nullopt;
    }

    const QString body = trimmed.mid(1, trimmed.size() - 2);
    QString current;
    QChar quote;
    bool inQuotes = false;
    bool quoted = false;

    auto endItem = [&]() {
        const QString item = quoted ? current : current.trimmed();
        if (!item.isEmpty()) {
            items.push_back(item);
        }
        current.clear();
        quoted = false;
    };

    for (int i = 0; i < body.size(); ++i) {
        const QChar ch = body[i];
        if (inQuotes) {
            if (ch == QLatin1Char('\\') && i + 1 < body.size()) {
                current.append(body[++i]);
            } else if (ch == quote) {
                inQuotes = false;
            } else {
                current.append(ch);
            }
            continue;
        }

        if ((ch == QLatin1Char('\'') || ch == QLatin1Char('"')) && current.trimmed().isEmpty()) {
            inQuotes = true;
            quoted = true;
            quote = ch;
            current.clear();
        } else if (ch == QLatin1Char(',')) {
            endItem();
        } else if (!quoted) {
            current.append(ch);
        }
    }

    if (inQuotes) {
        return std::nullopt;
    }
    endItem();
    return items;
}

} // namespace rw
