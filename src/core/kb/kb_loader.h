#pragma once

#include "core/kb/knowledge_base.h"

#include <QJsonDocument>
#include <QString>
#include <QStringList>
#include <QVariantMap>

#include <optional>
#include <vector>

namespace rw {

// KnowledgeBaseLoader -- builds a KnowledgeBase from its source data.
//
// Supported sources:
//   .csv                  header row + one intervention per row
//   .json                 {"interventions": [...]} or a bare array
//   .db/.sqlite/.sqlite3  table "interventions", opened read-only
//
// Column / field names: id, issue_keywords, intervention, reference, priority
// (required); road_type_tags, environment_tags, rationale, assumptions
// (optional). List fields accept a list literal such as "['curve', 'night']"
// or a single bare value.
class KnowledgeBaseLoader {
public:
    // Dispatch on the file extension.
    static KnowledgeBaseLoadResult loadFromFile(const QString& path);

    static KnowledgeBaseLoadResult loadFromCsv(const QString& path);
    static KnowledgeBaseLoadResult loadFromCsvText(const QString& text);

    static KnowledgeBaseLoadResult loadFromJson(const QString& path);
    static KnowledgeBaseLoadResult loadFromJsonDocument(const QJsonDocument& doc);

    static KnowledgeBaseLoadResult loadFromSqlite(const QString& dbPath);

    // Build from already-split rows keyed by column name.
    static KnowledgeBaseLoadResult loadFromRows(const std::vector<QVariantMap>& rows);

    // RFC 4180 style: quoted fields, doubled quotes, embedded separators and
    // newlines. Returns nullopt on an unterminated quote.
    static std::optional<std::vector<QStringList>> parseCsv(const QString& text);

    // "['a', \"b\", c]" -> {a, b, c}; "" -> {}; "plain" -> {plain}.
    // Returns nullopt for an unterminated list or quote.
    static std::optional<std::vector<QString>> parseListField(const QString& value);
};

} // namespace rw
