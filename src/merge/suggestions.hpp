#pragma once

#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QtGlobal>

#include <map>
#include <vector>

#include "core/result.hpp"

namespace quire::merge {

struct Suggestion {
    QString old_value;
    QString new_value;
    QJsonObject extra;
};

struct SuggestionRecord {
    // Milliseconds since epoch; 0 when the record carries no date.
    qint64 last_updated = 0;
    // The date as it appeared on the wire (number or ISO string), written back unchanged.
    QJsonValue last_updated_raw;
    std::vector<Suggestion> suggestions;
    QJsonObject extra;
};

using SuggestionStore = std::map<QString, SuggestionRecord>;

// Accepts integer milliseconds or an ISO-8601 string. Anything else reads as 0.
[[nodiscard]] qint64 parse_last_updated(const QJsonValue& value);

[[nodiscard]] Result<SuggestionStore> parse_suggestion_store(const QString& text);
[[nodiscard]] QString serialize_suggestion_store(const SuggestionStore& store);

/**
 * Keyed-record merge: `ours` seeds the result; for a key on both sides the
 * strictly later `lastUpdatedDate` picks the base record (ties keep ours) and
 * the suggestion lists of both sides are always unioned by
 * (oldValue, newValue), first seen first.
 */
[[nodiscard]] SuggestionStore merge_suggestion_stores(const SuggestionStore& ours, const SuggestionStore& theirs);

/**
 * Text entry point. Never fails: blank input reads as the empty store and any
 * parse failure yields "{}".
 */
[[nodiscard]] QString resolve_suggestion_store(const QString& ours, const QString& theirs);

} // namespace quire::merge
