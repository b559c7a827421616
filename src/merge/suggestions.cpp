#include "merge/suggestions.hpp"

#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

#include <set>
#include <utility>

#include "merge/json_number.hpp"
#include "merge/log.hpp"

namespace quire::merge {
namespace {

const QString kLastUpdatedDate = QStringLiteral("lastUpdatedDate");
const QString kSuggestions = QStringLiteral("suggestions");
const QString kOldValue = QStringLiteral("oldValue");
const QString kNewValue = QStringLiteral("newValue");

Result<SuggestionRecord> parse_record(const QString& key, const QJsonValue& json) {
    if (!json.isObject()) {
        return Result<SuggestionRecord>::err(parse_error("suggestion record " + key.toStdString() +
                                                         " is not an object"));
    }
    const auto obj = json.toObject();

    SuggestionRecord record;
    record.last_updated_raw = obj.value(kLastUpdatedDate);
    record.last_updated = parse_last_updated(record.last_updated_raw);

    const auto suggestions = obj.value(kSuggestions);
    if (!suggestions.isUndefined() && !suggestions.isArray()) {
        return Result<SuggestionRecord>::err(parse_error("suggestion record " + key.toStdString() +
                                                         ": suggestions is not an array"));
    }
    for (const auto& item : suggestions.toArray()) {
        if (!item.isObject()) {
            return Result<SuggestionRecord>::err(parse_error("suggestion record " + key.toStdString() +
                                                             ": suggestion is not an object"));
        }
        auto s = item.toObject();
        Suggestion suggestion;
        suggestion.old_value = s.value(kOldValue).toString();
        suggestion.new_value = s.value(kNewValue).toString();
        s.remove(kOldValue);
        s.remove(kNewValue);
        suggestion.extra = std::move(s);
        record.suggestions.push_back(std::move(suggestion));
    }

    record.extra = obj;
    record.extra.remove(kLastUpdatedDate);
    record.extra.remove(kSuggestions);
    return Result<SuggestionRecord>::ok(std::move(record));
}

QJsonObject record_to_json(const SuggestionRecord& record) {
    QJsonObject obj = record.extra;
    if (!record.last_updated_raw.isUndefined()) {
        obj.insert(kLastUpdatedDate, record.last_updated_raw);
    }
    QJsonArray suggestions;
    for (const auto& suggestion : record.suggestions) {
        QJsonObject s = suggestion.extra;
        s.insert(kOldValue, suggestion.old_value);
        s.insert(kNewValue, suggestion.new_value);
        suggestions.append(s);
    }
    obj.insert(kSuggestions, suggestions);
    return obj;
}

std::vector<Suggestion> union_suggestions(const std::vector<Suggestion>& first,
                                          const std::vector<Suggestion>& second) {
    std::vector<Suggestion> out;
    std::set<std::pair<QString, QString>> seen;
    for (const auto* side : {&first, &second}) {
        for (const auto& suggestion : *side) {
            if (seen.emplace(suggestion.old_value, suggestion.new_value).second) {
                out.push_back(suggestion);
            }
        }
    }
    return out;
}

} // namespace

qint64 parse_last_updated(const QJsonValue& value) {
    if (value.isDouble()) {
        return json_integer(value).value_or(0);
    }
    if (value.isString()) {
        const auto parsed = QDateTime::fromString(value.toString(), Qt::ISODateWithMs);
        if (parsed.isValid()) {
            return parsed.toMSecsSinceEpoch();
        }
    }
    return 0;
}

Result<SuggestionStore> parse_suggestion_store(const QString& text) {
    using R = Result<SuggestionStore>;
    if (text.trimmed().isEmpty()) {
        return R::ok(SuggestionStore{});
    }

    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(text.toUtf8(), &err);
    if (err.error != QJsonParseError::NoError) {
        return R::err(parse_error("suggestion store is not valid JSON: " + err.errorString().toStdString()));
    }
    if (!doc.isObject()) {
        return R::err(parse_error("suggestion store is not a JSON object"));
    }

    SuggestionStore store;
    const auto root = doc.object();
    for (auto it = root.begin(); it != root.end(); ++it) {
        auto record = parse_record(it.key(), it.value());
        if (record.is_err()) {
            return R::err(record.unwrap_err());
        }
        store.emplace(it.key(), std::move(record).unwrap());
    }
    return R::ok(std::move(store));
}

QString serialize_suggestion_store(const SuggestionStore& store) {
    QJsonObject root;
    for (const auto& [key, record] : store) {
        root.insert(key, record_to_json(record));
    }
    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Indented));
}

SuggestionStore merge_suggestion_stores(const SuggestionStore& ours, const SuggestionStore& theirs) {
    SuggestionStore merged = ours;
    for (const auto& [key, their_record] : theirs) {
        auto it = merged.find(key);
        if (it == merged.end()) {
            merged.emplace(key, their_record);
            continue;
        }

        const auto our_suggestions = it->second.suggestions;
        if (their_record.last_updated > it->second.last_updated) {
            it->second = their_record;
        }
        it->second.suggestions = union_suggestions(our_suggestions, their_record.suggestions);
    }
    return merged;
}

QString resolve_suggestion_store(const QString& ours, const QString& theirs) {
    auto our_store = parse_suggestion_store(ours);
    auto their_store = parse_suggestion_store(theirs);
    if (our_store.is_err() || their_store.is_err()) {
        const auto& error = our_store.is_err() ? our_store.unwrap_err() : their_store.unwrap_err();
        qCWarning(quireMergeLog) << "suggestion store unreadable, resetting to an empty store:"
                                 << QString::fromStdString(error.message);
        return QStringLiteral("{}");
    }
    return serialize_suggestion_store(merge_suggestion_stores(our_store.unwrap(), their_store.unwrap()));
}

} // namespace quire::merge
