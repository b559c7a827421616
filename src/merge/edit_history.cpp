#include "merge/edit_history.hpp"

#include <algorithm>
#include <map>

#include "merge/json_number.hpp"

namespace quire::merge {
namespace {

const QStringList kModelledEditKeys = {
    QStringLiteral("value"),
    QStringLiteral("cellValue"),
    QStringLiteral("timestamp"),
    QStringLiteral("editMap"),
    QStringLiteral("type"),
    QStringLiteral("author"),
    QStringLiteral("validatedBy"),
};

const Edit* latest_with_value(const EditList& edits, const QJsonValue& value) {
    const Edit* best = nullptr;
    for (const auto& edit : edits) {
        if (edit.value != value) continue;
        if (!best || edit.timestamp >= best->timestamp) {
            best = &edit;
        }
    }
    return best;
}

} // namespace

QString edit_kind_name(EditKind kind) {
    switch (kind) {
        case EditKind::UserEdit: return QStringLiteral("user-edit");
        case EditKind::Generated: return QStringLiteral("llm-generation");
        case EditKind::Validation: return QStringLiteral("validation");
        case EditKind::InitialImport: return QStringLiteral("initial-import");
        case EditKind::Migration: return QStringLiteral("migration");
    }
    return QStringLiteral("user-edit");
}

std::optional<EditKind> parse_edit_kind(const QString& name) {
    if (name == QStringLiteral("user-edit")) return EditKind::UserEdit;
    if (name == QStringLiteral("llm-generation") || name == QStringLiteral("generated")) {
        return EditKind::Generated;
    }
    if (name == QStringLiteral("validation")) return EditKind::Validation;
    if (name == QStringLiteral("initial-import")) return EditKind::InitialImport;
    if (name == QStringLiteral("migration")) return EditKind::Migration;
    return std::nullopt;
}

QStringList effective_target_path(const Edit& edit) {
    if (edit.target_path.isEmpty()) {
        return QStringList{QStringLiteral("value")};
    }
    return edit.target_path;
}

QString target_path_key(const QStringList& path) {
    return path.join(QLatin1Char('.'));
}

Result<std::vector<ValidationEntry>> parse_validations(const QJsonValue& json, qint64 legacy_timestamp) {
    using R = Result<std::vector<ValidationEntry>>;
    std::vector<ValidationEntry> out;
    if (json.isUndefined() || json.isNull()) {
        return R::ok(std::move(out));
    }
    if (!json.isArray()) {
        return R::err(parse_error("validatedBy is not an array"));
    }

    for (const auto& item : json.toArray()) {
        if (item.isString()) {
            // Legacy entries are bare usernames.
            out.push_back(ValidationEntry{item.toString(), legacy_timestamp, legacy_timestamp, false});
            continue;
        }
        if (!item.isObject()) {
            return R::err(parse_error("validatedBy entry is neither an object nor a username"));
        }
        const auto obj = item.toObject();
        const auto username = obj.value(QStringLiteral("username"));
        const auto created = json_integer(obj.value(QStringLiteral("creationTimestamp")));
        const auto updated = json_integer(obj.value(QStringLiteral("updatedTimestamp")));
        if (!username.isString() || !created || !updated) {
            return R::err(parse_error("validatedBy entry is missing username or timestamps"));
        }
        out.push_back(ValidationEntry{
            username.toString(),
            *created,
            *updated,
            obj.value(QStringLiteral("isDeleted")).toBool(false),
        });
    }
    return R::ok(std::move(out));
}

QJsonArray validations_to_json(const std::vector<ValidationEntry>& entries) {
    QJsonArray out;
    for (const auto& entry : entries) {
        QJsonObject obj;
        obj.insert(QStringLiteral("username"), entry.username);
        obj.insert(QStringLiteral("creationTimestamp"), entry.creation_timestamp);
        obj.insert(QStringLiteral("updatedTimestamp"), entry.updated_timestamp);
        obj.insert(QStringLiteral("isDeleted"), entry.is_deleted);
        out.append(obj);
    }
    return out;
}

Result<Edit> parse_edit(const QJsonValue& json) {
    if (!json.isObject()) {
        return Result<Edit>::err(parse_error("edit is not an object"));
    }
    const auto obj = json.toObject();

    Edit edit;
    const auto timestamp = json_integer(obj.value(QStringLiteral("timestamp")));
    if (!timestamp) {
        return Result<Edit>::err(parse_error("edit has no integer timestamp"));
    }
    edit.timestamp = *timestamp;

    const auto editMap = obj.value(QStringLiteral("editMap"));
    if (obj.contains(QStringLiteral("value"))) {
        edit.value = obj.value(QStringLiteral("value"));
    } else if (obj.contains(QStringLiteral("cellValue")) && editMap.isUndefined()) {
        // Pre-editMap histories stored the cell text directly.
        edit.value = obj.value(QStringLiteral("cellValue"));
        edit.target_path = QStringList{QStringLiteral("value")};
    } else {
        return Result<Edit>::err(parse_error("edit has no value"));
    }

    if (editMap.isArray()) {
        for (const auto& segment : editMap.toArray()) {
            if (!segment.isString()) {
                return Result<Edit>::err(parse_error("editMap contains a non-string segment"));
            }
            edit.target_path.append(segment.toString());
        }
    } else if (!editMap.isUndefined() && !editMap.isNull()) {
        return Result<Edit>::err(parse_error("editMap is not an array"));
    }

    const auto type = obj.value(QStringLiteral("type"));
    if (type.isString()) {
        const auto kind = parse_edit_kind(type.toString());
        if (!kind) {
            return Result<Edit>::err(parse_error("unknown edit type: " + type.toString().toStdString()));
        }
        edit.kind = *kind;
    } else if (!type.isUndefined()) {
        return Result<Edit>::err(parse_error("edit type is not a string"));
    }

    auto validations = parse_validations(obj.value(QStringLiteral("validatedBy")), edit.timestamp);
    if (validations.is_err()) {
        return Result<Edit>::err(validations.unwrap_err());
    }
    edit.validated_by = std::move(validations).unwrap();

    const auto author = obj.value(QStringLiteral("author"));
    if (author.isString()) {
        edit.author = author.toString();
    }

    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (kModelledEditKeys.contains(it.key())) continue;
        edit.extra.insert(it.key(), it.value());
    }
    if (author.isObject() || author.isArray()) {
        edit.extra.insert(QStringLiteral("author"), author);
    }
    return Result<Edit>::ok(std::move(edit));
}

QJsonObject edit_to_json(const Edit& edit) {
    QJsonObject obj = edit.extra;
    obj.insert(QStringLiteral("value"), edit.value);
    obj.insert(QStringLiteral("timestamp"), edit.timestamp);
    obj.insert(QStringLiteral("editMap"), QJsonArray::fromStringList(edit.target_path));
    obj.insert(QStringLiteral("type"), edit_kind_name(edit.kind));
    if (edit.author) {
        obj.insert(QStringLiteral("author"), *edit.author);
    }
    if (!edit.validated_by.empty()) {
        obj.insert(QStringLiteral("validatedBy"), validations_to_json(edit.validated_by));
    }
    return obj;
}

Result<EditList> parse_edit_list(const QJsonValue& json) {
    EditList out;
    if (json.isUndefined() || json.isNull()) {
        return Result<EditList>::ok(std::move(out));
    }
    if (!json.isArray()) {
        return Result<EditList>::err(parse_error("edits is not an array"));
    }
    const auto array = json.toArray();
    out.reserve(static_cast<size_t>(array.size()));
    for (const auto& item : array) {
        auto edit = parse_edit(item);
        if (edit.is_err()) {
            return Result<EditList>::err(edit.unwrap_err());
        }
        out.push_back(std::move(edit).unwrap());
    }
    return Result<EditList>::ok(std::move(out));
}

QJsonArray edit_list_to_json(const EditList& edits) {
    QJsonArray out;
    for (const auto& edit : edits) {
        out.append(edit_to_json(edit));
    }
    return out;
}

std::vector<ValidationEntry> merge_validations(const std::vector<ValidationEntry>& existing,
                                               const std::vector<ValidationEntry>& incoming) {
    std::map<QString, ValidationEntry> by_user;
    const auto consider = [&](const ValidationEntry& entry) {
        auto [it, inserted] = by_user.emplace(entry.username, entry);
        if (inserted) return;
        if (entry.updated_timestamp > it->second.updated_timestamp) {
            const auto created = std::min(it->second.creation_timestamp, entry.creation_timestamp);
            it->second = entry;
            it->second.creation_timestamp = created;
        }
    };
    for (const auto& entry : existing) consider(entry);
    for (const auto& entry : incoming) consider(entry);

    std::vector<ValidationEntry> out;
    out.reserve(by_user.size());
    for (auto& [username, entry] : by_user) {
        out.push_back(std::move(entry));
    }
    return out;
}

EditList merge_edit_histories(const EditList& a, const EditList& b) {
    EditList out;
    out.reserve(a.size() + b.size());
    std::multimap<qint64, size_t> by_timestamp;

    const auto absorb = [&](const Edit& edit) {
        const auto [first, last] = by_timestamp.equal_range(edit.timestamp);
        for (auto it = first; it != last; ++it) {
            auto& kept = out[it->second];
            if (kept.value == edit.value && effective_target_path(kept) == effective_target_path(edit)) {
                if (!edit.validated_by.empty()) {
                    kept.validated_by = merge_validations(kept.validated_by, edit.validated_by);
                }
                return;
            }
        }
        by_timestamp.emplace(edit.timestamp, out.size());
        out.push_back(edit);
    };

    for (const auto& edit : a) absorb(edit);
    for (const auto& edit : b) absorb(edit);

    std::stable_sort(out.begin(), out.end(), [](const Edit& lhs, const Edit& rhs) {
        return lhs.timestamp < rhs.timestamp;
    });
    return out;
}

QJsonValue select_winning_value(const EditList& our_edits,
                                const EditList& their_edits,
                                const EditList& merged,
                                const QJsonValue& our_fallback,
                                const QJsonValue& their_current) {
    if (our_edits.empty() && !their_edits.empty()) {
        return their_current;
    }
    if (merged.empty()) {
        return our_fallback;
    }

    const auto& latest = merged.back();
    const Edit* ours = latest_with_value(our_edits, latest.value);
    const Edit* theirs = latest_with_value(their_edits, latest.value);

    const Edit* chosen = ours;
    if (theirs && (!ours || theirs->timestamp > ours->timestamp)) {
        chosen = theirs;
    }
    return chosen ? chosen->value : our_fallback;
}

} // namespace quire::merge
