#include "merge/json_merge.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

#include <algorithm>
#include <optional>
#include <set>
#include <tuple>

#include "merge/log.hpp"

namespace quire::merge {
namespace {

constexpr int kMetadataDepth = 5;
const QString kEdits = QStringLiteral("edits");

std::optional<QJsonObject> parse_object(const QString& text, bool blank_is_empty) {
    if (blank_is_empty && text.trimmed().isEmpty()) {
        return QJsonObject{};
    }
    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(text.toUtf8(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::nullopt;
    }
    return doc.object();
}

QString to_text(const QJsonObject& obj) {
    return QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Indented));
}

QString compact(const QJsonValue& value) {
    if (value.isObject()) {
        return QString::fromUtf8(QJsonDocument(value.toObject()).toJson(QJsonDocument::Compact));
    }
    if (value.isArray()) {
        return QString::fromUtf8(QJsonDocument(value.toArray()).toJson(QJsonDocument::Compact));
    }
    // Scalars: wrap so QJsonDocument can render them.
    QJsonArray wrapper{value};
    return QString::fromUtf8(QJsonDocument(wrapper).toJson(QJsonDocument::Compact));
}

QJsonArray union_edits(const QJsonArray& ours, const QJsonArray& theirs) {
    std::vector<QJsonValue> out;
    std::set<std::tuple<double, QString, QString>> seen;
    for (const auto* side : {&ours, &theirs}) {
        for (const auto& edit : *side) {
            const auto obj = edit.toObject();
            const auto key = std::make_tuple(obj.value(QStringLiteral("timestamp")).toDouble(),
                                             compact(obj.value(QStringLiteral("editMap"))),
                                             compact(obj.value(QStringLiteral("value"))));
            if (seen.insert(key).second) {
                out.push_back(edit);
            }
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const QJsonValue& a, const QJsonValue& b) {
        return a.toObject().value(QStringLiteral("timestamp")).toDouble() <
               b.toObject().value(QStringLiteral("timestamp")).toDouble();
    });

    QJsonArray merged;
    for (const auto& edit : out) {
        merged.append(edit);
    }
    return merged;
}

} // namespace

QJsonObject three_way_merge_objects(const QJsonObject& base,
                                    const QJsonObject& ours,
                                    const QJsonObject& theirs,
                                    int max_depth) {
    QJsonObject merged = ours;
    for (auto it = theirs.begin(); it != theirs.end(); ++it) {
        const auto& key = it.key();
        const auto our_value = ours.value(key);
        const auto base_value = base.value(key);
        const auto& their_value = it.value();

        if (max_depth > 1 && our_value.isObject() && their_value.isObject()) {
            merged.insert(key, three_way_merge_objects(base_value.toObject(), our_value.toObject(),
                                                       their_value.toObject(), max_depth - 1));
            continue;
        }
        if (our_value == base_value) {
            merged.insert(key, their_value);
        }
    }
    return merged;
}

JsonMergeResult merge_project_metadata(const QString& base, const QString& ours, const QString& theirs) {
    const auto our_obj = parse_object(ours, false);
    const auto their_obj = parse_object(theirs, false);
    if (!our_obj || !their_obj) {
        qCWarning(quireMergeLog) << "project metadata unreadable, keeping ours";
        return JsonMergeResult{JsonMergeResult::Kind::Unreadable, ours, {}};
    }
    const auto base_obj = parse_object(base, true).value_or(QJsonObject{});

    auto merged = three_way_merge_objects(base_obj, *our_obj, *their_obj, kMetadataDepth);
    if (our_obj->value(kEdits).isArray() || their_obj->value(kEdits).isArray()) {
        merged.insert(kEdits, union_edits(our_obj->value(kEdits).toArray(), their_obj->value(kEdits).toArray()));
    }
    return JsonMergeResult{JsonMergeResult::Kind::Clean, to_text(merged), {}};
}

JsonMergeResult merge_settings(const QString& base, const QString& ours, const QString& theirs) {
    const auto base_obj = parse_object(base, true);
    const auto their_obj = parse_object(theirs, false);
    if (!base_obj || !their_obj) {
        qCWarning(quireMergeLog) << "settings base or incoming side unreadable, keeping ours";
        return JsonMergeResult{JsonMergeResult::Kind::Unreadable, ours, {}};
    }
    const auto our_obj = parse_object(ours, false).value_or(QJsonObject{});

    if (our_obj == *their_obj || *their_obj == *base_obj) {
        return JsonMergeResult{JsonMergeResult::Kind::Clean, to_text(our_obj), {}};
    }
    if (our_obj == *base_obj) {
        return JsonMergeResult{JsonMergeResult::Kind::Clean, to_text(*their_obj), {}};
    }

    std::set<QString> keys;
    for (const auto* obj : {&*base_obj, &our_obj, &*their_obj}) {
        for (auto it = obj->begin(); it != obj->end(); ++it) {
            keys.insert(it.key());
        }
    }

    JsonMergeResult result;
    QJsonObject merged;
    for (const auto& key : keys) {
        const bool in_base = base_obj->contains(key);
        const bool in_ours = our_obj.contains(key);
        const bool in_theirs = their_obj->contains(key);
        const auto b = base_obj->value(key);
        const auto o = our_obj.value(key);
        const auto t = their_obj->value(key);

        if (in_base && (!in_ours || !in_theirs)) {
            continue;
        }
        if (!in_ours) {
            merged.insert(key, t);
        } else if (!in_theirs || o == t || t == b) {
            merged.insert(key, o);
        } else if (o == b) {
            merged.insert(key, t);
        } else {
            merged.insert(key, t);
            result.conflicted_keys.append(key);
        }
    }

    if (!result.conflicted_keys.isEmpty()) {
        result.kind = JsonMergeResult::Kind::Conflict;
        qCWarning(quireMergeLog) << "settings changed on both sides, taking incoming values for"
                                 << result.conflicted_keys;
    }
    result.merged = to_text(merged);
    return result;
}

} // namespace quire::merge
