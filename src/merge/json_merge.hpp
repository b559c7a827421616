#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>

namespace quire::merge {

struct JsonMergeResult {
    enum class Kind {
        Clean,
        // Both sides changed at least one key differently; `theirs` was taken there.
        Conflict,
        // An input could not be parsed; `merged` is a fallback side verbatim.
        Unreadable
    };

    Kind kind{Kind::Clean};
    QString merged;
    QStringList conflicted_keys;

    [[nodiscard]] bool clean() const { return kind == Kind::Clean; }
};

// Object-level three-way merge behind merge_project_metadata. Nested objects
// are merged recursively up to `max_depth`; below that they are leaves.
[[nodiscard]] QJsonObject three_way_merge_objects(const QJsonObject& base,
                                                  const QJsonObject& ours,
                                                  const QJsonObject& theirs,
                                                  int max_depth);

/**
 * Project metadata (`metadata.json`): a value takes `theirs` only where `ours`
 * still equals `base`. The top-level `edits` arrays of both sides are unioned
 * by (timestamp, editMap, value) and sorted by timestamp. Unreadable input
 * keeps `ours`.
 */
[[nodiscard]] JsonMergeResult merge_project_metadata(const QString& base,
                                                     const QString& ours,
                                                     const QString& theirs);

/**
 * Editor settings: whole-file fast paths when only one side changed, else a
 * key-level merge where additions are kept, deletions win and a key changed on
 * both sides takes `theirs`. Unreadable `ours` merges from an empty object;
 * unreadable `base` or `theirs` keeps `ours`.
 */
[[nodiscard]] JsonMergeResult merge_settings(const QString& base,
                                             const QString& ours,
                                             const QString& theirs);

} // namespace quire::merge
