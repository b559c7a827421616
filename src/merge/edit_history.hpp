#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QStringList>
#include <QtGlobal>

#include <optional>
#include <vector>

#include "core/result.hpp"

namespace quire::merge {

enum class EditKind {
    UserEdit,
    Generated,
    Validation,
    InitialImport,
    Migration
};

[[nodiscard]] QString edit_kind_name(EditKind kind);
[[nodiscard]] std::optional<EditKind> parse_edit_kind(const QString& name);

struct ValidationEntry {
    QString username;
    qint64 creation_timestamp = 0;
    qint64 updated_timestamp = 0;
    bool is_deleted = false;

    bool operator==(const ValidationEntry&) const = default;
};

/**
 * Edit - one timestamped change event on a field of a cell.
 *
 * `target_path` names the field (e.g. {"value"} or {"metadata", "cellLabel"});
 * an empty path is a legacy value edit. Fields the engine does not model are
 * kept in `extra` and written back unchanged.
 */
struct Edit {
    QJsonValue value;
    qint64 timestamp = 0;
    QStringList target_path;
    EditKind kind = EditKind::UserEdit;
    std::optional<QString> author;
    std::vector<ValidationEntry> validated_by;
    QJsonObject extra;
};

using EditList = std::vector<Edit>;

// Empty paths resolve to {"value"}.
[[nodiscard]] QStringList effective_target_path(const Edit& edit);
[[nodiscard]] QString target_path_key(const QStringList& path);

[[nodiscard]] Result<Edit> parse_edit(const QJsonValue& json);
[[nodiscard]] QJsonObject edit_to_json(const Edit& edit);

// A missing or null list parses as empty.
[[nodiscard]] Result<EditList> parse_edit_list(const QJsonValue& json);
[[nodiscard]] QJsonArray edit_list_to_json(const EditList& edits);

[[nodiscard]] Result<std::vector<ValidationEntry>> parse_validations(const QJsonValue& json,
                                                                     qint64 legacy_timestamp);
[[nodiscard]] QJsonArray validations_to_json(const std::vector<ValidationEntry>& entries);

/**
 * Per-username union of two validation lists. On collision the entry with the
 * greater updated_timestamp wins and keeps the earlier creation_timestamp.
 * Output is ordered by username.
 */
[[nodiscard]] std::vector<ValidationEntry> merge_validations(const std::vector<ValidationEntry>& existing,
                                                             const std::vector<ValidationEntry>& incoming);

/**
 * Concatenates both histories, drops exact (timestamp, value) repeats keeping
 * the first seen (its validatedBy absorbs the repeat's), and sorts ascending by
 * timestamp. Equal timestamps keep `a` before `b`.
 */
[[nodiscard]] EditList merge_edit_histories(const EditList& a, const EditList& b);

/**
 * Picks the value a field should carry after a merge.
 *
 * - If `our_edits` is empty and `their_edits` is not, the field has no local
 *   history yet: returns `their_current`.
 * - Otherwise takes the last entry of `merged`, finds the latest edit on each
 *   side carrying that same value, and returns the value of whichever of those
 *   two is later (ours on a tie).
 * - With no such edit on either side, returns `our_fallback` (which may be an
 *   intentionally empty string).
 */
[[nodiscard]] QJsonValue select_winning_value(const EditList& our_edits,
                                              const EditList& their_edits,
                                              const EditList& merged,
                                              const QJsonValue& our_fallback,
                                              const QJsonValue& their_current);

} // namespace quire::merge
