#pragma once

#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

#include "core/result.hpp"
#include "merge/edit_history.hpp"

namespace quire::merge {

/**
 * Cell - one addressable unit of a structured document.
 *
 * Modelled metadata keys (id, type, cellLabel, edits) live in the typed
 * fields; every other metadata key is kept in `metadata_extra`, every other
 * cell-level key in `extra`.
 */
struct Cell {
    QString id;
    QString value;
    QString kind;
    std::optional<QString> label;
    EditList edits;
    QJsonObject metadata_extra;
    QJsonObject extra;

    [[nodiscard]] bool has_id() const { return !id.isEmpty(); }
};

struct Document {
    std::vector<Cell> cells;
    QJsonObject metadata;
    QJsonObject extra;
};

[[nodiscard]] Result<Cell> parse_cell(const QJsonValue& json);
[[nodiscard]] QJsonObject cell_to_json(const Cell& cell);

[[nodiscard]] Result<Document> parse_document(const QString& text);
[[nodiscard]] QString serialize_document(const Document& document);

// Field access addressed by an edit's target path. Paths outside
// value / metadata.<field> / metadata.data.<field> are not addressable.
[[nodiscard]] QJsonValue cell_field(const Cell& cell, const QStringList& path);
[[nodiscard]] bool set_cell_field(Cell& cell, const QStringList& path, const QJsonValue& value);

} // namespace quire::merge
