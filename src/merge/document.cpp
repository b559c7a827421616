#include "merge/document.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

namespace quire::merge {
namespace {

const QString kId = QStringLiteral("id");
const QString kType = QStringLiteral("type");
const QString kLabel = QStringLiteral("cellLabel");
const QString kEdits = QStringLiteral("edits");
const QString kData = QStringLiteral("data");
const QString kValue = QStringLiteral("value");
const QString kMetadata = QStringLiteral("metadata");
const QString kCells = QStringLiteral("cells");

bool is_metadata_path(const QStringList& path) {
    return path.size() >= 2 && path[0] == kMetadata;
}

} // namespace

Result<Cell> parse_cell(const QJsonValue& json) {
    if (!json.isObject()) {
        return Result<Cell>::err(parse_error("cell is not an object"));
    }
    const auto obj = json.toObject();

    Cell cell;
    const auto value = obj.value(kValue);
    if (value.isString()) {
        cell.value = value.toString();
    } else if (!value.isUndefined() && !value.isNull()) {
        return Result<Cell>::err(parse_error("cell value is not text"));
    }

    const auto metadata = obj.value(kMetadata);
    if (!metadata.isUndefined() && !metadata.isNull() && !metadata.isObject()) {
        return Result<Cell>::err(parse_error("cell metadata is not an object"));
    }
    const auto meta = metadata.toObject();

    const auto id = meta.value(kId);
    if (id.isString()) {
        cell.id = id.toString();
    } else if (!id.isUndefined() && !id.isNull()) {
        return Result<Cell>::err(parse_error("cell id is not a string"));
    }
    cell.kind = meta.value(kType).toString();
    if (meta.value(kLabel).isString()) {
        cell.label = meta.value(kLabel).toString();
    }

    auto edits = parse_edit_list(meta.value(kEdits));
    if (edits.is_err()) {
        auto error = edits.unwrap_err();
        error.message = "cell " + cell.id.toStdString() + ": " + error.message;
        return Result<Cell>::err(std::move(error));
    }
    cell.edits = std::move(edits).unwrap();

    for (auto it = meta.begin(); it != meta.end(); ++it) {
        if (it.key() == kId || it.key() == kType || it.key() == kEdits) continue;
        if (it.key() == kLabel && cell.label) continue;
        cell.metadata_extra.insert(it.key(), it.value());
    }
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (it.key() == kValue || it.key() == kMetadata) continue;
        cell.extra.insert(it.key(), it.value());
    }
    return Result<Cell>::ok(std::move(cell));
}

QJsonObject cell_to_json(const Cell& cell) {
    QJsonObject meta = cell.metadata_extra;
    if (cell.has_id()) {
        meta.insert(kId, cell.id);
    }
    if (!cell.kind.isEmpty()) {
        meta.insert(kType, cell.kind);
    }
    if (cell.label) {
        meta.insert(kLabel, *cell.label);
    }
    meta.insert(kEdits, edit_list_to_json(cell.edits));

    QJsonObject obj = cell.extra;
    obj.insert(kValue, cell.value);
    obj.insert(kMetadata, meta);
    return obj;
}

Result<Document> parse_document(const QString& text) {
    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(text.toUtf8(), &err);
    if (err.error != QJsonParseError::NoError) {
        return Result<Document>::err(parse_error("document is not valid JSON: " +
                                                 err.errorString().toStdString()));
    }
    if (!doc.isObject()) {
        return Result<Document>::err(parse_error("document is not a JSON object"));
    }

    const auto root = doc.object();
    const auto cells = root.value(kCells);
    if (!cells.isArray()) {
        return Result<Document>::err(parse_error("document has no cells array"));
    }

    Document out;
    const auto array = cells.toArray();
    out.cells.reserve(static_cast<size_t>(array.size()));
    for (const auto& item : array) {
        auto cell = parse_cell(item);
        if (cell.is_err()) {
            return Result<Document>::err(cell.unwrap_err());
        }
        out.cells.push_back(std::move(cell).unwrap());
    }

    const auto metadata = root.value(kMetadata);
    if (metadata.isObject()) {
        out.metadata = metadata.toObject();
    } else if (!metadata.isUndefined() && !metadata.isNull()) {
        return Result<Document>::err(parse_error("document metadata is not an object"));
    }

    for (auto it = root.begin(); it != root.end(); ++it) {
        if (it.key() == kCells || it.key() == kMetadata) continue;
        out.extra.insert(it.key(), it.value());
    }
    return Result<Document>::ok(std::move(out));
}

QString serialize_document(const Document& document) {
    QJsonArray cells;
    for (const auto& cell : document.cells) {
        cells.append(cell_to_json(cell));
    }

    QJsonObject root = document.extra;
    root.insert(kCells, cells);
    root.insert(kMetadata, document.metadata);
    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Indented));
}

QJsonValue cell_field(const Cell& cell, const QStringList& path) {
    if (path.size() == 1 && path[0] == kValue) {
        return cell.value;
    }
    if (!is_metadata_path(path)) {
        return QJsonValue(QJsonValue::Undefined);
    }
    if (path.size() == 2) {
        if (path[1] == kLabel) {
            return cell.label ? QJsonValue(*cell.label) : QJsonValue(QJsonValue::Undefined);
        }
        if (path[1] == kType) return cell.kind;
        if (path[1] == kId || path[1] == kEdits) return QJsonValue(QJsonValue::Undefined);
        return cell.metadata_extra.value(path[1]);
    }
    if (path.size() == 3 && path[1] == kData) {
        return cell.metadata_extra.value(kData).toObject().value(path[2]);
    }
    return QJsonValue(QJsonValue::Undefined);
}

bool set_cell_field(Cell& cell, const QStringList& path, const QJsonValue& value) {
    if (path.size() == 1 && path[0] == kValue) {
        cell.value = value.toString();
        return true;
    }
    if (!is_metadata_path(path)) {
        return false;
    }
    if (path.size() == 2) {
        if (path[1] == kLabel) {
            if (value.isUndefined() || value.isNull()) {
                cell.label.reset();
            } else {
                cell.label = value.toString();
            }
            return true;
        }
        if (path[1] == kType) {
            cell.kind = value.toString();
            return true;
        }
        if (path[1] == kId || path[1] == kEdits) return false;
        if (value.isUndefined()) {
            cell.metadata_extra.remove(path[1]);
        } else {
            cell.metadata_extra.insert(path[1], value);
        }
        return true;
    }
    if (path.size() == 3 && path[1] == kData) {
        auto data = cell.metadata_extra.value(kData).toObject();
        if (value.isUndefined()) {
            data.remove(path[2]);
        } else {
            data.insert(path[2], value);
        }
        cell.metadata_extra.insert(kData, data);
        return true;
    }
    return false;
}

} // namespace quire::merge
