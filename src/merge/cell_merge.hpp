#pragma once

#include <QJsonObject>
#include <QString>

#include "core/result.hpp"
#include "merge/document.hpp"

namespace quire::merge {

/**
 * Merges two revisions of the same cell: histories are reconciled and every
 * field touched by an edit takes the winning value of its own history.
 * Structure (kind, extra fields) follows `ours`.
 */
[[nodiscard]] Cell merge_matched_cells(const Cell& ours, const Cell& theirs);

/**
 * Structured-cell merge of two parsed documents.
 *
 * Cells present on both sides are merged in `ours` order; cells only in
 * `theirs` are spliced next to their original neighbours. Cells in `theirs`
 * without an id are dropped (logged). Document metadata is taken from `ours`.
 */
[[nodiscard]] Document merge_documents(const Document& ours, const Document& theirs);

// Text entry point. Parse failures propagate as ParseError.
[[nodiscard]] Result<QString> resolve_structured_cells(const QString& ours, const QString& theirs);

// Attachment maps keyed by attachment id; later `updatedAt` wins, ties keep ours.
[[nodiscard]] QJsonObject merge_attachments(const QJsonObject& ours, const QJsonObject& theirs);

} // namespace quire::merge
