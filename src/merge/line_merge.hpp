#pragma once

#include <QString>

namespace quire::merge {

// Returns `ours` unchanged.
[[nodiscard]] QString resolve_keep_ours(const QString& ours, const QString& theirs);

/**
 * Line-set union. Both sides are split on '\n', empty lines dropped, and the
 * distinct lines joined back with '\n'. Line order is not meaningful; lines
 * appear in first-seen order, `ours` first.
 */
[[nodiscard]] QString resolve_line_set_union(const QString& ours, const QString& theirs);

} // namespace quire::merge
