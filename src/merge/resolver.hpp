#pragma once

#include <QString>

#include <vector>

#include "core/result.hpp"
#include "merge/strategy.hpp"

namespace quire::merge {

// The three revisions of one file as text.
struct MergeInput {
    QString base;
    QString ours;
    QString theirs;
};

// Resolved text plus what the user should hear about it: keys taken from
// `theirs` over a local change (MergeConflict), or an unreadable side that
// was replaced by a fallback (ParseError).
struct ResolvedContent {
    QString text;
    std::vector<Error> warnings;
};

// Runs the resolver named by `tag`. Pure; only ParseError is ever returned.
[[nodiscard]] Result<ResolvedContent> resolve_content(ResolverTag tag, const MergeInput& input);

} // namespace quire::merge
