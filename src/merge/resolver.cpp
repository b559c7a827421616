#include "merge/resolver.hpp"

#include "merge/cell_merge.hpp"
#include "merge/comment_threads.hpp"
#include "merge/json_merge.hpp"
#include "merge/line_merge.hpp"
#include "merge/suggestions.hpp"

namespace quire::merge {
namespace {

ResolvedContent from_json_merge(const JsonMergeResult& result) {
    ResolvedContent out{result.merged, {}};
    if (result.clean()) {
        return out;
    }
    if (result.kind == JsonMergeResult::Kind::Unreadable) {
        out.warnings.push_back(parse_error("unreadable JSON, kept the local version"));
    } else {
        out.warnings.push_back(Error("changed on both sides, took incoming values for: " +
                                         result.conflicted_keys.join(QStringLiteral(", ")).toStdString(),
                                     ErrorCode::MergeConflict));
    }
    return out;
}

Result<ResolvedContent> text_only(Result<QString> text) {
    if (text.is_err()) {
        return Result<ResolvedContent>::err(text.unwrap_err());
    }
    return Result<ResolvedContent>::ok(ResolvedContent{std::move(text).unwrap(), {}});
}

} // namespace

Result<ResolvedContent> resolve_content(ResolverTag tag, const MergeInput& input) {
    using R = Result<ResolvedContent>;
    switch (tag) {
        case ResolverTag::KeepOurs:
            return R::ok(ResolvedContent{resolve_keep_ours(input.ours, input.theirs), {}});
        case ResolverTag::SetUnion:
            return R::ok(ResolvedContent{resolve_line_set_union(input.ours, input.theirs), {}});
        case ResolverTag::IdKeyedArrayMerge:
            return text_only(resolve_comment_threads(input.ours, input.theirs));
        case ResolverTag::TimestampKeyedRecordMerge:
            return R::ok(ResolvedContent{resolve_suggestion_store(input.ours, input.theirs), {}});
        case ResolverTag::StructuredCellMerge:
            return text_only(resolve_structured_cells(input.ours, input.theirs));
        case ResolverTag::ProjectMetadataMerge:
            return R::ok(from_json_merge(merge_project_metadata(input.base, input.ours, input.theirs)));
        case ResolverTag::SettingsThreeWayMerge:
            return R::ok(from_json_merge(merge_settings(input.base, input.ours, input.theirs)));
    }
    return R::ok(ResolvedContent{input.ours, {}});
}

} // namespace quire::merge
