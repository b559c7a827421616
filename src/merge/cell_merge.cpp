#include "merge/cell_merge.hpp"

#include <map>
#include <optional>
#include <set>

#include "core/anchored_list_merge.hpp"
#include "merge/json_number.hpp"
#include "merge/log.hpp"

namespace quire::merge {
namespace {

const QString kAttachments = QStringLiteral("attachments");
const QString kSelectedAudioId = QStringLiteral("selectedAudioId");
const QString kSelectionTimestamp = QStringLiteral("selectionTimestamp");
const QString kUpdatedAt = QStringLiteral("updatedAt");
const QString kValidatedBy = QStringLiteral("validatedBy");

EditList edits_for_path(const EditList& edits, const QStringList& path) {
    EditList out;
    for (const auto& edit : edits) {
        if (effective_target_path(edit) == path) {
            out.push_back(edit);
        }
    }
    return out;
}

std::vector<QStringList> touched_paths(const EditList& edits) {
    std::vector<QStringList> paths{QStringList{QStringLiteral("value")}};
    std::set<QString> seen{QStringLiteral("value")};
    for (const auto& edit : edits) {
        const auto path = effective_target_path(edit);
        if (seen.insert(target_path_key(path)).second) {
            paths.push_back(path);
        }
    }
    return paths;
}

qint64 number_or_zero(const QJsonValue& value) {
    return json_integer(value).value_or(0);
}

bool is_selectable_audio(const QJsonObject& attachments, const QString& id) {
    if (id.isEmpty() || !attachments.contains(id)) return false;
    const auto attachment = attachments.value(id).toObject();
    return attachment.value(QStringLiteral("type")).toString() == QStringLiteral("audio") &&
           !attachment.value(QStringLiteral("isDeleted")).toBool(false);
}

void resolve_audio_selection(Cell& merged, const Cell& ours, const Cell& theirs) {
    const auto attachments = merged.metadata_extra.value(kAttachments).toObject();
    const auto our_id = ours.metadata_extra.value(kSelectedAudioId).toString();
    const auto their_id = theirs.metadata_extra.value(kSelectedAudioId).toString();
    if (our_id.isEmpty() && their_id.isEmpty()) return;

    const auto our_ts = ours.metadata_extra.value(kSelectionTimestamp);
    const auto their_ts = theirs.metadata_extra.value(kSelectionTimestamp);
    const bool theirs_newer = !their_id.isEmpty() &&
                              (our_id.isEmpty() || number_or_zero(their_ts) > number_or_zero(our_ts));

    struct Candidate {
        QString id;
        QJsonValue timestamp;
    };
    const Candidate preferred = theirs_newer ? Candidate{their_id, their_ts} : Candidate{our_id, our_ts};
    const Candidate other = theirs_newer ? Candidate{our_id, our_ts} : Candidate{their_id, their_ts};

    for (const auto& candidate : {preferred, other}) {
        if (is_selectable_audio(attachments, candidate.id)) {
            merged.metadata_extra.insert(kSelectedAudioId, candidate.id);
            if (candidate.timestamp.isUndefined()) {
                merged.metadata_extra.remove(kSelectionTimestamp);
            } else {
                merged.metadata_extra.insert(kSelectionTimestamp, candidate.timestamp);
            }
            return;
        }
    }

    qCDebug(quireMergeLog) << "cell" << merged.id << "has no valid audio selection after merge";
    merged.metadata_extra.remove(kSelectedAudioId);
    merged.metadata_extra.remove(kSelectionTimestamp);
}

} // namespace

QJsonObject merge_attachments(const QJsonObject& ours, const QJsonObject& theirs) {
    QJsonObject merged = ours;
    for (auto it = theirs.begin(); it != theirs.end(); ++it) {
        if (!merged.contains(it.key())) {
            merged.insert(it.key(), it.value());
            continue;
        }

        const auto our_attachment = merged.value(it.key()).toObject();
        const auto their_attachment = it.value().toObject();
        const auto our_updated = number_or_zero(our_attachment.value(kUpdatedAt));
        const auto their_updated = number_or_zero(their_attachment.value(kUpdatedAt));
        auto base = their_updated > our_updated ? their_attachment : our_attachment;

        auto our_validations = parse_validations(our_attachment.value(kValidatedBy), our_updated);
        auto their_validations = parse_validations(their_attachment.value(kValidatedBy), their_updated);
        if (our_validations.is_ok() && their_validations.is_ok()) {
            const auto validations = merge_validations(our_validations.unwrap(), their_validations.unwrap());
            if (validations.empty()) {
                base.remove(kValidatedBy);
            } else {
                base.insert(kValidatedBy, validations_to_json(validations));
            }
        } else {
            qCDebug(quireMergeLog) << "attachment" << it.key() << "has unreadable validatedBy; keeping"
                                   << (their_updated > our_updated ? "theirs" : "ours");
        }
        merged.insert(it.key(), base);
    }
    return merged;
}

Cell merge_matched_cells(const Cell& ours, const Cell& theirs) {
    Cell merged = ours;
    merged.edits = merge_edit_histories(ours.edits, theirs.edits);

    for (const auto& path : touched_paths(merged.edits)) {
        const auto winner = select_winning_value(edits_for_path(ours.edits, path),
                                                 edits_for_path(theirs.edits, path),
                                                 edits_for_path(merged.edits, path),
                                                 cell_field(ours, path),
                                                 cell_field(theirs, path));
        if (!set_cell_field(merged, path, winner)) {
            qCDebug(quireMergeLog) << "cell" << merged.id << "edit path" << target_path_key(path)
                                   << "is not addressable; history kept, value untouched";
        }
    }

    const bool has_attachments = ours.metadata_extra.contains(kAttachments) ||
                                 theirs.metadata_extra.contains(kAttachments);
    if (has_attachments) {
        merged.metadata_extra.insert(kAttachments,
                                     merge_attachments(ours.metadata_extra.value(kAttachments).toObject(),
                                                       theirs.metadata_extra.value(kAttachments).toObject()));
    }
    resolve_audio_selection(merged, ours, theirs);
    return merged;
}

Document merge_documents(const Document& ours, const Document& theirs) {
    std::map<QString, const Cell*> their_by_id;
    std::vector<QString> their_order;
    their_order.reserve(theirs.cells.size());
    for (const auto& cell : theirs.cells) {
        if (!cell.has_id()) {
            qCWarning(quireMergeLog) << "dropping incoming cell without an id";
            continue;
        }
        if (!their_by_id.emplace(cell.id, &cell).second) {
            qCWarning(quireMergeLog) << "dropping repeated incoming cell id" << cell.id;
            continue;
        }
        their_order.push_back(cell.id);
    }

    std::vector<Cell> result;
    result.reserve(ours.cells.size() + their_order.size());
    std::set<QString> consumed;
    for (const auto& our_cell : ours.cells) {
        const auto match = our_cell.has_id() ? their_by_id.find(our_cell.id) : their_by_id.end();
        if (match == their_by_id.end() || consumed.count(our_cell.id) > 0) {
            result.push_back(our_cell);
            continue;
        }
        result.push_back(merge_matched_cells(our_cell, *match->second));
        consumed.insert(our_cell.id);
    }

    std::set<QString> foreign;
    for (const auto& id : their_order) {
        if (consumed.count(id) == 0) foreign.insert(id);
    }

    std::vector<AnchoredElement<QString, Cell>> incoming;
    incoming.reserve(foreign.size());
    for (auto& anchor : build_list_anchors(their_order, foreign)) {
        const auto* cell = their_by_id.at(anchor.id);
        incoming.push_back(AnchoredElement<QString, Cell>{std::move(anchor), *cell});
    }
    if (!incoming.empty()) {
        qCDebug(quireMergeLog) << "placing" << incoming.size() << "incoming cells";
    }

    Document out;
    out.cells = splice_anchored(std::move(result), std::move(incoming),
                                [](const Cell& cell) -> std::optional<QString> {
                                    if (!cell.has_id()) return std::nullopt;
                                    return cell.id;
                                });
    out.metadata = ours.metadata;
    out.extra = ours.extra;
    return out;
}

Result<QString> resolve_structured_cells(const QString& ours, const QString& theirs) {
    if (ours.trimmed().isEmpty()) {
        return Result<QString>::ok(theirs);
    }
    if (theirs.trimmed().isEmpty()) {
        return Result<QString>::ok(ours);
    }

    auto our_doc = parse_document(ours);
    if (our_doc.is_err()) {
        return Result<QString>::err(parse_error("ours: " + our_doc.unwrap_err().message));
    }
    auto their_doc = parse_document(theirs);
    if (their_doc.is_err()) {
        return Result<QString>::err(parse_error("theirs: " + their_doc.unwrap_err().message));
    }

    return Result<QString>::ok(serialize_document(merge_documents(our_doc.unwrap(), their_doc.unwrap())));
}

} // namespace quire::merge
