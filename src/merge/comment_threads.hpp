#pragma once

#include <QJsonObject>
#include <QString>
#include <QtGlobal>

#include <vector>

#include "core/result.hpp"

namespace quire::merge {

struct Comment {
    qint64 id = 0;
    QJsonObject extra;
};

// A deletion or resolution toggle recorded on a thread.
struct ThreadEvent {
    qint64 timestamp = 0;
    QString author;  // empty when the event names no author
    bool state = false;
    QJsonObject extra;
};

struct CommentThread {
    QString id;
    std::vector<Comment> comments;
    std::vector<ThreadEvent> deletion_events;
    std::vector<ThreadEvent> resolved_events;
    bool has_deletion_events = false;
    bool has_resolved_events = false;
    QJsonObject extra;
};

[[nodiscard]] Result<std::vector<CommentThread>> parse_comment_threads(const QString& text);
[[nodiscard]] QString serialize_comment_threads(const std::vector<CommentThread>& threads);

/**
 * Id-keyed merge of two thread lists.
 *
 * Threads are keyed by id, `ours` first. A thread present on both sides gets
 * the union of its comments by comment id (the `ours` comment wins a shared
 * id), sorted ascending by id, and the deduplicated union of its event lists.
 * Result order: `ours` threads, then threads only in `theirs`.
 */
[[nodiscard]] std::vector<CommentThread> merge_comment_threads(const std::vector<CommentThread>& ours,
                                                               const std::vector<CommentThread>& theirs);

// Text entry point. Parse failures propagate as ParseError.
[[nodiscard]] Result<QString> resolve_comment_threads(const QString& ours, const QString& theirs);

} // namespace quire::merge
