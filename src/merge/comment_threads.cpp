#include "merge/comment_threads.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

#include <algorithm>
#include <map>
#include <set>
#include <tuple>

#include "merge/json_number.hpp"
#include "merge/log.hpp"

namespace quire::merge {
namespace {

const QString kId = QStringLiteral("id");
const QString kComments = QStringLiteral("comments");
const QString kDeletionEvent = QStringLiteral("deletionEvent");
const QString kResolvedEvent = QStringLiteral("resolvedEvent");
const QString kTimestamp = QStringLiteral("timestamp");
const QString kAuthor = QStringLiteral("author");
const QString kName = QStringLiteral("name");

Result<Comment> parse_comment(const QJsonValue& json) {
    if (!json.isObject()) {
        return Result<Comment>::err(parse_error("comment is not an object"));
    }
    const auto obj = json.toObject();
    const auto id = json_integer(obj.value(kId));
    if (!id) {
        return Result<Comment>::err(parse_error("comment id is not an integer"));
    }

    Comment comment;
    comment.id = *id;
    comment.extra = obj;
    comment.extra.remove(kId);
    return Result<Comment>::ok(std::move(comment));
}

Result<std::vector<ThreadEvent>> parse_events(const QJsonValue& json, const QString& state_key) {
    using R = Result<std::vector<ThreadEvent>>;
    std::vector<ThreadEvent> out;
    if (!json.isArray()) {
        return R::err(parse_error(state_key.toStdString() + " events are not an array"));
    }
    for (const auto& item : json.toArray()) {
        const auto obj = item.toObject();
        const auto timestamp = json_integer(obj.value(kTimestamp));
        if (!item.isObject() || !timestamp) {
            return R::err(parse_error(state_key.toStdString() + " event has no integer timestamp"));
        }

        ThreadEvent event;
        event.timestamp = *timestamp;
        event.author = obj.value(kAuthor).toObject().value(kName).toString();
        event.state = obj.value(state_key).toBool(false);
        event.extra = obj;
        event.extra.remove(kTimestamp);
        event.extra.remove(state_key);
        out.push_back(std::move(event));
    }
    return R::ok(std::move(out));
}

QJsonArray events_to_json(const std::vector<ThreadEvent>& events, const QString& state_key) {
    QJsonArray out;
    for (const auto& event : events) {
        QJsonObject obj = event.extra;
        if (!event.author.isEmpty()) {
            auto author = obj.value(kAuthor).toObject();
            author.insert(kName, event.author);
            obj.insert(kAuthor, author);
        }
        obj.insert(kTimestamp, event.timestamp);
        obj.insert(state_key, event.state);
        out.append(obj);
    }
    return out;
}

Result<CommentThread> parse_thread(const QJsonValue& json) {
    if (!json.isObject()) {
        return Result<CommentThread>::err(parse_error("comment thread is not an object"));
    }
    const auto obj = json.toObject();
    const auto id = obj.value(kId);
    if (!id.isString() || id.toString().isEmpty()) {
        return Result<CommentThread>::err(parse_error("comment thread has no id"));
    }

    CommentThread thread;
    thread.id = id.toString();

    const auto comments = obj.value(kComments);
    if (!comments.isUndefined() && !comments.isArray()) {
        return Result<CommentThread>::err(parse_error("thread " + thread.id.toStdString() +
                                                      ": comments is not an array"));
    }
    std::set<qint64> seen;
    for (const auto& item : comments.toArray()) {
        auto comment = parse_comment(item);
        if (comment.is_err()) {
            return Result<CommentThread>::err(parse_error("thread " + thread.id.toStdString() + ": " +
                                                          comment.unwrap_err().message));
        }
        if (!seen.insert(comment.unwrap().id).second) {
            return Result<CommentThread>::err(parse_error("thread " + thread.id.toStdString() +
                                                          ": repeated comment id " +
                                                          std::to_string(comment.unwrap().id)));
        }
        thread.comments.push_back(std::move(comment).unwrap());
    }

    if (obj.contains(kDeletionEvent)) {
        auto events = parse_events(obj.value(kDeletionEvent), QStringLiteral("deleted"));
        if (events.is_err()) return Result<CommentThread>::err(events.unwrap_err());
        thread.deletion_events = std::move(events).unwrap();
        thread.has_deletion_events = true;
    }
    if (obj.contains(kResolvedEvent)) {
        auto events = parse_events(obj.value(kResolvedEvent), QStringLiteral("resolved"));
        if (events.is_err()) return Result<CommentThread>::err(events.unwrap_err());
        thread.resolved_events = std::move(events).unwrap();
        thread.has_resolved_events = true;
    }

    thread.extra = obj;
    thread.extra.remove(kId);
    thread.extra.remove(kComments);
    thread.extra.remove(kDeletionEvent);
    thread.extra.remove(kResolvedEvent);
    return Result<CommentThread>::ok(std::move(thread));
}

std::vector<ThreadEvent> union_events(const std::vector<ThreadEvent>& ours,
                                      const std::vector<ThreadEvent>& theirs) {
    std::vector<ThreadEvent> out;
    std::set<std::tuple<qint64, QString, bool>> seen;
    for (const auto* side : {&ours, &theirs}) {
        for (const auto& event : *side) {
            const auto author = event.author.isEmpty() ? QStringLiteral("unknown") : event.author;
            if (seen.emplace(event.timestamp, author, event.state).second) {
                out.push_back(event);
            }
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const ThreadEvent& a, const ThreadEvent& b) {
        return a.timestamp < b.timestamp;
    });
    return out;
}

void merge_into(CommentThread& existing, const CommentThread& incoming) {
    std::set<qint64> ids;
    for (const auto& comment : existing.comments) {
        ids.insert(comment.id);
    }
    for (const auto& comment : incoming.comments) {
        if (ids.insert(comment.id).second) {
            existing.comments.push_back(comment);
        }
    }
    std::stable_sort(existing.comments.begin(), existing.comments.end(),
                     [](const Comment& a, const Comment& b) { return a.id < b.id; });

    existing.deletion_events = union_events(existing.deletion_events, incoming.deletion_events);
    existing.resolved_events = union_events(existing.resolved_events, incoming.resolved_events);
    existing.has_deletion_events = existing.has_deletion_events || incoming.has_deletion_events;
    existing.has_resolved_events = existing.has_resolved_events || incoming.has_resolved_events;
}

} // namespace

Result<std::vector<CommentThread>> parse_comment_threads(const QString& text) {
    using R = Result<std::vector<CommentThread>>;
    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(text.toUtf8(), &err);
    if (err.error != QJsonParseError::NoError) {
        return R::err(parse_error("comment threads are not valid JSON: " + err.errorString().toStdString()));
    }
    if (!doc.isArray()) {
        return R::err(parse_error("comment threads are not a JSON array"));
    }

    std::vector<CommentThread> threads;
    std::set<QString> ids;
    for (const auto& item : doc.array()) {
        auto thread = parse_thread(item);
        if (thread.is_err()) {
            return R::err(thread.unwrap_err());
        }
        if (!ids.insert(thread.unwrap().id).second) {
            return R::err(parse_error("repeated thread id " + thread.unwrap().id.toStdString()));
        }
        threads.push_back(std::move(thread).unwrap());
    }
    return R::ok(std::move(threads));
}

QString serialize_comment_threads(const std::vector<CommentThread>& threads) {
    QJsonArray out;
    for (const auto& thread : threads) {
        QJsonObject obj = thread.extra;
        obj.insert(kId, thread.id);

        QJsonArray comments;
        for (const auto& comment : thread.comments) {
            QJsonObject c = comment.extra;
            c.insert(kId, comment.id);
            comments.append(c);
        }
        obj.insert(kComments, comments);

        if (thread.has_deletion_events) {
            obj.insert(kDeletionEvent, events_to_json(thread.deletion_events, QStringLiteral("deleted")));
        }
        if (thread.has_resolved_events) {
            obj.insert(kResolvedEvent, events_to_json(thread.resolved_events, QStringLiteral("resolved")));
        }
        out.append(obj);
    }
    return QString::fromUtf8(QJsonDocument(out).toJson(QJsonDocument::Indented));
}

std::vector<CommentThread> merge_comment_threads(const std::vector<CommentThread>& ours,
                                                 const std::vector<CommentThread>& theirs) {
    std::vector<CommentThread> merged = ours;
    std::map<QString, size_t> index;
    for (size_t i = 0; i < merged.size(); ++i) {
        index.emplace(merged[i].id, i);
    }

    for (const auto& thread : theirs) {
        const auto it = index.find(thread.id);
        if (it == index.end()) {
            index.emplace(thread.id, merged.size());
            merged.push_back(thread);
            continue;
        }
        merge_into(merged[it->second], thread);
        qCDebug(quireMergeLog) << "merged thread" << thread.id << "now has"
                               << merged[it->second].comments.size() << "comments";
    }
    return merged;
}

Result<QString> resolve_comment_threads(const QString& ours, const QString& theirs) {
    auto our_threads = parse_comment_threads(ours);
    if (our_threads.is_err()) {
        return Result<QString>::err(parse_error("ours: " + our_threads.unwrap_err().message));
    }
    auto their_threads = parse_comment_threads(theirs);
    if (their_threads.is_err()) {
        return Result<QString>::err(parse_error("theirs: " + their_threads.unwrap_err().message));
    }
    return Result<QString>::ok(
        serialize_comment_threads(merge_comment_threads(our_threads.unwrap(), their_threads.unwrap())));
}

} // namespace quire::merge
