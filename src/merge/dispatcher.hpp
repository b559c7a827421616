#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include "core/result.hpp"
#include "merge/strategy.hpp"

namespace quire::merge {

struct ConflictRecord {
    QString path;
    QString base;
    QString ours;
    QString theirs;
    bool is_deleted = false;
    bool is_new = false;
};

enum class Resolution {
    Modified,
    Created,
    Deleted,
};

[[nodiscard]] std::string_view resolution_name(Resolution resolution);

struct ResolvedFile {
    QString path;
    Resolution resolution{Resolution::Modified};
    // Written, but the user should check it.
    std::vector<Error> warnings;
};

struct FileFailure {
    QString path;
    Error error;
};

struct CompletionOutcome {
    bool attempted = false;
    bool ok = true;
    QString message;
};

struct BatchReport {
    // Both lists are in input order.
    std::vector<ResolvedFile> resolved;
    std::vector<FileFailure> failures;
    CompletionOutcome completion;

    [[nodiscard]] QStringList resolved_paths() const;
    [[nodiscard]] bool has_failures() const { return !failures.empty(); }
    [[nodiscard]] QJsonObject to_json() const;
};

// Receives batch progress. Calls are serialized but may come from worker threads.
class MergeObserver {
public:
    virtual ~MergeObserver() = default;
    virtual void progress(std::size_t processed, std::size_t total) = 0;
    // A per-file failure, or a note on a resolved file, the user should see.
    virtual void warning(const QString& path, const Error& error) = 0;
};

// Finalizes a merge once resolved files are on disk (e.g. marks them resolved in the VCS).
class CompletionHandler {
public:
    virtual ~CompletionHandler() = default;
    [[nodiscard]] virtual Result<void> merge_completed(const QString& working_dir,
                                                       const QStringList& resolved_paths) = 0;
};

struct DispatcherOptions {
    int max_workers = 1;
    // Use the working-copy file as `ours` instead of the recorded text.
    bool refresh_ours_from_disk = false;
};

// Rejects empty, absolute and parent-escaping paths; returns the normalized form.
[[nodiscard]] Result<QString> validate_record_path(const QString& path);

// Reads one batch entry. Missing or mistyped fields are InvalidRecordShape.
[[nodiscard]] Result<ConflictRecord> parse_conflict_record(const QJsonValue& json);

/**
 * Resolves a batch of conflicting files inside `working_dir`.
 *
 * Each record is resolved independently: an invalid record, a resolver
 * failure or a failed write is reported for that file and the batch
 * continues. A record whose working-copy file is gone is skipped silently.
 * When at least one file resolved, the completion handler (if any) is told
 * once; its failure is reported but does not undo any write.
 */
class MergeDispatcher {
public:
    MergeDispatcher(QString working_dir, StrategyTable strategies, DispatcherOptions options = {});

    void set_observer(MergeObserver* observer) { observer_ = observer; }
    void set_completion_handler(CompletionHandler* handler) { completion_ = handler; }

    [[nodiscard]] BatchReport resolve_all(const std::vector<ConflictRecord>& records);
    [[nodiscard]] BatchReport resolve_batch(const QJsonArray& batch);

    [[nodiscard]] const QString& working_dir() const { return working_dir_; }

private:
    // `labels` names each record for reporting, parallel to `records`.
    [[nodiscard]] BatchReport run(const std::vector<Result<ConflictRecord>>& records, const QStringList& labels);
    [[nodiscard]] Result<std::optional<ResolvedFile>> resolve_one(const ConflictRecord& record) const;
    void prepare_directories(const std::vector<Result<ConflictRecord>>& records) const;
    void notify_completion(BatchReport& report);

    QString working_dir_;
    StrategyTable strategies_;
    DispatcherOptions options_;
    MergeObserver* observer_ = nullptr;
    CompletionHandler* completion_ = nullptr;
};

} // namespace quire::merge
