#include "merge/dispatcher.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QSaveFile>

#include <algorithm>
#include <atomic>
#include <thread>

#include "merge/log.hpp"
#include "merge/resolver.hpp"

namespace quire::merge {
namespace {

const QString kFilepath = QStringLiteral("filepath");
const QString kPath = QStringLiteral("path");

Error invalid_record(std::string message) {
    return Error(std::move(message), ErrorCode::InvalidRecordShape);
}

Result<void> write_text_atomic(const QString& path, const QString& text) {
    const auto bytes = text.toUtf8();
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return Result<void>::err(Error("cannot open " + path.toStdString() + " for writing: " +
                                           file.errorString().toStdString(),
                                       ErrorCode::WriteFailure));
    }
    if (file.write(bytes) != bytes.size()) {
        return Result<void>::err(Error("short write to " + path.toStdString(), ErrorCode::WriteFailure));
    }
    if (!file.commit()) {
        return Result<void>::err(Error("cannot commit " + path.toStdString() + ": " +
                                           file.errorString().toStdString(),
                                       ErrorCode::WriteFailure));
    }
    return Result<void>::ok();
}

std::optional<QString> read_text(const QString& path) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        return std::nullopt;
    }
    return QString::fromUtf8(f.readAll());
}

QString record_label(const QJsonValue& json, qsizetype index) {
    const auto obj = json.toObject();
    for (const auto& key : {kFilepath, kPath}) {
        if (obj.value(key).isString()) return obj.value(key).toString();
    }
    return QStringLiteral("<record %1>").arg(index);
}

struct Outcome {
    std::optional<ResolvedFile> resolved;
    std::optional<FileFailure> failure;
};

} // namespace

std::string_view resolution_name(Resolution resolution) {
    switch (resolution) {
        case Resolution::Modified: return "modified";
        case Resolution::Created: return "created";
        case Resolution::Deleted: return "deleted";
    }
    return "modified";
}

QStringList BatchReport::resolved_paths() const {
    QStringList out;
    out.reserve(static_cast<qsizetype>(resolved.size()));
    for (const auto& file : resolved) {
        out.append(file.path);
    }
    return out;
}

QJsonObject BatchReport::to_json() const {
    QJsonArray resolved_json;
    for (const auto& file : resolved) {
        QJsonObject entry{
            {QStringLiteral("filepath"), file.path},
            {QStringLiteral("resolution"), QString::fromLatin1(resolution_name(file.resolution).data())},
        };
        if (!file.warnings.empty()) {
            QJsonArray warnings_json;
            for (const auto& warning : file.warnings) {
                warnings_json.append(QJsonObject{
                    {QStringLiteral("code"), QString::fromLatin1(error_code_name(warning.code).data())},
                    {QStringLiteral("message"), QString::fromStdString(warning.message)},
                });
            }
            entry.insert(QStringLiteral("warnings"), warnings_json);
        }
        resolved_json.append(entry);
    }

    QJsonArray failures_json;
    for (const auto& failure : failures) {
        failures_json.append(QJsonObject{
            {QStringLiteral("filepath"), failure.path},
            {QStringLiteral("code"), QString::fromLatin1(error_code_name(failure.error.code).data())},
            {QStringLiteral("message"), QString::fromStdString(failure.error.message)},
        });
    }

    QJsonObject completion_json{
        {QStringLiteral("attempted"), completion.attempted},
        {QStringLiteral("ok"), completion.ok},
    };
    if (!completion.message.isEmpty()) {
        completion_json.insert(QStringLiteral("message"), completion.message);
    }

    return QJsonObject{
        {QStringLiteral("resolved"), resolved_json},
        {QStringLiteral("failures"), failures_json},
        {QStringLiteral("completion"), completion_json},
    };
}

Result<QString> validate_record_path(const QString& path) {
    const auto trimmed = path.trimmed();
    if (trimmed.isEmpty()) {
        return Result<QString>::err(invalid_record("record has an empty path"));
    }
    if (QDir::isAbsolutePath(trimmed) || trimmed.startsWith(QLatin1Char('\\'))) {
        return Result<QString>::err(invalid_record("record path " + path.toStdString() + " is absolute"));
    }
    const auto normalized = normalize_path(trimmed);
    const auto segments = normalized.split(QLatin1Char('/'));
    if (normalized.isEmpty() || segments.contains(QStringLiteral(".."))) {
        return Result<QString>::err(invalid_record("record path " + path.toStdString() +
                                                   " escapes the working directory"));
    }
    return Result<QString>::ok(normalized);
}

Result<ConflictRecord> parse_conflict_record(const QJsonValue& json) {
    using R = Result<ConflictRecord>;
    if (!json.isObject()) {
        return R::err(invalid_record("record is not an object"));
    }
    const auto obj = json.toObject();

    const auto path = obj.contains(kFilepath) ? obj.value(kFilepath) : obj.value(kPath);
    if (!path.isString()) {
        return R::err(invalid_record("record has no filepath"));
    }
    for (const auto* key : {"base", "ours", "theirs"}) {
        if (!obj.value(QLatin1String(key)).isString()) {
            return R::err(invalid_record("record " + path.toString().toStdString() + " has no " + key + " text"));
        }
    }
    for (const auto* key : {"isDeleted", "isNew"}) {
        const auto flag = obj.value(QLatin1String(key));
        if (!flag.isUndefined() && !flag.isNull() && !flag.isBool()) {
            return R::err(invalid_record("record " + path.toString().toStdString() + ": " + key +
                                         " is not a boolean"));
        }
    }

    auto normalized = validate_record_path(path.toString());
    if (normalized.is_err()) {
        return R::err(normalized.unwrap_err());
    }

    ConflictRecord record;
    record.path = std::move(normalized).unwrap();
    record.base = obj.value(QStringLiteral("base")).toString();
    record.ours = obj.value(QStringLiteral("ours")).toString();
    record.theirs = obj.value(QStringLiteral("theirs")).toString();
    record.is_deleted = obj.value(QStringLiteral("isDeleted")).toBool(false);
    record.is_new = obj.value(QStringLiteral("isNew")).toBool(false);
    return R::ok(std::move(record));
}

MergeDispatcher::MergeDispatcher(QString working_dir, StrategyTable strategies, DispatcherOptions options)
    : working_dir_(std::move(working_dir)), strategies_(std::move(strategies)), options_(options) {}

BatchReport MergeDispatcher::resolve_all(const std::vector<ConflictRecord>& records) {
    std::vector<Result<ConflictRecord>> validated;
    QStringList labels;
    validated.reserve(records.size());
    for (const auto& record : records) {
        labels.append(record.path);
        auto path = validate_record_path(record.path);
        if (path.is_err()) {
            validated.push_back(Result<ConflictRecord>::err(path.unwrap_err()));
            continue;
        }
        auto copy = record;
        copy.path = std::move(path).unwrap();
        validated.push_back(Result<ConflictRecord>::ok(std::move(copy)));
    }
    return run(validated, labels);
}

BatchReport MergeDispatcher::resolve_batch(const QJsonArray& batch) {
    std::vector<Result<ConflictRecord>> records;
    QStringList labels;
    records.reserve(static_cast<size_t>(batch.size()));
    for (qsizetype i = 0; i < batch.size(); ++i) {
        labels.append(record_label(batch.at(i), i));
        records.push_back(parse_conflict_record(batch.at(i)));
    }
    return run(records, labels);
}

void MergeDispatcher::prepare_directories(const std::vector<Result<ConflictRecord>>& records) const {
    const QDir root(working_dir_);
    for (const auto& record : records) {
        if (record.is_err() || record.unwrap().is_deleted) continue;
        const auto parent = QFileInfo(root.filePath(record.unwrap().path)).absolutePath();
        if (!QDir().mkpath(parent)) {
            qCWarning(quireDispatchLog) << "could not create directory" << parent;
        }
    }
}

Result<std::optional<ResolvedFile>> MergeDispatcher::resolve_one(const ConflictRecord& record) const {
    using R = Result<std::optional<ResolvedFile>>;
    const auto target = QDir(working_dir_).filePath(record.path);
    const bool exists = QFileInfo::exists(target);

    if (record.is_deleted) {
        if (!exists) {
            qCInfo(quireDispatchLog) << "already deleted:" << record.path;
            return R::ok(std::nullopt);
        }
        if (!QFile::remove(target)) {
            return R::err(Error("cannot delete " + record.path.toStdString(), ErrorCode::WriteFailure));
        }
        return R::ok(ResolvedFile{record.path, Resolution::Deleted, {}});
    }

    QString content;
    std::vector<Error> warnings;
    auto resolution = exists ? Resolution::Modified : Resolution::Created;
    const auto tag = strategies_.select(record.path);

    if (record.is_new && (record.ours.isEmpty() || record.theirs.isEmpty() || record.ours == record.theirs)) {
        content = record.ours.isEmpty() ? record.theirs : record.ours;
        resolution = Resolution::Created;
    } else {
        if (!exists && !record.is_new) {
            qCInfo(quireDispatchLog) << "skipping" << record.path << "("
                                     << error_code_name(ErrorCode::TargetFileMissing).data() << ")";
            return R::ok(std::nullopt);
        }

        MergeInput input{record.base, record.ours, record.theirs};
        if (options_.refresh_ours_from_disk && exists) {
            if (auto current = read_text(target)) {
                input.ours = std::move(*current);
            } else {
                qCWarning(quireDispatchLog) << "could not re-read" << record.path << "; using recorded ours";
            }
        }

        qCDebug(quireDispatchLog) << "resolving" << record.path << "with" << resolver_name(tag).data();
        auto resolved = resolve_content(tag, input);
        if (resolved.is_err()) {
            auto error = resolved.unwrap_err();
            error.message = record.path.toStdString() + ": " + error.message;
            return R::err(std::move(error));
        }
        auto output = std::move(resolved).unwrap();
        content = std::move(output.text);
        warnings = std::move(output.warnings);
    }

    auto written = write_text_atomic(target, content);
    if (written.is_err()) {
        return R::err(written.unwrap_err());
    }
    return R::ok(ResolvedFile{record.path, resolution, std::move(warnings)});
}

BatchReport MergeDispatcher::run(const std::vector<Result<ConflictRecord>>& records, const QStringList& labels) {
    const auto total = records.size();
    std::vector<Outcome> outcomes(total);
    prepare_directories(records);

    QMutex mu;
    std::size_t processed = 0;
    std::atomic<std::size_t> next{0};

    const auto record_done = [&](std::size_t index, Outcome outcome) {
        QMutexLocker lock(&mu);
        if (outcome.failure) {
            qCWarning(quireDispatchLog) << "failed to resolve" << outcome.failure->path << ":"
                                        << QString::fromStdString(outcome.failure->error.message);
            if (observer_) observer_->warning(outcome.failure->path, outcome.failure->error);
        }
        if (outcome.resolved) {
            for (const auto& warning : outcome.resolved->warnings) {
                qCWarning(quireDispatchLog) << outcome.resolved->path << ":"
                                            << QString::fromStdString(warning.message);
                if (observer_) observer_->warning(outcome.resolved->path, warning);
            }
        }
        outcomes[index] = std::move(outcome);
        ++processed;
        if (observer_) observer_->progress(processed, total);
    };

    const auto worker = [&]() {
        for (auto i = next.fetch_add(1); i < total; i = next.fetch_add(1)) {
            const auto& record = records[i];
            if (record.is_err()) {
                record_done(i, Outcome{std::nullopt, FileFailure{labels.at(static_cast<qsizetype>(i)), record.unwrap_err()}});
                continue;
            }
            auto result = resolve_one(record.unwrap());
            if (result.is_err()) {
                record_done(i, Outcome{std::nullopt, FileFailure{record.unwrap().path, result.unwrap_err()}});
            } else {
                record_done(i, Outcome{std::move(result).unwrap(), std::nullopt});
            }
        }
    };

    const auto workers = static_cast<std::size_t>(std::max(1, options_.max_workers));
    if (workers == 1 || total < 2) {
        worker();
    } else {
        std::vector<std::thread> pool;
        pool.reserve(std::min(workers, total));
        for (std::size_t i = 0; i < std::min(workers, total); ++i) {
            pool.emplace_back(worker);
        }
        for (auto& t : pool) {
            t.join();
        }
    }

    BatchReport report;
    for (auto& outcome : outcomes) {
        if (outcome.resolved) report.resolved.push_back(std::move(*outcome.resolved));
        if (outcome.failure) report.failures.push_back(std::move(*outcome.failure));
    }
    qCInfo(quireDispatchLog) << "batch done:" << report.resolved.size() << "resolved,"
                             << report.failures.size() << "failed of" << total;

    notify_completion(report);
    return report;
}

void MergeDispatcher::notify_completion(BatchReport& report) {
    if (report.resolved.empty() || completion_ == nullptr) {
        return;
    }

    report.completion.attempted = true;
    auto done = completion_->merge_completed(working_dir_, report.resolved_paths());
    if (done.is_ok()) {
        return;
    }

    report.completion.ok = false;
    report.completion.message = QString::fromStdString(done.unwrap_err().message);
    qCWarning(quireDispatchLog) << "merge completion failed:" << report.completion.message;
    if (observer_) {
        observer_->warning(QString(), done.unwrap_err());
    }
}

} // namespace quire::merge
