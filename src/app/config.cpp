#include "app/config.hpp"

#include <QtGlobal>

#include <algorithm>
#include <utility>

#include "merge/log.hpp"

namespace quire::app {
namespace {

constexpr auto kSettingsStrategyTable = "merge/strategyTable";
constexpr auto kSettingsWorkers = "merge/workers";
constexpr auto kSettingsRefreshOurs = "merge/refreshOursFromDisk";
constexpr auto kSettingsCompleteCommand = "merge/completeCommand";
constexpr auto kSettingsLogFile = "log/file";

bool is_truthy(const QString& value) {
    const auto v = value.trimmed().toLower();
    return v == QStringLiteral("1") || v == QStringLiteral("true") || v == QStringLiteral("yes") ||
           v == QStringLiteral("on");
}

} // namespace

merge::DispatcherOptions MergeConfig::dispatcher_options() const {
    merge::DispatcherOptions options;
    options.max_workers = clamp_workers(workers);
    options.refresh_ours_from_disk = refresh_ours_from_disk;
    return options;
}

int clamp_workers(int workers) {
    return std::clamp(workers, kMinWorkers, kMaxWorkers);
}

Result<MergeConfig> load_merge_config(const QSettings& settings) {
    MergeConfig config;
    config.strategy_table_path = settings.value(QString::fromLatin1(kSettingsStrategyTable), QString{}).toString();
    config.workers = clamp_workers(settings.value(QString::fromLatin1(kSettingsWorkers), kMinWorkers).toInt());
    config.refresh_ours_from_disk = settings.value(QString::fromLatin1(kSettingsRefreshOurs), false).toBool();
    config.complete_command = settings.value(QString::fromLatin1(kSettingsCompleteCommand), QString{}).toString();
    config.log_file = settings.value(QString::fromLatin1(kSettingsLogFile), QString{}).toString();

    const auto table = qEnvironmentVariable("QUIRE_STRATEGY_TABLE");
    if (!table.isEmpty()) {
        config.strategy_table_path = table;
    }

    const auto workers = qEnvironmentVariable("QUIRE_MERGE_WORKERS");
    if (!workers.isEmpty()) {
        bool ok = false;
        const auto parsed = workers.toInt(&ok);
        if (!ok) {
            return Result<MergeConfig>::err(
                Error("QUIRE_MERGE_WORKERS is not a number: " + workers.toStdString(), ErrorCode::ConfigError));
        }
        config.workers = clamp_workers(parsed);
    }

    if (qEnvironmentVariableIsSet("QUIRE_REFRESH_OURS")) {
        config.refresh_ours_from_disk = is_truthy(qEnvironmentVariable("QUIRE_REFRESH_OURS"));
    }

    const auto command = qEnvironmentVariable("QUIRE_COMPLETE_COMMAND");
    if (!command.isEmpty()) {
        config.complete_command = command;
    }

    const auto log_file = qEnvironmentVariable("QUIRE_LOG_FILE");
    if (!log_file.isEmpty()) {
        config.log_file = log_file;
    }

    config.debug = is_truthy(qEnvironmentVariable("QUIRE_DEBUG"));
    return Result<MergeConfig>::ok(std::move(config));
}

Result<MergeConfig> load_merge_config() {
    QSettings settings;
    return load_merge_config(settings);
}

Result<merge::StrategyTable> load_strategy_table(const MergeConfig& config) {
    if (config.strategy_table_path.isEmpty()) {
        return Result<merge::StrategyTable>::ok(merge::StrategyTable::defaults());
    }
    qCInfo(quireConfigLog) << "loading strategy table from" << config.strategy_table_path;
    return merge::StrategyTable::from_file(config.strategy_table_path);
}

} // namespace quire::app
