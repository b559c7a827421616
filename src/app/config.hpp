#pragma once

#include <QSettings>
#include <QString>

#include "core/result.hpp"
#include "merge/dispatcher.hpp"
#include "merge/strategy.hpp"

namespace quire::app {

inline constexpr int kMinWorkers = 1;
inline constexpr int kMaxWorkers = 16;

struct MergeConfig {
    // JSON strategy table file; empty means the built-in table.
    QString strategy_table_path;
    int workers = kMinWorkers;
    bool refresh_ours_from_disk = false;
    // External command told about resolved files; empty disables completion.
    QString complete_command;
    QString log_file;
    bool debug = false;

    [[nodiscard]] merge::DispatcherOptions dispatcher_options() const;
};

[[nodiscard]] int clamp_workers(int workers);

/**
 * Reads the configuration from `settings`, then applies QUIRE_* environment
 * overrides. A malformed override (non-numeric worker count) is a ConfigError.
 */
[[nodiscard]] Result<MergeConfig> load_merge_config(const QSettings& settings);

// Same, using the application's default QSettings.
[[nodiscard]] Result<MergeConfig> load_merge_config();

// Built-in table, or the table file named by the config.
[[nodiscard]] Result<merge::StrategyTable> load_strategy_table(const MergeConfig& config);

} // namespace quire::app
