#include <catch2/catch_test_macros.hpp>
#include "app/config.hpp"

#include <QSettings>
#include <QTemporaryDir>

using namespace quire;
using namespace quire::app;

namespace {

// Clears the QUIRE_* overrides for the lifetime of a test.
struct ScopedEnv {
    ScopedEnv() { clear(); }
    ~ScopedEnv() { clear(); }

    static void clear() {
        for (const auto* name : {"QUIRE_STRATEGY_TABLE", "QUIRE_MERGE_WORKERS", "QUIRE_REFRESH_OURS",
                                 "QUIRE_COMPLETE_COMMAND", "QUIRE_LOG_FILE", "QUIRE_DEBUG"}) {
            qunsetenv(name);
        }
    }
};

} // namespace

TEST_CASE("clamp_workers keeps the worker count in range", "[unit][config]") {
    REQUIRE(clamp_workers(0) == 1);
    REQUIRE(clamp_workers(-3) == 1);
    REQUIRE(clamp_workers(4) == 4);
    REQUIRE(clamp_workers(64) == 16);
}

TEST_CASE("load_merge_config reads settings", "[unit][config]") {
    ScopedEnv env;
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    QSettings settings(dir.filePath("quire.ini"), QSettings::IniFormat);
    settings.setValue("merge/workers", 4);
    settings.setValue("merge/refreshOursFromDisk", true);
    settings.setValue("merge/completeCommand", "git add");
    settings.setValue("log/file", "/tmp/quire.log");

    const auto config = load_merge_config(settings);
    REQUIRE(config.is_ok());
    REQUIRE(config.unwrap().workers == 4);
    REQUIRE(config.unwrap().refresh_ours_from_disk);
    REQUIRE(config.unwrap().complete_command == QStringLiteral("git add"));
    REQUIRE(config.unwrap().log_file == QStringLiteral("/tmp/quire.log"));
    REQUIRE(config.unwrap().strategy_table_path.isEmpty());
    REQUIRE_FALSE(config.unwrap().debug);
}

TEST_CASE("load_merge_config lets the environment override settings", "[unit][config]") {
    ScopedEnv env;
    QTemporaryDir dir;
    QSettings settings(dir.filePath("quire.ini"), QSettings::IniFormat);
    settings.setValue("merge/workers", 2);

    qputenv("QUIRE_MERGE_WORKERS", "40");
    qputenv("QUIRE_STRATEGY_TABLE", "/etc/quire/strategies.json");
    qputenv("QUIRE_REFRESH_OURS", "yes");
    qputenv("QUIRE_DEBUG", "1");

    const auto config = load_merge_config(settings);
    REQUIRE(config.is_ok());
    REQUIRE(config.unwrap().workers == 16);
    REQUIRE(config.unwrap().strategy_table_path == QStringLiteral("/etc/quire/strategies.json"));
    REQUIRE(config.unwrap().refresh_ours_from_disk);
    REQUIRE(config.unwrap().debug);

    const auto options = config.unwrap().dispatcher_options();
    REQUIRE(options.max_workers == 16);
    REQUIRE(options.refresh_ours_from_disk);
}

TEST_CASE("load_merge_config rejects a non-numeric worker override", "[unit][config]") {
    ScopedEnv env;
    QTemporaryDir dir;
    QSettings settings(dir.filePath("quire.ini"), QSettings::IniFormat);
    qputenv("QUIRE_MERGE_WORKERS", "many");

    const auto config = load_merge_config(settings);
    REQUIRE(config.is_err());
    REQUIRE(config.unwrap_err().code == ErrorCode::ConfigError);
}

TEST_CASE("load_strategy_table uses the built-in table by default", "[unit][config]") {
    const MergeConfig config;
    const auto table = load_strategy_table(config);
    REQUIRE(table.is_ok());
    REQUIRE(table.unwrap().select("GEN.codex") == merge::ResolverTag::StructuredCellMerge);
}
