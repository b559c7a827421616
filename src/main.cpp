#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QTextStream>

#include <memory>

#include "app/completion.hpp"
#include "app/config.hpp"
#include "app/logging.hpp"
#include "merge/dispatcher.hpp"
#include "merge/log.hpp"
#include "merge/strategy.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFatal = 1;
constexpr int kExitPartial = 2;

// Surfaces per-file warnings on stderr; stdout carries only the report.
class StderrObserver final : public quire::merge::MergeObserver {
public:
    void progress(std::size_t processed, std::size_t total) override {
        qCDebug(quireDispatchLog) << "progress" << processed << "/" << total;
    }

    void warning(const QString& path, const quire::Error& error) override {
        QTextStream err(stderr);
        err << "warning: ";
        if (!path.isEmpty()) err << path << ": ";
        err << QString::fromStdString(error.message) << '\n';
    }
};

int fail(const QString& message) {
    qCCritical(quireConfigLog) << message;
    QTextStream(stderr) << "quire-merge: " << message << '\n';
    return kExitFatal;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("quire-merge");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("Quire");
    app.setOrganizationDomain("quire.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Resolve merge conflicts in Quire projects"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption workdirOption(
        QStringList{QStringLiteral("workdir")},
        QStringLiteral("Working copy the batch paths are relative to (default: current directory)."),
        QStringLiteral("dir"));
    parser.addOption(workdirOption);

    const QCommandLineOption strategiesOption(
        QStringList{QStringLiteral("strategies")},
        QStringLiteral("Strategy table JSON file (sets QUIRE_STRATEGY_TABLE for this run)."),
        QStringLiteral("file"));
    parser.addOption(strategiesOption);

    const QCommandLineOption workersOption(
        QStringList{QStringLiteral("workers")},
        QStringLiteral("Number of files resolved in parallel (1-16)."),
        QStringLiteral("n"));
    parser.addOption(workersOption);

    const QCommandLineOption refreshOursOption(
        QStringList{QStringLiteral("refresh-ours")},
        QStringLiteral("Use the working-copy file as 'ours' instead of the recorded text."));
    parser.addOption(refreshOursOption);

    const QCommandLineOption completeCommandOption(
        QStringList{QStringLiteral("complete-command")},
        QStringLiteral("Command run after the batch with the resolved paths appended."),
        QStringLiteral("cmd"));
    parser.addOption(completeCommandOption);

    const QCommandLineOption logFileOption(
        QStringList{QStringLiteral("log-file")},
        QStringLiteral("Log file path (sets QUIRE_LOG_FILE for this run)."),
        QStringLiteral("file"));
    parser.addOption(logFileOption);

    const QCommandLineOption debugOption(
        QStringList{QStringLiteral("debug")},
        QStringLiteral("Enable debug logging and echo the log to stderr (also sets QUIRE_DEBUG=1)."));
    parser.addOption(debugOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("'resolve <batch.json>' or 'strategy <path>...'."));
    parser.process(app);

    if (parser.isSet(strategiesOption)) {
        qputenv("QUIRE_STRATEGY_TABLE", parser.value(strategiesOption).toUtf8());
    }
    if (parser.isSet(logFileOption)) {
        qputenv("QUIRE_LOG_FILE", parser.value(logFileOption).toUtf8());
    }
    if (parser.isSet(debugOption)) {
        qputenv("QUIRE_DEBUG", "1");
    }

    auto loaded = quire::app::load_merge_config();
    if (loaded.is_err()) {
        return fail(QString::fromStdString(loaded.unwrap_err().message));
    }
    auto config = std::move(loaded).unwrap();

    if (parser.isSet(workersOption)) {
        bool ok = false;
        const auto workers = parser.value(workersOption).toInt(&ok);
        if (!ok) {
            return fail(QStringLiteral("--workers expects a number"));
        }
        config.workers = quire::app::clamp_workers(workers);
    }
    if (parser.isSet(refreshOursOption)) {
        config.refresh_ours_from_disk = true;
    }
    if (parser.isSet(completeCommandOption)) {
        config.complete_command = parser.value(completeCommandOption);
    }

    quire::app::install_logging(quire::app::LoggingOptions{
        .file_path = config.log_file,
        .echo_stderr = config.debug,
        .debug = config.debug,
    });
    qInfo() << "quire-merge: logging to" << quire::app::active_log_file_path();

    auto table = quire::app::load_strategy_table(config);
    if (table.is_err()) {
        return fail(QString::fromStdString(table.unwrap_err().message));
    }

    const auto positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(kExitFatal);
    }

    if (positional.first() == QStringLiteral("strategy")) {
        if (positional.size() < 2) {
            return fail(QStringLiteral("strategy expects at least one path"));
        }
        QTextStream out(stdout);
        for (qsizetype i = 1; i < positional.size(); ++i) {
            const auto tag = table.unwrap().select(positional.at(i));
            out << positional.at(i) << '\t' << quire::merge::resolver_name(tag).data() << '\n';
        }
        return kExitOk;
    }

    if (positional.first() == QStringLiteral("resolve")) {
        if (positional.size() != 2) {
            return fail(QStringLiteral("resolve expects exactly one batch file"));
        }

        QFile batchFile(positional.at(1));
        if (!batchFile.open(QIODevice::ReadOnly)) {
            return fail(QStringLiteral("cannot open %1: %2").arg(positional.at(1), batchFile.errorString()));
        }
        QJsonParseError err{};
        const auto doc = QJsonDocument::fromJson(batchFile.readAll(), &err);
        if (err.error != QJsonParseError::NoError || !doc.isArray()) {
            return fail(QStringLiteral("%1 is not a JSON array of conflict records").arg(positional.at(1)));
        }

        const auto workdir = parser.isSet(workdirOption) ? parser.value(workdirOption) : QDir::currentPath();
        if (!QDir(workdir).exists()) {
            return fail(QStringLiteral("working directory %1 does not exist").arg(workdir));
        }

        quire::merge::MergeDispatcher dispatcher(QDir(workdir).absolutePath(), std::move(table).unwrap(),
                                                 config.dispatcher_options());
        StderrObserver observer;
        dispatcher.set_observer(&observer);

        std::unique_ptr<quire::app::ProcessCompletionHandler> completion;
        if (!config.complete_command.isEmpty()) {
            completion = std::make_unique<quire::app::ProcessCompletionHandler>(config.complete_command);
            dispatcher.set_completion_handler(completion.get());
        }

        const auto report = dispatcher.resolve_batch(doc.array());
        QTextStream(stdout) << QJsonDocument(report.to_json()).toJson(QJsonDocument::Indented);
        return report.has_failures() ? kExitPartial : kExitOk;
    }

    return fail(QStringLiteral("unknown command '%1'").arg(positional.first()));
}
