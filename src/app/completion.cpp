#include "app/completion.hpp"

#include <QProcess>

#include "merge/log.hpp"

namespace quire::app {
namespace {

Error completion_error(std::string message) {
    return Error(std::move(message), ErrorCode::CompletionNotificationFailure);
}

} // namespace

ProcessCompletionHandler::ProcessCompletionHandler(QString command, int timeout_ms)
    : command_(std::move(command)), timeout_ms_(timeout_ms) {}

Result<void> ProcessCompletionHandler::merge_completed(const QString& working_dir,
                                                       const QStringList& resolved_paths) {
    auto args = QProcess::splitCommand(command_);
    if (args.isEmpty()) {
        return Result<void>::err(completion_error("completion command is empty"));
    }
    const auto program = args.takeFirst();
    args.append(resolved_paths);

    QProcess process;
    process.setWorkingDirectory(working_dir);
    process.setProcessChannelMode(QProcess::ForwardedErrorChannel);
    qCDebug(quireDispatchLog) << "running" << program << "for" << resolved_paths.size() << "files";
    process.start(program, args);

    if (!process.waitForStarted(timeout_ms_)) {
        return Result<void>::err(completion_error("cannot start " + program.toStdString() + ": " +
                                                  process.errorString().toStdString()));
    }
    if (!process.waitForFinished(timeout_ms_)) {
        process.kill();
        process.waitForFinished(1000);
        return Result<void>::err(completion_error(program.toStdString() + " timed out"));
    }
    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        return Result<void>::err(completion_error(program.toStdString() + " exited with code " +
                                                  std::to_string(process.exitCode())));
    }
    return Result<void>::ok();
}

} // namespace quire::app
