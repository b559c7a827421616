#pragma once

#include <QString>
#include <QStringList>

#include "merge/dispatcher.hpp"

namespace quire::app {

/**
 * Finishes a merge by running an external command (e.g. a VCS helper) in the
 * working directory with the resolved paths appended as arguments.
 */
class ProcessCompletionHandler final : public merge::CompletionHandler {
public:
    explicit ProcessCompletionHandler(QString command, int timeout_ms = 60000);

    [[nodiscard]] Result<void> merge_completed(const QString& working_dir,
                                               const QStringList& resolved_paths) override;

private:
    QString command_;
    int timeout_ms_;
};

} // namespace quire::app
