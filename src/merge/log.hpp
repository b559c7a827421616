#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(quireMergeLog)
Q_DECLARE_LOGGING_CATEGORY(quireDispatchLog)
Q_DECLARE_LOGGING_CATEGORY(quireConfigLog)
