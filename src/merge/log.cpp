#include "merge/log.hpp"

Q_LOGGING_CATEGORY(quireMergeLog, "quire.merge")
Q_LOGGING_CATEGORY(quireDispatchLog, "quire.dispatch")
Q_LOGGING_CATEGORY(quireConfigLog, "quire.config")
