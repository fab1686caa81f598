#include "taskbook/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcTaskStorage, "taskbook.storage", QtInfoMsg)
Q_LOGGING_CATEGORY(lcTaskManager, "taskbook.manager", QtInfoMsg)
Q_LOGGING_CATEGORY(lcTaskCli, "taskbook.cli", QtInfoMsg)
