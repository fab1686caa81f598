#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcTaskStorage)
Q_DECLARE_LOGGING_CATEGORY(lcTaskManager)
Q_DECLARE_LOGGING_CATEGORY(lcTaskCli)
