#include "tasktracker/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcStorage, "tasktracker.storage", QtWarningMsg)
Q_LOGGING_CATEGORY(lcTasks, "tasktracker.tasks", QtWarningMsg)
Q_LOGGING_CATEGORY(lcApp, "tasktracker.app", QtWarningMsg)
