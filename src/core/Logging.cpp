#include "tasktracker/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcParser, "tasktracker.parser", QtInfoMsg)
Q_LOGGING_CATEGORY(lcExecutor, "tasktracker.executor", QtInfoMsg)
Q_LOGGING_CATEGORY(lcStorage, "tasktracker.storage", QtInfoMsg)
Q_LOGGING_CATEGORY(lcSession, "tasktracker.session", QtInfoMsg)
