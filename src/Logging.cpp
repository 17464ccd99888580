#include "routine/Logging.hpp"

Q_LOGGING_CATEGORY(lcScheduler, "routine.scheduler", QtInfoMsg)
Q_LOGGING_CATEGORY(lcStore, "routine.store", QtInfoMsg)
Q_LOGGING_CATEGORY(lcConfig, "routine.config", QtInfoMsg)
Q_LOGGING_CATEGORY(lcCli, "routine.cli", QtInfoMsg)
