#include "Logging.h"

Q_LOGGING_CATEGORY(lcSession, "scope.session")
Q_LOGGING_CATEGORY(lcController, "scope.controller")
Q_LOGGING_CATEGORY(lcDevice, "scope.device")
Q_LOGGING_CATEGORY(lcCli, "scope.cli")
