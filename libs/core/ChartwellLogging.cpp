#include "ChartwellLogging.hpp"

Q_LOGGING_CATEGORY(logApp, "chartwell.app")
Q_LOGGING_CATEGORY(logData, "chartwell.data")
Q_LOGGING_CATEGORY(logRender, "chartwell.render")
Q_LOGGING_CATEGORY(logDebug, "chartwell.debug", QtWarningMsg)
