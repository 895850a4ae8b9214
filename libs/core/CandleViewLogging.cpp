#include "CandleViewLogging.hpp"

Q_LOGGING_CATEGORY(logApp, "candleview.app")
Q_LOGGING_CATEGORY(logData, "candleview.data")
Q_LOGGING_CATEGORY(logRender, "candleview.render")
Q_LOGGING_CATEGORY(logDebug, "candleview.debug", QtWarningMsg)   // debug output off unless enabled by rules
