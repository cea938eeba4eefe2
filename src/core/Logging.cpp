#include "eventually/core/Logging.hpp"

Q_LOGGING_CATEGORY(EVENTUALLY_CORE_LOG, "eventually.core", QtInfoMsg)
Q_LOGGING_CATEGORY(EVENTUALLY_DATA_LOG, "eventually.data", QtInfoMsg)
Q_LOGGING_CATEGORY(EVENTUALLY_UI_LOG, "eventually.ui", QtInfoMsg)
Q_LOGGING_CATEGORY(EVENTUALLY_SERVICE_LOG, "eventually.service", QtInfoMsg)
