#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(EVENTUALLY_CORE_LOG)
Q_DECLARE_LOGGING_CATEGORY(EVENTUALLY_DATA_LOG)
Q_DECLARE_LOGGING_CATEGORY(EVENTUALLY_UI_LOG)
Q_DECLARE_LOGGING_CATEGORY(EVENTUALLY_SERVICE_LOG)
