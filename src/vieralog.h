#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(vieraSoapLog)
Q_DECLARE_LOGGING_CATEGORY(vieraProcessLog)
Q_DECLARE_LOGGING_CATEGORY(vieraPairingLog)
Q_DECLARE_LOGGING_CATEGORY(vieraWakeLog)
Q_DECLARE_LOGGING_CATEGORY(vieraDiscoveryLog)
