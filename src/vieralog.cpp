#include "vieralog.h"

Q_LOGGING_CATEGORY(vieraSoapLog, "phi-core.adapters.viera.soap");
Q_LOGGING_CATEGORY(vieraProcessLog, "phi-core.adapters.viera.process");
Q_LOGGING_CATEGORY(vieraPairingLog, "phi-core.adapters.viera.pairing");
Q_LOGGING_CATEGORY(vieraWakeLog, "phi-core.adapters.viera.wake");
Q_LOGGING_CATEGORY(vieraDiscoveryLog, "phi-core.adapters.viera.discovery");
