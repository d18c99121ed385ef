#include "sn/logging.h"

namespace sn {

Q_LOGGING_CATEGORY(lcBus, "sn.core.bus", QtWarningMsg)
Q_LOGGING_CATEGORY(lcStore, "sn.core.store", QtInfoMsg)
Q_LOGGING_CATEGORY(lcBridge, "sn.core.bridge", QtWarningMsg)
Q_LOGGING_CATEGORY(lcPersistence, "sn.core.persistence", QtInfoMsg)

} // namespace sn
