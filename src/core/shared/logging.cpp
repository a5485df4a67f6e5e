#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(crCore, "cmdrecall.core")
Q_LOGGING_CATEGORY(crStore, "cmdrecall.store")
Q_LOGGING_CATEGORY(crMatch, "cmdrecall.match")
Q_LOGGING_CATEGORY(crCache, "cmdrecall.cache")
Q_LOGGING_CATEGORY(crDecision, "cmdrecall.decision")
