#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(rwCore, "roadwise.core")
Q_LOGGING_CATEGORY(rwKb, "roadwise.kb")
Q_LOGGING_CATEGORY(rwExplain, "roadwise.explain")
