#include "todome/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcTodomeDocument, "todome.document")
Q_LOGGING_CATEGORY(lcTodomeWorkspace, "todome.workspace")
Q_LOGGING_CATEGORY(lcTodomeCli, "todome.cli")
