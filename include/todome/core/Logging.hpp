#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcTodomeDocument)
Q_DECLARE_LOGGING_CATEGORY(lcTodomeWorkspace)
Q_DECLARE_LOGGING_CATEGORY(lcTodomeCli)
