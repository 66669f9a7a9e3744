// Qt logging categories of the transfer service. Filter with QT_LOGGING_RULES,
// e.g. "ferry.pool.debug=true".
#pragma once
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(ferryPool)
Q_DECLARE_LOGGING_CATEGORY(ferryXfer)
Q_DECLARE_LOGGING_CATEGORY(ferryReaper)
