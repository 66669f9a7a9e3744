#include "LogCategories.hpp"

Q_LOGGING_CATEGORY(ferryPool, "ferry.pool")
Q_LOGGING_CATEGORY(ferryXfer, "ferry.transfer")
Q_LOGGING_CATEGORY(ferryReaper, "ferry.reaper")
