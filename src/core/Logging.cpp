#include "planner/core/Logging.hpp"

namespace planner {

Q_LOGGING_CATEGORY(lcCore, "planner.core")
Q_LOGGING_CATEGORY(lcData, "planner.data")
Q_LOGGING_CATEGORY(lcNet, "planner.net")
Q_LOGGING_CATEGORY(lcCache, "planner.cache")
Q_LOGGING_CATEGORY(lcLayout, "planner.layout", QtInfoMsg)

} // namespace planner
