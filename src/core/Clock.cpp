#include "planner/core/Clock.hpp"

namespace planner {
namespace core {

QDateTime SystemClock::now() const
{
    return QDateTime::currentDateTimeUtc();
}

} // namespace core
} // namespace planner
