#include "planner/cache/CacheEntry.hpp"

namespace planner {
namespace cache {

namespace {
constexpr auto KEY_DATE_FORMAT = "yyyy-MM-dd";
} // namespace

QString cacheKey(data::AccountKind account, const QDate &start, const QDate &end)
{
    return QStringLiteral("%1_%2_%3")
        .arg(data::accountKindName(account),
             start.toString(QLatin1String(KEY_DATE_FORMAT)),
             end.toString(QLatin1String(KEY_DATE_FORMAT)));
}

QString cacheKey(data::AccountKind account, const data::DateRange &range)
{
    return cacheKey(account, range.start, range.end);
}

} // namespace cache
} // namespace planner
