#include "coffeechat/data/AppSettings.hpp"

namespace coffeechat {
namespace data {

SlotQuery CalendarSettings::toQuery(const QDateTime &now) const
{
    SlotQuery query;
    query.queryRange.start = now;
    query.queryRange.end = now.addDays(lookaheadDays);
    query.dailyWindow = DailyWindow::fromHours(dayStartHour, dayEndHour);
    query.bufferMinutes = bufferMinutes;
    query.minDurationMinutes = minDurationMinutes;
    return query;
}

} // namespace data
} // namespace coffeechat
