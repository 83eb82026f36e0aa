#include "coffeechat/data/Interval.hpp"

namespace coffeechat {
namespace data {

namespace {
QString formatMinute(int minute)
{
    return QStringLiteral("%1:%2")
        .arg(minute / 60, 2, 10, QLatin1Char('0'))
        .arg(minute % 60, 2, 10, QLatin1Char('0'));
}
} // namespace

QString Interval::toString() const
{
    return QStringLiteral("[%1, %2)").arg(start.toString(Qt::ISODate), end.toString(Qt::ISODate));
}

bool operator==(const Interval &lhs, const Interval &rhs)
{
    return lhs.start == rhs.start && lhs.end == rhs.end;
}

bool operator!=(const Interval &lhs, const Interval &rhs)
{
    return !(lhs == rhs);
}

DailyWindow DailyWindow::fromHours(int fromHour, int toHour)
{
    DailyWindow window;
    window.fromMinute = fromHour * 60;
    window.toMinute = toHour * 60;
    return window;
}

bool DailyWindow::isValid() const
{
    return fromMinute >= 0 && fromMinute < toMinute && toMinute <= MinutesPerDay;
}

QString DailyWindow::toString() const
{
    return QStringLiteral("%1-%2").arg(formatMinute(fromMinute), formatMinute(toMinute));
}

} // namespace data
} // namespace coffeechat
