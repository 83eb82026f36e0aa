#pragma once

#include <QDateTime>
#include <QString>
#include <QTimeZone>

namespace coffeechat {
namespace data {

constexpr int MinutesPerDay = 24 * 60;

struct Interval
{
    QDateTime start;
    QDateTime end;

    bool isValid() const { return start.isValid() && end.isValid() && start < end; }
    qint64 durationSecs() const { return start.secsTo(end); }
    QString toString() const;
};

bool operator==(const Interval &lhs, const Interval &rhs);
bool operator!=(const Interval &lhs, const Interval &rhs);

// Recurring time-of-day range, applied to every calendar day of a query.
// Minutes since midnight; toMinute may be MinutesPerDay to mean 24:00.
struct DailyWindow
{
    int fromMinute = 9 * 60;
    int toMinute = 17 * 60;

    static DailyWindow fromHours(int fromHour, int toHour);
    bool isValid() const;
    QString toString() const;
};

struct SlotQuery
{
    Interval queryRange;
    DailyWindow dailyWindow;
    int bufferMinutes = 0;
    int minDurationMinutes = 0;
    // Defines where calendar days begin and end.
    QTimeZone timeZone = QTimeZone::systemTimeZone();
};

constexpr int MaxBufferMinutes = 120;

} // namespace data
} // namespace coffeechat
