#include "coffeechat/core/SlotFinder.hpp"

#include <QDate>
#include <QTime>
#include <algorithm>

#include "coffeechat/core/Logging.hpp"

namespace coffeechat {
namespace core {

namespace {

QDateTime boundaryOf(const QDate &date, int minute, const QTimeZone &zone)
{
    if (minute >= data::MinutesPerDay) {
        return QDateTime(date.addDays(1), QTime(0, 0), zone);
    }
    return QDateTime(date, QTime(minute / 60, minute % 60), zone);
}

std::vector<data::Interval> expandAndClamp(const std::vector<data::Interval> &busy, const data::SlotQuery &query)
{
    const qint64 bufferSecs = static_cast<qint64>(query.bufferMinutes) * 60;
    const QDateTime &rangeStart = query.queryRange.start;
    const QDateTime &rangeEnd = query.queryRange.end;

    std::vector<data::Interval> expanded;
    expanded.reserve(busy.size());
    for (const auto &interval : busy) {
        if (!interval.isValid()) {
            qCDebug(lcSlots) << "Ignoring malformed busy interval" << interval.toString();
            continue;
        }
        data::Interval padded{ interval.start.addSecs(-bufferSecs), interval.end.addSecs(bufferSecs) };
        padded.start = std::clamp(padded.start, rangeStart, rangeEnd);
        padded.end = std::clamp(padded.end, rangeStart, rangeEnd);
        if (padded.start < padded.end) {
            expanded.push_back(padded);
        }
    }
    return expanded;
}

std::vector<data::Interval> subtractFromRange(const std::vector<data::Interval> &mergedBusy, const data::Interval &range)
{
    std::vector<data::Interval> candidates;
    QDateTime cursor = range.start;
    for (const auto &busy : mergedBusy) {
        if (cursor < busy.start) {
            candidates.push_back({ cursor, busy.start });
        }
        cursor = std::max(cursor, busy.end);
    }
    if (cursor < range.end) {
        candidates.push_back({ cursor, range.end });
    }
    return candidates;
}

void clipToDailyWindow(const data::Interval &candidate, const data::SlotQuery &query, std::vector<data::Interval> &out)
{
    const QTimeZone &zone = query.timeZone;
    QDate day = candidate.start.toTimeZone(zone).date();
    const QDate lastDay = candidate.end.toTimeZone(zone).date();
    for (; day <= lastDay; day = day.addDays(1)) {
        const QDateTime windowStart = boundaryOf(day, query.dailyWindow.fromMinute, zone);
        const QDateTime windowEnd = boundaryOf(day, query.dailyWindow.toMinute, zone);
        const QDateTime start = std::max(candidate.start, windowStart);
        const QDateTime end = std::min(candidate.end, windowEnd);
        if (start < end) {
            out.push_back({ start, end });
        }
    }
}

} // namespace

std::optional<Error> validateQuery(const data::SlotQuery &query)
{
    if (!query.queryRange.start.isValid() || !query.queryRange.end.isValid()) {
        return Error::invalidInput(QStringLiteral("Query range has an invalid timestamp"));
    }
    if (query.queryRange.start >= query.queryRange.end) {
        return Error::invalidInput(QStringLiteral("Query range must start before it ends"));
    }
    if (!query.dailyWindow.isValid()) {
        return Error::invalidInput(
            QStringLiteral("Daily window %1 is invalid, it must satisfy 0:00 <= from < to <= 24:00")
                .arg(query.dailyWindow.toString()));
    }
    if (query.bufferMinutes < 0 || query.bufferMinutes > data::MaxBufferMinutes) {
        return Error::invalidInput(
            QStringLiteral("Buffer of %1 minutes is outside 0-%2").arg(query.bufferMinutes).arg(data::MaxBufferMinutes));
    }
    if (query.minDurationMinutes < 0) {
        return Error::invalidInput(QStringLiteral("Minimum duration must not be negative"));
    }
    if (!query.timeZone.isValid()) {
        return Error::invalidInput(QStringLiteral("Time zone is invalid"));
    }
    return std::nullopt;
}

std::vector<data::Interval> mergeIntervals(std::vector<data::Interval> intervals)
{
    std::sort(intervals.begin(), intervals.end(), [](const data::Interval &a, const data::Interval &b) {
        return a.start < b.start;
    });

    std::vector<data::Interval> merged;
    merged.reserve(intervals.size());
    for (const auto &interval : intervals) {
        if (!merged.empty() && interval.start <= merged.back().end) {
            merged.back().end = std::max(merged.back().end, interval.end);
            continue;
        }
        merged.push_back(interval);
    }
    return merged;
}

Result<std::vector<data::Interval>> computeFreeSlots(const std::vector<data::Interval> &busy,
                                                     const data::SlotQuery &query)
{
    if (auto error = validateQuery(query)) {
        qCWarning(lcSlots) << "Rejected slot query:" << error->message;
        return Result<std::vector<data::Interval>>::failure(*error);
    }

    const auto mergedBusy = mergeIntervals(expandAndClamp(busy, query));
    qCDebug(lcSlots) << "Merged" << busy.size() << "busy intervals into" << mergedBusy.size();

    const auto candidates = subtractFromRange(mergedBusy, query.queryRange);

    std::vector<data::Interval> clipped;
    for (const auto &candidate : candidates) {
        clipToDailyWindow(candidate, query, clipped);
    }

    const qint64 minSecs = static_cast<qint64>(query.minDurationMinutes) * 60;
    std::vector<data::Interval> slots;
    slots.reserve(clipped.size());
    for (const auto &slot : clipped) {
        if (slot.durationSecs() > 0 && slot.durationSecs() >= minSecs) {
            slots.push_back(slot);
        }
    }
    qCDebug(lcSlots) << "Found" << slots.size() << "free slots in" << query.queryRange.toString()
                     << "window" << query.dailyWindow.toString();
    return Result<std::vector<data::Interval>>::success(std::move(slots));
}

} // namespace core
} // namespace coffeechat
