#include "coffeechat/core/SlotFormatter.hpp"

#include <QLocale>
#include <algorithm>
#include <map>

#include "coffeechat/core/Logging.hpp"

namespace coffeechat {
namespace core {

namespace {
const QString EnDash = QString(QChar(0x2013));

QString formatDay(const QDateTime &local)
{
    return QLocale::c().toString(local, QStringLiteral("dddd MMM d"));
}
} // namespace

QString formatTimeOfDay(const QTime &time)
{
    if (time.minute() == 0) {
        return QLocale::c().toString(time, QStringLiteral("hap"));
    }
    return QLocale::c().toString(time, QStringLiteral("h:mmap"));
}

QString formatSlot(const data::Interval &slot, const QTimeZone &zone)
{
    const QDateTime start = slot.start.toTimeZone(zone);
    const QDateTime end = slot.end.toTimeZone(zone);
    if (start.date() != end.date()) {
        return QStringLiteral("%1: %2%3%4: %5")
            .arg(formatDay(start), formatTimeOfDay(start.time()), EnDash, formatDay(end), formatTimeOfDay(end.time()));
    }
    return QStringLiteral("%1: %2%3%4")
        .arg(formatDay(start), formatTimeOfDay(start.time()), EnDash, formatTimeOfDay(end.time()));
}

QStringList summarizeSlots(const std::vector<data::Interval> &slots, int minDurationMinutes, const QTimeZone &zone)
{
    std::map<QDate, std::vector<data::Interval>> byDay;
    for (const auto &slot : slots) {
        if (!slot.isValid()) {
            continue;
        }
        byDay[slot.start.toTimeZone(zone).date()].push_back(slot);
    }

    const qint64 minSecs = static_cast<qint64>(minDurationMinutes) * 60;
    QStringList out;
    for (auto &entry : byDay) {
        auto &daySlots = entry.second;
        std::sort(daySlots.begin(), daySlots.end(), [](const data::Interval &a, const data::Interval &b) {
            return a.start < b.start;
        });

        std::vector<data::Interval> merged;
        for (const auto &slot : daySlots) {
            if (!merged.empty() && slot.start == merged.back().end) {
                merged.back().end = slot.end;
            } else {
                merged.push_back(slot);
            }
        }
        for (const auto &slot : merged) {
            if (slot.durationSecs() >= minSecs) {
                out << formatSlot(slot, zone);
            }
        }
    }
    qCDebug(lcSlots) << "Summarized" << slots.size() << "slots into" << out.size() << "availabilities";
    return out;
}

} // namespace core
} // namespace coffeechat
