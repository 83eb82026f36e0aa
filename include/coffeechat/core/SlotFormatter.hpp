#pragma once

#include <QStringList>
#include <QTimeZone>
#include <vector>

#include "coffeechat/data/Interval.hpp"

namespace coffeechat {
namespace core {

// "10am", "10:15am"
QString formatTimeOfDay(const QTime &time);

// "Monday Jan 5: 10am–5pm", or "Monday Jan 5: 10pm–Tuesday Jan 6: 1am" across midnight.
QString formatSlot(const data::Interval &slot, const QTimeZone &zone);

// Groups slots per local day, joins touching slots and drops the ones shorter than
// minDurationMinutes. The strings are the availabilities offered in invitations.
QStringList summarizeSlots(const std::vector<data::Interval> &slots, int minDurationMinutes,
                           const QTimeZone &zone = QTimeZone::systemTimeZone());

} // namespace core
} // namespace coffeechat
