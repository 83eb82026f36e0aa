#pragma once

#include <optional>
#include <vector>

#include "coffeechat/core/Error.hpp"
#include "coffeechat/core/Result.hpp"
#include "coffeechat/data/Interval.hpp"

namespace coffeechat {
namespace core {

// Checks the query range, daily window, buffer and minimum duration.
std::optional<Error> validateQuery(const data::SlotQuery &query);

// Subtracts the buffered busy intervals from the query range and clips what is left
// to the daily window of every calendar day. The result is chronological, disjoint and
// contains no interval shorter than query.minDurationMinutes. Busy input order is
// irrelevant; malformed busy intervals (start >= end) are ignored.
Result<std::vector<data::Interval>> computeFreeSlots(const std::vector<data::Interval> &busy,
                                                     const data::SlotQuery &query);

// Sort and coalesce intervals whose start lies at or before the previous end.
std::vector<data::Interval> mergeIntervals(std::vector<data::Interval> intervals);

} // namespace core
} // namespace coffeechat
