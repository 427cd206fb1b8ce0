// Copyright 2010-2025 Google LLC
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

// Time-of-day and weekday handling for lab scheduling. Times are integer
// minutes since midnight; intervals are half-open, so a slot that ends when
// another begins does not overlap it.

#ifndef LABSCHED_SCHEDULING_TIME_INTERVAL_H_
#define LABSCHED_SCHEDULING_TIME_INTERVAL_H_

#include <string>
#include <utility>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "labsched/scheduling/lab_scheduling.pb.h"

namespace labsched {

inline constexpr int kMinutesPerDay = 24 * 60;

// [start_minute, end_minute) on a given day.
struct TimeInterval {
  Weekday day = WEEKDAY_UNSPECIFIED;
  int start_minute = 0;
  int end_minute = 0;

  int duration_minutes() const { return end_minute - start_minute; }
};

inline bool operator==(const TimeInterval& a, const TimeInterval& b) {
  return a.day == b.day && a.start_minute == b.start_minute &&
         a.end_minute == b.end_minute;
}

// Returns true iff a and b are on the same day and share at least one
// instant.
bool Overlaps(const TimeInterval& a, const TimeInterval& b);

TimeInterval SlotInterval(const Slot& slot);
TimeInterval UnavailabilityTimeInterval(
    const UnavailabilityInterval& unavailability);

enum class MeridiemPolicy {
  // Only 12-hour labels with an am/pm marker are accepted ("9am", "12:30pm").
  kRequired,
  // 24-hour labels are accepted too ("9", "13:00", "24:00"); a marker is
  // honoured when present.
  kOptional,
};

// Parses a time of day into minutes since midnight. Accepted shapes are "H",
// "HH:MM", each optionally followed by "am" or "pm" (case and spacing
// insensitive). Returns a ParseError on malformed text, an hour or minute out
// of range, or a missing marker under MeridiemPolicy::kRequired.
absl::StatusOr<int> ParseTimeOfDay(absl::string_view label,
                                   MeridiemPolicy policy);

// Parses "<start> to <end>", where both ends require an am/pm marker. If the
// label contains a '[', only the text between the brackets is parsed, so a
// whole form column header like "Unavailable times [8am to 9am]" is accepted.
// An end of "12am" after a later start denotes the end of the day (1440).
absl::StatusOr<std::pair<int, int>> ParseTimeRangeLabel(
    absl::string_view label);

// Accepts full names and their prefixes of at least three letters, in any
// case: "Monday", "mon", "Thurs".
absl::StatusOr<Weekday> ParseWeekday(absl::string_view name);

// Rounds down to the minute. Negative values give 0 and values are capped at
// one million hours.
int HoursToMinutes(double hours);

// "9:05", "14:00", "24:00".
std::string FormatTimeOfDay(int minutes);

// "Monday", ...
std::string WeekdayName(Weekday day);

// "Monday 9:00-10:00".
std::string FormatTimeInterval(const TimeInterval& interval);

}  // namespace labsched

#endif  // LABSCHED_SCHEDULING_TIME_INTERVAL_H_
