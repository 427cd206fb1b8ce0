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

#include "labsched/scheduling/time_interval.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

#include "absl/algorithm/container.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "labsched/scheduling/scheduling_errors.h"

namespace labsched {

namespace {

bool IsAllDigits(absl::string_view text) {
  if (text.empty()) return false;
  for (const char c : text) {
    if (!absl::ascii_isdigit(c)) return false;
  }
  return true;
}

struct WeekdayEntry {
  Weekday day;
  const char* name;
};

constexpr WeekdayEntry kWeekdays[] = {
    {MONDAY, "Monday"},     {TUESDAY, "Tuesday"},   {WEDNESDAY, "Wednesday"},
    {THURSDAY, "Thursday"}, {FRIDAY, "Friday"},     {SATURDAY, "Saturday"},
    {SUNDAY, "Sunday"},
};

}  // namespace

bool Overlaps(const TimeInterval& a, const TimeInterval& b) {
  if (a.day != b.day) return false;
  return a.start_minute < b.end_minute && b.start_minute < a.end_minute;
}

TimeInterval SlotInterval(const Slot& slot) {
  return {slot.day(), slot.start_minute(), slot.end_minute()};
}

TimeInterval UnavailabilityTimeInterval(
    const UnavailabilityInterval& unavailability) {
  return {unavailability.day(), unavailability.start_minute(),
          unavailability.end_minute()};
}

absl::StatusOr<int> ParseTimeOfDay(absl::string_view label,
                                   MeridiemPolicy policy) {
  const std::string text =
      absl::AsciiStrToLower(absl::StripAsciiWhitespace(label));
  if (text.empty()) {
    return ParseErrorBuilder() << "empty time label";
  }

  absl::string_view clock = text;
  enum { kNone, kAm, kPm } meridiem = kNone;
  if (absl::ConsumeSuffix(&clock, "am")) {
    meridiem = kAm;
  } else if (absl::ConsumeSuffix(&clock, "pm")) {
    meridiem = kPm;
  }
  clock = absl::StripTrailingAsciiWhitespace(clock);

  absl::string_view hour_text = clock;
  absl::string_view minute_text = "00";
  const size_t colon = clock.find(':');
  if (colon != absl::string_view::npos) {
    hour_text = clock.substr(0, colon);
    minute_text = clock.substr(colon + 1);
  }
  if (!IsAllDigits(hour_text) || hour_text.size() > 2 ||
      !IsAllDigits(minute_text) || minute_text.size() != 2) {
    if (absl::c_any_of(clock, absl::ascii_isalpha)) {
      return ParseErrorBuilder()
             << "time label '" << label << "' has an unknown suffix";
    }
    return ParseErrorBuilder()
           << "time label '" << label << "' is not of the form H or HH:MM";
  }
  int hour = 0;
  int minute = 0;
  if (!absl::SimpleAtoi(hour_text, &hour) ||
      !absl::SimpleAtoi(minute_text, &minute)) {
    return ParseErrorBuilder() << "time label '" << label << "' is not a time";
  }
  if (minute > 59) {
    return ParseErrorBuilder()
           << "time label '" << label << "' has minutes out of range";
  }

  if (meridiem == kNone) {
    if (policy == MeridiemPolicy::kRequired) {
      return ParseErrorBuilder()
             << "time label '" << label << "' is missing am/pm";
    }
    if (hour > 24 || (hour == 24 && minute != 0)) {
      return ParseErrorBuilder()
             << "time label '" << label << "' has an hour out of range";
    }
    return hour * 60 + minute;
  }

  if (hour < 1 || hour > 12) {
    return ParseErrorBuilder()
           << "time label '" << label << "' has an hour out of range";
  }
  if (hour == 12) hour = 0;
  if (meridiem == kPm) hour += 12;
  return hour * 60 + minute;
}

absl::StatusOr<std::pair<int, int>> ParseTimeRangeLabel(
    absl::string_view label) {
  absl::string_view range = label;
  const size_t open = label.find('[');
  if (open != absl::string_view::npos) {
    const size_t close = label.find(']', open);
    if (close == absl::string_view::npos) {
      return ParseErrorBuilder()
             << "time range '" << label << "' has no closing bracket";
    }
    range = label.substr(open + 1, close - open - 1);
  }

  const std::string lower = absl::AsciiStrToLower(range);
  const std::vector<absl::string_view> ends =
      absl::StrSplit(lower, " to ", absl::SkipWhitespace());
  if (ends.size() != 2) {
    return ParseErrorBuilder() << "time range '" << label
                               << "' is not of the form '<start> to <end>'";
  }
  absl::StatusOr<int> start =
      ParseTimeOfDay(ends[0], MeridiemPolicy::kRequired);
  if (!start.ok()) {
    return StatusBuilder(start.status()) << "in time range '" << label << "'";
  }
  absl::StatusOr<int> end = ParseTimeOfDay(ends[1], MeridiemPolicy::kRequired);
  if (!end.ok()) {
    return StatusBuilder(end.status()) << "in time range '" << label << "'";
  }
  int end_minute = *end;
  if (end_minute == 0 && *start > 0) end_minute = kMinutesPerDay;
  if (*start >= end_minute) {
    return ParseErrorBuilder()
           << "time range '" << label << "' does not start before it ends";
  }
  return std::make_pair(*start, end_minute);
}

absl::StatusOr<Weekday> ParseWeekday(absl::string_view name) {
  const std::string text =
      absl::AsciiStrToLower(absl::StripAsciiWhitespace(name));
  if (text.size() >= 3) {
    for (const WeekdayEntry& entry : kWeekdays) {
      if (absl::StartsWith(absl::AsciiStrToLower(entry.name), text)) {
        return entry.day;
      }
    }
  }
  return ParseErrorBuilder() << "unknown day '" << name << "'";
}

int HoursToMinutes(double hours) {
  constexpr double kMaxHours = 1e6;
  if (!(hours > 0)) return 0;
  // The epsilon keeps 1.1 hours at 66 minutes.
  return static_cast<int>(std::floor(std::min(hours, kMaxHours) * 60 + 1e-6));
}

std::string FormatTimeOfDay(int minutes) {
  return absl::StrFormat("%d:%02d", minutes / 60, minutes % 60);
}

std::string WeekdayName(Weekday day) {
  for (const WeekdayEntry& entry : kWeekdays) {
    if (entry.day == day) return entry.name;
  }
  return "Unspecified";
}

std::string FormatTimeInterval(const TimeInterval& interval) {
  return absl::StrCat(WeekdayName(interval.day), " ",
                      FormatTimeOfDay(interval.start_minute), "-",
                      FormatTimeOfDay(interval.end_minute));
}

}  // namespace labsched
