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

#include "labsched/scheduling/availability_index.h"

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "labsched/base/logging.h"
#include "labsched/scheduling/lab_scheduling.pb.h"
#include "labsched/scheduling/scheduling_errors.h"
#include "labsched/scheduling/time_interval.h"

namespace labsched {

namespace {

// Sorts by start and merges intervals that overlap or touch.
void SortAndMerge(std::vector<TimeInterval>* intervals) {
  if (intervals->empty()) return;
  std::sort(intervals->begin(), intervals->end(),
            [](const TimeInterval& a, const TimeInterval& b) {
              return a.start_minute < b.start_minute;
            });
  int num_merged = 0;
  for (const TimeInterval& interval : *intervals) {
    if (num_merged > 0 &&
        interval.start_minute <= (*intervals)[num_merged - 1].end_minute) {
      TimeInterval& last = (*intervals)[num_merged - 1];
      last.end_minute = std::max(last.end_minute, interval.end_minute);
    } else {
      (*intervals)[num_merged++] = interval;
    }
  }
  intervals->resize(num_merged);
}

}  // namespace

absl::StatusOr<AvailabilityIndex> AvailabilityIndex::Create(
    const LabSchedulingModel& model) {
  AvailabilityIndex index;
  const int num_staff = model.staff_size();
  index.has_availability_.resize(num_staff);
  index.unavailable_.resize(num_staff);
  for (int s = 0; s < num_staff; ++s) {
    const StaffMember& staff = model.staff(s);
    if (!index.staff_index_by_name_.emplace(staff.name(), s).second) {
      return ConfigurationErrorBuilder()
             << "duplicate staff name '" << staff.name() << "'";
    }
    index.has_availability_[s] = staff.has_availability();
  }

  for (const UnavailabilityInterval& record : model.unavailability()) {
    const auto it = index.staff_index_by_name_.find(record.staff_name());
    if (it == index.staff_index_by_name_.end()) {
      return ConfigurationErrorBuilder()
             << "unavailability record for unknown staff member '"
             << record.staff_name() << "'";
    }
    if (record.day() < MONDAY || record.day() > SUNDAY) {
      return ConfigurationErrorBuilder()
             << "unavailability record of '" << record.staff_name()
             << "' has no valid day";
    }
    index.unavailable_[it->second][record.day()].push_back(
        UnavailabilityTimeInterval(record));
  }

  int num_intervals = 0;
  for (WeekIntervals& week : index.unavailable_) {
    for (std::vector<TimeInterval>& intervals : week) {
      SortAndMerge(&intervals);
      num_intervals += intervals.size();
    }
  }
  VLOG(1) << "Availability index: " << num_staff << " staff, "
          << model.unavailability_size() << " unavailability records merged "
          << "into " << num_intervals << " intervals.";
  return index;
}

bool AvailabilityIndex::IsAvailable(int staff_index,
                                    const TimeInterval& interval) const {
  DCHECK_GE(staff_index, 0);
  DCHECK_LT(staff_index, num_staff());
  if (!has_availability_[staff_index]) return false;
  const absl::Span<const TimeInterval> intervals =
      UnavailableIntervals(staff_index, interval.day);
  // The first unavailable interval ending after the start is the only one
  // that can overlap.
  const auto it = std::upper_bound(
      intervals.begin(), intervals.end(), interval.start_minute,
      [](int minute, const TimeInterval& unavailable) {
        return minute < unavailable.end_minute;
      });
  return it == intervals.end() || !Overlaps(*it, interval);
}

std::optional<int> AvailabilityIndex::StaffIndex(
    absl::string_view name) const {
  const auto it = staff_index_by_name_.find(name);
  if (it == staff_index_by_name_.end()) return std::nullopt;
  return it->second;
}

absl::Span<const TimeInterval> AvailabilityIndex::UnavailableIntervals(
    int staff_index, Weekday day) const {
  if (day < MONDAY || day > SUNDAY) return {};
  return unavailable_[staff_index][day];
}

}  // namespace labsched
