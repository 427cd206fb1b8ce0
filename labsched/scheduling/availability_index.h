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

#ifndef LABSCHED_SCHEDULING_AVAILABILITY_INDEX_H_
#define LABSCHED_SCHEDULING_AVAILABILITY_INDEX_H_

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "labsched/scheduling/lab_scheduling.pb.h"
#include "labsched/scheduling/time_interval.h"

namespace labsched {

// For each staff member and each day, the sorted and merged list of the
// intervals in which the staff member cannot work. Overlapping or contiguous
// intervals are merged, so the intervals of a day are disjoint and their
// ends are increasing, and a lookup is a binary search.
//
// Staff members are identified by their index in LabSchedulingModel.staff.
// The index is immutable once created and may be shared between runs.
class AvailabilityIndex {
 public:
  // Returns a ConfigurationError if an unavailability record names a staff
  // member that is not in the model, has no valid day, or if two staff members
  // share a name.
  static absl::StatusOr<AvailabilityIndex> Create(
      const LabSchedulingModel& model);

  // Returns false iff the staff member has no availability response, or one
  // of their unavailable intervals overlaps the given interval.
  bool IsAvailable(int staff_index, const TimeInterval& interval) const;
  bool IsAvailable(int staff_index, const Slot& slot) const {
    return IsAvailable(staff_index, SlotInterval(slot));
  }

  std::optional<int> StaffIndex(absl::string_view name) const;

  absl::Span<const TimeInterval> UnavailableIntervals(int staff_index,
                                                      Weekday day) const;

  int num_staff() const { return has_availability_.size(); }

 private:
  // Indexed by Weekday; entry 0 (WEEKDAY_UNSPECIFIED) stays empty.
  using WeekIntervals = std::array<std::vector<TimeInterval>, 8>;

  AvailabilityIndex() = default;

  absl::flat_hash_map<std::string, int> staff_index_by_name_;
  std::vector<bool> has_availability_;
  std::vector<WeekIntervals> unavailable_;
};

}  // namespace labsched

#endif  // LABSCHED_SCHEDULING_AVAILABILITY_INDEX_H_
