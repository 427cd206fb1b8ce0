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

#include "labsched/scheduling/assignment_report.h"

#include <algorithm>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "labsched/base/status_macros.h"
#include "labsched/scheduling/assignment_model.h"
#include "labsched/scheduling/availability_index.h"
#include "labsched/scheduling/lab_scheduling.pb.h"
#include "labsched/scheduling/scheduling_errors.h"
#include "labsched/scheduling/time_interval.h"

namespace labsched {

namespace {

double MinutesToHours(int64_t minutes) { return minutes / 60.0; }

// Slots of each staff member, in slot order.
std::vector<std::vector<int>> SlotsByStaff(int num_staff,
                                           const SolutionSnapshot& snapshot) {
  std::vector<std::vector<int>> slots(num_staff);
  for (int t = 0; t < snapshot.slots_size(); ++t) {
    for (const int s : snapshot.slots(t).staff_indices()) {
      if (s >= 0 && s < num_staff) slots[s].push_back(t);
    }
  }
  return slots;
}

}  // namespace

AssignmentReport ExtractAssignmentReport(
    const LabSchedulingModel& problem, const AssignmentModel& assignment_model,
    const SolutionSnapshot& snapshot, const SchedulingParameters& parameters) {
  AssignmentReport report;
  report.set_objective_value(snapshot.objective_value());
  *report.mutable_final_snapshot() = snapshot;

  int covered = 0;
  int required = 0;
  for (int t = 0; t < problem.slots_size(); ++t) {
    const Slot& slot = problem.slots(t);
    SlotReport* slot_report = report.add_slots();
    slot_report->set_id(slot.id());
    slot_report->set_label(slot.label());
    slot_report->set_day(slot.day());
    slot_report->set_start_minute(slot.start_minute());
    slot_report->set_end_minute(slot.end_minute());
    slot_report->set_required_headcount(slot.required_headcount());
    int assigned = 0;
    if (t < snapshot.slots_size()) {
      for (const int s : snapshot.slots(t).staff_indices()) {
        slot_report->add_assigned_staff(problem.staff(s).name());
        ++assigned;
      }
    }
    const int shortfall = std::max(0, slot.required_headcount() - assigned);
    slot_report->set_assigned_count(assigned);
    slot_report->set_shortfall(shortfall);
    slot_report->set_fill_ratio(static_cast<double>(assigned) /
                                slot.required_headcount());
    slot_report->set_unfillable(assignment_model.IsUnfillable(t));
    covered += assigned;
    required += slot.required_headcount();

    if (shortfall > 0) {
      SlotShortfall* gap = report.add_shortfalls();
      gap->set_slot_id(slot.id());
      gap->set_required_headcount(slot.required_headcount());
      gap->set_assigned_count(assigned);
      gap->set_shortfall(shortfall);
      gap->set_unfillable(slot_report->unfillable());
    }
  }
  report.set_covered_headcount(covered);
  report.set_required_headcount(required);

  const std::vector<std::vector<int>> slots_by_staff =
      SlotsByStaff(problem.staff_size(), snapshot);
  for (int s = 0; s < problem.staff_size(); ++s) {
    const StaffMember& staff = problem.staff(s);
    StaffReport* staff_report = report.add_staff();
    staff_report->set_name(staff.name());
    staff_report->set_has_availability(staff.has_availability());
    staff_report->set_hours_hired(staff.hours_hired());
    staff_report->set_lab_cap(parameters.max_labs_per_staff());

    int64_t total_minutes = 0;
    std::map<Weekday, int64_t> minutes_by_day;
    absl::flat_hash_set<std::string> labs;
    for (const int t : slots_by_staff[s]) {
      const Slot& slot = problem.slots(t);
      const int duration = slot.end_minute() - slot.start_minute();
      total_minutes += duration;
      minutes_by_day[slot.day()] += duration;
      labs.insert(LabGroupKey(slot, t, parameters.group_slots_by_label()));
      staff_report->add_assigned_slot_ids(slot.id());
    }
    staff_report->set_hours_used(MinutesToHours(total_minutes));
    staff_report->set_remaining_hours(staff.hours_hired() -
                                      MinutesToHours(total_minutes));
    staff_report->set_slot_count(slots_by_staff[s].size());
    staff_report->set_lab_count(labs.size());
    for (const auto& [day, minutes] : minutes_by_day) {
      StaffReport::DailyHours* daily = staff_report->add_daily_hours();
      daily->set_day(day);
      daily->set_hours(MinutesToHours(minutes));
    }
  }
  return report;
}

absl::Status VerifySolutionSnapshot(const LabSchedulingModel& problem,
                                    const AvailabilityIndex& index,
                                    const SchedulingParameters& parameters,
                                    const SolutionSnapshot& snapshot) {
  const int num_staff = problem.staff_size();
  if (snapshot.slots_size() != problem.slots_size()) {
    return SolverFailureBuilder()
           << "snapshot has " << snapshot.slots_size() << " slots, expected "
           << problem.slots_size();
  }

  int covered = 0;
  for (int t = 0; t < problem.slots_size(); ++t) {
    const Slot& slot = problem.slots(t);
    const auto& staff_indices = snapshot.slots(t).staff_indices();
    if (staff_indices.size() > slot.required_headcount()) {
      return SolverFailureBuilder()
             << "slot '" << slot.id() << "' has " << staff_indices.size()
             << " staff members for a required headcount of "
             << slot.required_headcount();
    }
    absl::flat_hash_set<int> seen;
    for (const int s : staff_indices) {
      if (s < 0 || s >= num_staff) {
        return SolverFailureBuilder()
               << "slot '" << slot.id() << "' has unknown staff index " << s;
      }
      if (!seen.insert(s).second) {
        return SolverFailureBuilder() << "staff '" << problem.staff(s).name()
                                      << "' appears twice in slot '"
                                      << slot.id() << "'";
      }
      if (!index.IsAvailable(s, slot)) {
        return SolverFailureBuilder()
               << "staff '" << problem.staff(s).name()
               << "' is not available for slot '" << slot.id() << "'";
      }
    }
    covered += staff_indices.size();
  }
  if (covered != snapshot.covered_headcount()) {
    return SolverFailureBuilder()
           << "snapshot covers " << covered << " positions but reports "
           << snapshot.covered_headcount();
  }

  const int daily_cap = HoursToMinutes(parameters.max_daily_hours());
  const std::vector<std::vector<int>> slots_by_staff =
      SlotsByStaff(num_staff, snapshot);
  for (int s = 0; s < num_staff; ++s) {
    const std::string& name = problem.staff(s).name();
    const std::vector<int>& slots = slots_by_staff[s];
    int64_t total_minutes = 0;
    std::map<Weekday, int64_t> minutes_by_day;
    absl::flat_hash_set<std::string> labs;
    for (int i = 0; i < slots.size(); ++i) {
      const Slot& slot = problem.slots(slots[i]);
      const int duration = slot.end_minute() - slot.start_minute();
      total_minutes += duration;
      minutes_by_day[slot.day()] += duration;
      labs.insert(
          LabGroupKey(slot, slots[i], parameters.group_slots_by_label()));
      for (int j = i + 1; j < slots.size(); ++j) {
        const Slot& other = problem.slots(slots[j]);
        if (Overlaps(SlotInterval(slot), SlotInterval(other))) {
          return SolverFailureBuilder()
                 << "staff '" << name << "' is double-booked on slots '"
                 << slot.id() << "' and '" << other.id() << "'";
        }
      }
    }
    if (total_minutes > HoursToMinutes(problem.staff(s).hours_hired())) {
      return SolverFailureBuilder()
             << "staff '" << name << "' works " << total_minutes
             << " minutes, more than the hired hours";
    }
    for (const auto& [day, minutes] : minutes_by_day) {
      if (minutes > daily_cap) {
        return SolverFailureBuilder()
               << "staff '" << name << "' works " << minutes << " minutes on "
               << WeekdayName(day) << ", more than the daily cap";
      }
    }
    if (labs.size() > parameters.max_labs_per_staff()) {
      return SolverFailureBuilder()
             << "staff '" << name << "' works " << labs.size()
             << " labs, more than " << parameters.max_labs_per_staff();
    }
  }
  return absl::OkStatus();
}

absl::Status VerifyAssignmentReport(const LabSchedulingModel& problem,
                                    const AvailabilityIndex& index,
                                    const SchedulingParameters& parameters,
                                    const AssignmentReport& report) {
  RETURN_IF_ERROR(VerifySolutionSnapshot(problem, index, parameters,
                                         report.final_snapshot()))
      << "in the final snapshot";
  if (report.slots_size() != problem.slots_size() ||
      report.staff_size() != problem.staff_size()) {
    return SolverFailureBuilder()
           << "report has " << report.slots_size() << " slots and "
           << report.staff_size() << " staff members, expected "
           << problem.slots_size() << " and " << problem.staff_size();
  }
  int num_short_slots = 0;
  for (int t = 0; t < report.slots_size(); ++t) {
    const SlotReport& slot_report = report.slots(t);
    if (slot_report.assigned_count() !=
            report.final_snapshot().slots(t).staff_indices_size() ||
        slot_report.assigned_count() + slot_report.shortfall() !=
            slot_report.required_headcount()) {
      return SolverFailureBuilder()
             << "slot report '" << slot_report.id()
             << "' does not match the final snapshot";
    }
    if (slot_report.shortfall() > 0) ++num_short_slots;
  }
  if (num_short_slots != report.shortfalls_size()) {
    return SolverFailureBuilder()
           << report.shortfalls_size() << " shortfalls reported for "
           << num_short_slots << " under-covered slots";
  }
  if (report.covered_headcount() !=
      report.final_snapshot().covered_headcount()) {
    return SolverFailureBuilder()
           << "report covers " << report.covered_headcount()
           << " positions, the final snapshot "
           << report.final_snapshot().covered_headcount();
  }
  return absl::OkStatus();
}

std::string FormatAssignmentReport(const AssignmentReport& report) {
  std::string out;
  absl::StrAppendFormat(
      &out, "Status: %s%s (%s), objective %g, covered %d of %d positions\n",
      SchedulingStatus_Name(report.status()),
      report.proven_optimal() ? ", proven optimal" : "",
      TerminationReason_Name(report.termination_reason()),
      report.objective_value(), report.covered_headcount(),
      report.required_headcount());

  absl::StrAppend(&out, "\nSlots:\n");
  for (const SlotReport& slot : report.slots()) {
    const TimeInterval interval{slot.day(), slot.start_minute(),
                                slot.end_minute()};
    absl::StrAppendFormat(&out, "  %-22s %-12s %-10s %d/%d  %s\n",
                          FormatTimeInterval(interval), slot.id(),
                          slot.label(), slot.assigned_count(),
                          slot.required_headcount(),
                          absl::StrJoin(slot.assigned_staff(), ", "));
  }

  absl::StrAppend(&out, "\nStaff:\n");
  for (const StaffReport& staff : report.staff()) {
    std::vector<std::string> days;
    for (const StaffReport::DailyHours& daily : staff.daily_hours()) {
      days.push_back(
          absl::StrFormat("%s %.1fh", WeekdayName(daily.day()), daily.hours()));
    }
    absl::StrAppendFormat(&out,
                          "  %-20s %5.1f/%.1f h  %d slots  %d/%d labs  %s%s\n",
                          staff.name(), staff.hours_used(), staff.hours_hired(),
                          staff.slot_count(), staff.lab_count(),
                          staff.lab_cap(), absl::StrJoin(days, ", "),
                          staff.has_availability() ? "" : " (no response)");
  }

  if (report.shortfalls().empty()) {
    absl::StrAppend(&out, "\nAll slots are fully covered.\n");
  } else {
    absl::StrAppend(&out, "\nShortfalls:\n");
    for (const SlotShortfall& gap : report.shortfalls()) {
      absl::StrAppendFormat(&out, "  %s: %d of %d missing%s\n", gap.slot_id(),
                            gap.shortfall(), gap.required_headcount(),
                            gap.unfillable() ? " (no eligible staff)" : "");
    }
  }
  return out;
}

}  // namespace labsched
