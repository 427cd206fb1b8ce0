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

#include "labsched/scheduling/model_validator.h"

#include <cmath>
#include <string>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "labsched/scheduling/lab_scheduling.pb.h"
#include "labsched/scheduling/scheduling_errors.h"
#include "labsched/scheduling/time_interval.h"

namespace labsched {

namespace {

std::string FindErrorInTimeRange(Weekday day, int start_minute,
                                 int end_minute) {
  if (day == WEEKDAY_UNSPECIFIED) return "has no day";
  if (start_minute < 0 || end_minute > kMinutesPerDay) {
    return absl::StrCat("has times outside of the day: [", start_minute, ", ",
                        end_minute, ")");
  }
  if (start_minute >= end_minute) {
    return absl::StrCat("does not start before it ends: [", start_minute, ", ",
                        end_minute, ")");
  }
  return "";
}

}  // namespace

std::string FindErrorInLabSchedulingModel(const LabSchedulingModel& model) {
  absl::flat_hash_set<std::string> staff_names;
  for (int s = 0; s < model.staff_size(); ++s) {
    const StaffMember& staff = model.staff(s);
    if (staff.name().empty()) {
      return absl::StrCat("staff(", s, ") has no name");
    }
    if (!staff_names.insert(staff.name()).second) {
      return absl::StrCat("duplicate staff name '", staff.name(), "'");
    }
    if (!std::isfinite(staff.hours_hired()) || staff.hours_hired() < 0) {
      return absl::StrCat("staff '", staff.name(),
                          "' has invalid hired hours: ", staff.hours_hired());
    }
  }

  if (model.slots().empty()) return "empty requirement set";
  absl::flat_hash_set<std::string> slot_ids;
  for (int i = 0; i < model.slots_size(); ++i) {
    const Slot& slot = model.slots(i);
    if (slot.id().empty()) return absl::StrCat("slot(", i, ") has no id");
    if (!slot_ids.insert(slot.id()).second) {
      return absl::StrCat("duplicate slot id '", slot.id(), "'");
    }
    const std::string range_error = FindErrorInTimeRange(
        slot.day(), slot.start_minute(), slot.end_minute());
    if (!range_error.empty()) {
      return absl::StrCat("slot '", slot.id(), "' ", range_error);
    }
    if (slot.required_headcount() < 1) {
      return absl::StrCat("slot '", slot.id(),
                          "' has a non-positive required headcount: ",
                          slot.required_headcount());
    }
  }

  for (const UnavailabilityInterval& interval : model.unavailability()) {
    const std::string range_error = FindErrorInTimeRange(
        interval.day(), interval.start_minute(), interval.end_minute());
    if (!range_error.empty()) {
      return absl::StrCat("unavailability of '", interval.staff_name(), "' ",
                          range_error);
    }
  }
  return "";
}

std::string FindErrorInSchedulingParameters(
    const SchedulingParameters& parameters, const LabSchedulingModel& model) {
  if (!std::isfinite(parameters.max_daily_hours()) ||
      parameters.max_daily_hours() <= 0) {
    return absl::StrCat("max_daily_hours must be positive, got ",
                        parameters.max_daily_hours());
  }
  if (parameters.max_labs_per_staff() <= 0) {
    return absl::StrCat("max_labs_per_staff must be positive, got ",
                        parameters.max_labs_per_staff());
  }
  if (!SchedulingParameters::SecondaryObjective_IsValid(
          parameters.secondary_objective())) {
    return absl::StrCat("unknown secondary_objective ",
                        parameters.secondary_objective());
  }
  if (parameters.secondary_objective() ==
          SchedulingParameters::BALANCE_UTILIZATION &&
      parameters.balance_step_minutes() <= 0) {
    return absl::StrCat("balance_step_minutes must be positive, got ",
                        parameters.balance_step_minutes());
  }
  if (parameters.max_number_of_conflicts() < 0) {
    return absl::StrCat("max_number_of_conflicts must be non-negative, got ",
                        parameters.max_number_of_conflicts());
  }
  if (parameters.num_workers() < 0) {
    return absl::StrCat("num_workers must be non-negative, got ",
                        parameters.num_workers());
  }
  if (std::isnan(parameters.max_time_in_seconds())) {
    return "max_time_in_seconds is NaN";
  }

  const double daily_cap_minutes = parameters.max_daily_hours() * 60.0;
  bool some_slot_fits = model.slots().empty();
  for (const Slot& slot : model.slots()) {
    if (slot.end_minute() - slot.start_minute() <= daily_cap_minutes) {
      some_slot_fits = true;
      break;
    }
  }
  if (!some_slot_fits) {
    return absl::StrCat("max_daily_hours (", parameters.max_daily_hours(),
                        ") is shorter than every slot");
  }
  return "";
}

absl::Status ValidateLabSchedulingModel(
    const LabSchedulingModel& model, const SchedulingParameters& parameters) {
  std::string error = FindErrorInLabSchedulingModel(model);
  if (error.empty()) {
    error = FindErrorInSchedulingParameters(parameters, model);
  }
  if (!error.empty()) {
    return ConfigurationErrorBuilder() << "invalid scheduling model: " << error;
  }
  return absl::OkStatus();
}

}  // namespace labsched
