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

#include "labsched/scheduling/assignment_model.h"

#include <algorithm>
#include <array>
#include <cstdint>
#include <numeric>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "labsched/base/logging.h"
#include "labsched/base/status_macros.h"
#include "labsched/scheduling/availability_index.h"
#include "labsched/scheduling/lab_scheduling.pb.h"
#include "labsched/scheduling/model_validator.h"
#include "labsched/scheduling/scheduling_errors.h"
#include "labsched/scheduling/time_interval.h"
#include "labsched/solver/boolean_linear_solver.h"

namespace labsched {

namespace {
constexpr int64_t kMaxBalanceWeight = 100;
}  // namespace

std::string LabGroupKey(const Slot& slot, int slot_index,
                        bool group_slots_by_label) {
  if (group_slots_by_label && !slot.label().empty()) {
    return absl::StrCat("label:", slot.label());
  }
  return absl::StrCat("slot:", slot_index);
}

absl::StatusOr<AssignmentModel> AssignmentModel::Build(
    const LabSchedulingModel& problem, const AvailabilityIndex& index,
    const SchedulingParameters& parameters, BooleanLinearSolver* solver) {
  CHECK(solver != nullptr);
  RETURN_IF_ERROR(ValidateLabSchedulingModel(problem, parameters));
  if (index.num_staff() != problem.staff_size()) {
    return ConfigurationErrorBuilder()
           << "the availability index has " << index.num_staff()
           << " staff members, the model has " << problem.staff_size();
  }
  if (solver->num_variables() != 0 || solver->num_constraints() != 0) {
    return ConfigurationErrorBuilder() << "the solver already holds a model";
  }

  const int num_staff = problem.staff_size();
  const int num_slots = problem.slots_size();
  const int daily_cap = HoursToMinutes(parameters.max_daily_hours());
  const int max_labs = parameters.max_labs_per_staff();
  constexpr int64_t kInf = BooleanLinearSolver::kInfinity;

  AssignmentModel model;
  model.secondary_objective_ = parameters.secondary_objective();
  model.unfillable_.assign(num_slots, false);
  Statistics& stats = model.statistics_;

  std::vector<int> hired(num_staff);
  for (int s = 0; s < num_staff; ++s) {
    hired[s] = HoursToMinutes(problem.staff(s).hours_hired());
  }

  // Eligible (staff, slot) pairs. Ineligible pairs get no variable at all.
  std::vector<std::vector<int>> eligible_staff(num_slots);
  std::vector<int> num_eligible_slots(num_staff, 0);
  for (int t = 0; t < num_slots; ++t) {
    const TimeInterval interval = SlotInterval(problem.slots(t));
    const int duration = interval.duration_minutes();
    for (int s = 0; s < num_staff; ++s) {
      if (!index.IsAvailable(s, interval)) {
        ++stats.num_unavailable_pairs;
        continue;
      }
      if (duration > hired[s] || duration > daily_cap) {
        ++stats.num_too_long_pairs;
        continue;
      }
      eligible_staff[t].push_back(s);
      ++num_eligible_slots[s];
    }
    if (eligible_staff[t].empty()) {
      model.unfillable_[t] = true;
      ++stats.num_unfillable_slots;
    }
  }

  // Variables are created for the most constrained slots first, and within a
  // slot for the staff members with the fewest options first. Solvers that
  // break ties by creation order fill the hard slots first.
  std::vector<int> slot_order(num_slots);
  std::iota(slot_order.begin(), slot_order.end(), 0);
  std::stable_sort(slot_order.begin(), slot_order.end(), [&](int a, int b) {
    return eligible_staff[a].size() < eligible_staff[b].size();
  });
  std::vector<std::vector<int>> staff_assignments(num_staff);
  for (const int t : slot_order) {
    const Slot& slot = problem.slots(t);
    std::vector<int> candidates = eligible_staff[t];
    std::stable_sort(candidates.begin(), candidates.end(), [&](int a, int b) {
      return num_eligible_slots[a] < num_eligible_slots[b];
    });
    for (const int s : candidates) {
      const int variable = solver->AddBoolVar(
          absl::StrCat("x[", problem.staff(s).name(), ",", slot.id(), "]"));
      staff_assignments[s].push_back(model.assignment_variables_.size());
      model.assignment_variables_.push_back(
          {s, t, variable, slot.end_minute() - slot.start_minute()});
    }
  }
  stats.num_assignment_variables = model.assignment_variables_.size();

  // Coverage.
  std::vector<std::vector<LinearTerm>> coverage_terms(num_slots);
  for (const AssignmentVariable& assignment : model.assignment_variables_) {
    coverage_terms[assignment.slot].push_back({assignment.variable, 1});
  }
  for (int t = 0; t < num_slots; ++t) {
    const Slot& slot = problem.slots(t);
    if (coverage_terms[t].size() <= slot.required_headcount()) continue;
    solver->AddLinearConstraint(coverage_terms[t], -kInf,
                                slot.required_headcount(),
                                absl::StrCat("coverage[", slot.id(), "]"));
    ++stats.num_coverage_constraints;
  }

  // Per staff member: daily cap, no overlap, total cap and lab cap.
  std::vector<int64_t> reachable_minutes(num_staff, 0);
  for (int s = 0; s < num_staff; ++s) {
    const std::vector<int>& assignments = staff_assignments[s];
    if (assignments.empty()) continue;
    const std::string& name = problem.staff(s).name();

    std::array<std::vector<int>, 8> assignments_by_day;
    for (const int a : assignments) {
      const Slot& slot = problem.slots(model.assignment_variables_[a].slot);
      assignments_by_day[slot.day()].push_back(a);
    }
    int64_t total_minutes = 0;
    for (int day = MONDAY; day <= SUNDAY; ++day) {
      const std::vector<int>& of_day = assignments_by_day[day];
      if (of_day.empty()) continue;
      std::vector<LinearTerm> minute_terms;
      int64_t day_minutes = 0;
      for (const int a : of_day) {
        const AssignmentVariable& assignment = model.assignment_variables_[a];
        minute_terms.push_back(
            {assignment.variable, assignment.duration_minutes});
        day_minutes += assignment.duration_minutes;
      }
      total_minutes += day_minutes;
      if (day_minutes > daily_cap) {
        solver->AddLinearConstraint(
            minute_terms, -kInf, daily_cap,
            absl::StrCat("daily_cap[", name, ",",
                         WeekdayName(static_cast<Weekday>(day)), "]"));
        ++stats.num_daily_cap_constraints;
      }

      for (int i = 0; i < of_day.size(); ++i) {
        const AssignmentVariable& first = model.assignment_variables_[of_day[i]];
        const Slot& first_slot = problem.slots(first.slot);
        for (int j = i + 1; j < of_day.size(); ++j) {
          const AssignmentVariable& second =
              model.assignment_variables_[of_day[j]];
          const Slot& second_slot = problem.slots(second.slot);
          if (!Overlaps(SlotInterval(first_slot), SlotInterval(second_slot))) {
            continue;
          }
          solver->AddLinearConstraint(
              {{first.variable, 1}, {second.variable, 1}}, -kInf, 1,
              absl::StrCat("no_overlap[", name, ",", first_slot.id(), ",",
                           second_slot.id(), "]"));
          ++stats.num_overlap_constraints;
        }
      }
    }

    if (total_minutes > hired[s]) {
      std::vector<LinearTerm> minute_terms;
      for (const int a : assignments) {
        const AssignmentVariable& assignment = model.assignment_variables_[a];
        minute_terms.push_back(
            {assignment.variable, assignment.duration_minutes});
      }
      solver->AddLinearConstraint(minute_terms, -kInf, hired[s],
                                  absl::StrCat("total_cap[", name, "]"));
      ++stats.num_total_cap_constraints;
    }
    reachable_minutes[s] = std::min<int64_t>(total_minutes, hired[s]);

    // Labs, in order of first appearance.
    std::vector<std::pair<std::string, std::vector<int>>> labs;
    absl::flat_hash_map<std::string, int> lab_position;
    for (const int a : assignments) {
      const int t = model.assignment_variables_[a].slot;
      const std::string key = LabGroupKey(problem.slots(t), t,
                                          parameters.group_slots_by_label());
      const auto [it, inserted] = lab_position.emplace(key, labs.size());
      if (inserted) labs.push_back({key, {}});
      labs[it->second].second.push_back(a);
    }
    if (labs.size() > max_labs) {
      std::vector<LinearTerm> lab_terms;
      for (const auto& [key, lab_assignments] : labs) {
        if (lab_assignments.size() == 1) {
          lab_terms.push_back(
              {model.assignment_variables_[lab_assignments[0]].variable, 1});
          continue;
        }
        const int lab_variable =
            solver->AddBoolVar(absl::StrCat("y[", name, ",", key, "]"));
        ++stats.num_lab_variables;
        for (const int a : lab_assignments) {
          solver->AddLinearConstraint(
              {{model.assignment_variables_[a].variable, 1},
               {lab_variable, -1}},
              -kInf, 0, absl::StrCat("lab_link[", name, ",", key, "]"));
          ++stats.num_lab_cap_constraints;
        }
        lab_terms.push_back({lab_variable, 1});
      }
      solver->AddLinearConstraint(lab_terms, -kInf, max_labs,
                                  absl::StrCat("lab_cap[", name, "]"));
      ++stats.num_lab_cap_constraints;
    }
  }

  // Secondary objective.
  int64_t max_secondary_value = 0;
  switch (parameters.secondary_objective()) {
    case SchedulingParameters::NO_SECONDARY_OBJECTIVE:
      break;
    case SchedulingParameters::MAXIMIZE_ASSIGNED_HOURS:
      for (int s = 0; s < num_staff; ++s) {
        max_secondary_value += reachable_minutes[s];
      }
      break;
    case SchedulingParameters::BALANCE_UTILIZATION: {
      // Step k of a staff member hired for n steps is worth
      // ceil(100 * (n - k) / n): the first hour of someone with nothing is
      // worth more than the last hour of someone almost full. Steps are taken
      // in order (u[k+1] <= u[k]), which removes symmetric solutions.
      const int step = parameters.balance_step_minutes();
      for (int s = 0; s < num_staff; ++s) {
        const int64_t hired_steps = hired[s] / step;
        const int64_t num_steps = reachable_minutes[s] / step;
        if (num_steps == 0) continue;
        const std::string& name = problem.staff(s).name();
        std::vector<LinearTerm> link_terms;
        int previous = -1;
        for (int64_t k = 0; k < num_steps; ++k) {
          const int u =
              solver->AddBoolVar(absl::StrCat("u[", name, ",", k + 1, "]"));
          const int64_t weight =
              (kMaxBalanceWeight * (hired_steps - k) + hired_steps - 1) /
              hired_steps;
          model.balance_steps_.push_back({u, weight});
          max_secondary_value += weight;
          link_terms.push_back({u, step});
          if (previous >= 0) {
            solver->AddLinearConstraint(
                {{u, 1}, {previous, -1}}, -kInf, 0,
                absl::StrCat("balance_order[", name, ",", k + 1, "]"));
            ++stats.num_balance_constraints;
          }
          previous = u;
        }
        for (const int a : staff_assignments[s]) {
          const AssignmentVariable& assignment = model.assignment_variables_[a];
          link_terms.push_back(
              {assignment.variable, -assignment.duration_minutes});
        }
        solver->AddLinearConstraint(link_terms, -kInf, 0,
                                    absl::StrCat("balance[", name, "]"));
        ++stats.num_balance_constraints;
        stats.num_balance_variables += num_steps;
      }
      break;
    }
  }

  model.headcount_weight_ = max_secondary_value + 1;
  std::vector<LinearTerm> objective;
  for (const AssignmentVariable& assignment : model.assignment_variables_) {
    int64_t coefficient = model.headcount_weight_;
    if (parameters.secondary_objective() ==
        SchedulingParameters::MAXIMIZE_ASSIGNED_HOURS) {
      coefficient += assignment.duration_minutes;
    }
    objective.push_back({assignment.variable, coefficient});
  }
  for (const BalanceStep& step : model.balance_steps_) {
    objective.push_back({step.variable, step.weight});
  }
  solver->SetObjective(objective, /*maximize=*/true);

  model.num_variables_ = solver->num_variables();
  model.num_constraints_ = solver->num_constraints();
  LOG(INFO) << "Lab scheduling model: " << num_staff << " staff, " << num_slots
            << " slots (" << stats.num_unfillable_slots << " unfillable), "
            << stats.num_assignment_variables << " assignment variables ("
            << stats.num_unavailable_pairs << " pairs unavailable, "
            << stats.num_too_long_pairs << " pairs too long), "
            << model.num_variables_ << " variables, " << model.num_constraints_
            << " constraints.";
  VLOG(1) << "Constraints: " << stats.num_coverage_constraints << " coverage, "
          << stats.num_daily_cap_constraints << " daily cap, "
          << stats.num_total_cap_constraints << " total cap, "
          << stats.num_lab_cap_constraints << " lab cap, "
          << stats.num_overlap_constraints << " no overlap, "
          << stats.num_balance_constraints << " balance.";
  return model;
}

int64_t AssignmentModel::SecondaryValue(const std::vector<bool>& values) const {
  int64_t value = 0;
  switch (secondary_objective_) {
    case SchedulingParameters::MAXIMIZE_ASSIGNED_HOURS:
      for (const AssignmentVariable& assignment : assignment_variables_) {
        if (values[assignment.variable]) value += assignment.duration_minutes;
      }
      break;
    case SchedulingParameters::BALANCE_UTILIZATION:
      for (const BalanceStep& step : balance_steps_) {
        if (values[step.variable]) value += step.weight;
      }
      break;
    default:
      break;
  }
  return value;
}

SolutionSnapshot AssignmentModel::DecodeSolution(
    const std::vector<bool>& values) const {
  CHECK_EQ(static_cast<int>(values.size()), num_variables_);
  SolutionSnapshot snapshot = EmptySnapshot();
  int64_t covered = 0;
  for (const AssignmentVariable& assignment : assignment_variables_) {
    if (!values[assignment.variable]) continue;
    snapshot.mutable_slots(assignment.slot)->add_staff_indices(
        assignment.staff);
    ++covered;
  }
  for (SlotStaffing& staffing : *snapshot.mutable_slots()) {
    std::sort(staffing.mutable_staff_indices()->begin(),
              staffing.mutable_staff_indices()->end());
  }
  const int64_t secondary = SecondaryValue(values);
  snapshot.set_covered_headcount(covered);
  snapshot.set_secondary_value(secondary);
  snapshot.set_objective_value(ObjectiveValue(covered, secondary));
  return snapshot;
}

SolutionSnapshot AssignmentModel::EmptySnapshot() const {
  SolutionSnapshot snapshot;
  for (int t = 0; t < num_slots(); ++t) snapshot.add_slots();
  snapshot.set_objective_value(0.0);
  snapshot.set_covered_headcount(0);
  snapshot.set_secondary_value(0);
  return snapshot;
}

}  // namespace labsched
