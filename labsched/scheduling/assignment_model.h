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

#ifndef LABSCHED_SCHEDULING_ASSIGNMENT_MODEL_H_
#define LABSCHED_SCHEDULING_ASSIGNMENT_MODEL_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "labsched/scheduling/availability_index.h"
#include "labsched/scheduling/lab_scheduling.pb.h"
#include "labsched/solver/boolean_linear_solver.h"

namespace labsched {

// The key of the lab a slot belongs to for the per staff lab cap: its label
// when slots are grouped by label, or a key unique to the slot otherwise (and
// for unlabelled slots).
std::string LabGroupKey(const Slot& slot, int slot_index,
                        bool group_slots_by_label);

// The 0-1 model of a lab staffing problem, loaded into a BooleanLinearSolver.
//
// Decision variables:
//   x[s][t] = 1 iff staff member s works slot t. Only created when s is
//             available for t and the duration of t fits both the hired
//             hours of s and the daily cap.
//   y[s][g] = 1 iff s works at least one slot of lab g. Only created for labs
//             with at least two eligible slots, and only when the lab cap
//             could bind.
//   u[s][k] = 1 iff s works at least k * balance_step_minutes. Only with the
//             BALANCE_UTILIZATION secondary objective.
//
// Constraints, each emitted only when it can bind:
//   coverage       sum_s x[s][t] <= required(t)
//   daily cap      sum_{t on day d} duration(t) x[s][t] <= daily cap
//   total cap      sum_t duration(t) x[s][t] <= hired(s)
//   lab cap        number of labs worked by s <= max_labs_per_staff
//   no overlap     x[s][a] + x[s][b] <= 1 for overlapping a, b on one day
//
// Objective: maximize W * (covered headcount) + secondary, where W is one
// more than the largest possible secondary value, so that one more covered
// staff position always beats any secondary improvement. Giving every slot a
// headcount upper bound instead of an equality keeps the empty assignment
// feasible: partial coverage is never infeasible.
class AssignmentModel {
 public:
  struct AssignmentVariable {
    int staff;
    int slot;
    int variable;
    int duration_minutes;
  };

  struct Statistics {
    int num_assignment_variables = 0;
    int num_unavailable_pairs = 0;
    int num_too_long_pairs = 0;
    int num_unfillable_slots = 0;
    int num_lab_variables = 0;
    int num_balance_variables = 0;
    int num_coverage_constraints = 0;
    int num_daily_cap_constraints = 0;
    int num_total_cap_constraints = 0;
    int num_lab_cap_constraints = 0;
    int num_overlap_constraints = 0;
    int num_balance_constraints = 0;
  };

  // Validates the problem and the parameters, then creates the variables,
  // constraints and objective in `solver`, which must be empty. Returns a
  // ConfigurationError, without touching the solver, if the problem or the
  // parameters are invalid or do not match the index.
  static absl::StatusOr<AssignmentModel> Build(
      const LabSchedulingModel& problem, const AvailabilityIndex& index,
      const SchedulingParameters& parameters, BooleanLinearSolver* solver);

  // Converts a solver assignment (indexed by solver variable) into a
  // snapshot. The objective and secondary values are recomputed from the
  // assignment. solution_index and wall_time_seconds are left to the caller.
  SolutionSnapshot DecodeSolution(const std::vector<bool>& values) const;

  // The empty assignment, which is always feasible.
  SolutionSnapshot EmptySnapshot() const;

  // Objective value of the given assignment: W * headcount + secondary.
  double ObjectiveValue(int64_t covered_headcount,
                        int64_t secondary_value) const {
    return static_cast<double>(headcount_weight_ * covered_headcount +
                               secondary_value);
  }

  // True if no staff member can ever be assigned to the slot.
  bool IsUnfillable(int slot) const { return unfillable_[slot]; }

  absl::Span<const AssignmentVariable> assignment_variables() const {
    return assignment_variables_;
  }
  int64_t headcount_weight() const { return headcount_weight_; }
  const Statistics& statistics() const { return statistics_; }
  int num_variables() const { return num_variables_; }
  int num_constraints() const { return num_constraints_; }
  int num_slots() const { return unfillable_.size(); }

 private:
  struct BalanceStep {
    int variable;
    int64_t weight;
  };

  AssignmentModel() = default;

  // Sum of the secondary objective terms set in `values`.
  int64_t SecondaryValue(const std::vector<bool>& values) const;

  SchedulingParameters::SecondaryObjective secondary_objective_ =
      SchedulingParameters::NO_SECONDARY_OBJECTIVE;
  int64_t headcount_weight_ = 1;
  std::vector<AssignmentVariable> assignment_variables_;
  std::vector<BalanceStep> balance_steps_;
  std::vector<bool> unfillable_;
  Statistics statistics_;
  int num_variables_ = 0;
  int num_constraints_ = 0;
};

}  // namespace labsched

#endif  // LABSCHED_SCHEDULING_ASSIGNMENT_MODEL_H_
