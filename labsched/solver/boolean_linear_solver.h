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

#ifndef LABSCHED_SOLVER_BOOLEAN_LINEAR_SOLVER_H_
#define LABSCHED_SOLVER_BOOLEAN_LINEAR_SOLVER_H_

#include <atomic>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "absl/types/span.h"

namespace labsched {

// Capability interface for 0-1 linear optimization:
//
//   maximize (or minimize)  sum_i c_i * x_i
//   subject to              lb_j <= sum_i a_ij * x_i <= ub_j  for each j
//                           x_i in {0, 1}
//
// All coefficients and bounds are integers. Clients build a model with
// AddBoolVar(), AddLinearConstraint() and SetObjective(), then call Solve()
// once. Implementations must stop within the time limit passed to Solve(),
// or as soon as the interruption boolean becomes true, and must only report
// strictly improving solutions through the callback.

struct LinearTerm {
  int variable;
  int64_t coefficient;
};

// A feasible assignment, as passed to the improvement callback.
struct BooleanSolution {
  std::vector<bool> values;
  int64_t objective_value = 0;
  double wall_time = 0.0;
};

class BooleanLinearSolver {
 public:
  // Mirrors the usual MIP result statuses.
  enum ResultStatus {
    // The search was completed and the solution is proven optimal.
    OPTIMAL,
    // A solution was found, but the search stopped before it could be proven
    // optimal (time limit, interruption or a solver specific limit).
    FEASIBLE,
    // The search was completed and no solution exists.
    INFEASIBLE,
    // The search stopped before any solution was found.
    NOT_SOLVED,
    // The solver failed for a reason unrelated to the model.
    ABNORMAL,
    // The model is malformed (bad variable index, empty bound range,
    // coefficients too large to be summed safely).
    MODEL_INVALID,
  };

  struct SolveResult {
    ResultStatus status = NOT_SOLVED;
    // Best solution found, empty if none. Indexed by variable.
    std::vector<bool> values;
    int64_t objective_value = 0;
    int64_t num_branches = 0;
    int num_solutions = 0;
    // True if the search was stopped by the time limit or the interruption
    // boolean.
    bool time_limit_reached = false;
    // True if the search was stopped by the interruption boolean.
    bool interrupted = false;
    double wall_time = 0.0;
    std::string message;
  };

  using SolutionCallback = std::function<void(const BooleanSolution&)>;

  static constexpr int64_t kInfinity = std::numeric_limits<int64_t>::max();

  virtual ~BooleanLinearSolver() = default;

  // Creates a new 0-1 variable and returns its index. Indices are dense and
  // start at 0.
  virtual int AddBoolVar(absl::string_view name) = 0;

  // Adds lower_bound <= sum(terms) <= upper_bound. Use -kInfinity or
  // kInfinity for a missing side.
  virtual void AddLinearConstraint(absl::Span<const LinearTerm> terms,
                                   int64_t lower_bound, int64_t upper_bound,
                                   absl::string_view name) = 0;

  // Replaces the objective. Variables not listed have a zero coefficient.
  virtual void SetObjective(absl::Span<const LinearTerm> terms,
                            bool maximize) = 0;

  // Solves the model. `interrupt` may be null. on_improvement may be null;
  // when set it is called for each strictly improving solution, in order and
  // never concurrently, possibly from a thread of the solver.
  virtual SolveResult Solve(double time_limit_seconds,
                            std::atomic<bool>* interrupt,
                            const SolutionCallback& on_improvement) = 0;

  virtual int num_variables() const = 0;
  virtual int num_constraints() const = 0;
};

std::string ResultStatusName(BooleanLinearSolver::ResultStatus status);

}  // namespace labsched

#endif  // LABSCHED_SOLVER_BOOLEAN_LINEAR_SOLVER_H_
