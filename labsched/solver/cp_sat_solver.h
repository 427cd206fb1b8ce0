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

#ifndef LABSCHED_SOLVER_CP_SAT_SOLVER_H_
#define LABSCHED_SOLVER_CP_SAT_SOLVER_H_

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "labsched/solver/boolean_linear_solver.h"
#include "ortools/sat/cp_model.h"

namespace labsched {

// BooleanLinearSolver on top of the CP-SAT solver. The model is accumulated in
// a CpModelBuilder and solved by SolveCpModel(). Improving solutions are
// relayed from a feasible solution observer, and the interruption boolean is
// registered as an external limit of the solver's TimeLimit.
//
// Modelling errors that CP-SAT cannot represent (unknown variable, empty
// bound range) are recorded and reported by Solve() as MODEL_INVALID.
class CpSatBooleanLinearSolver : public BooleanLinearSolver {
 public:
  explicit CpSatBooleanLinearSolver(absl::string_view solver_name);

  CpSatBooleanLinearSolver(const CpSatBooleanLinearSolver&) = delete;
  CpSatBooleanLinearSolver& operator=(const CpSatBooleanLinearSolver&) =
      delete;

  ~CpSatBooleanLinearSolver() override = default;

  int AddBoolVar(absl::string_view name) override;
  void AddLinearConstraint(absl::Span<const LinearTerm> terms,
                           int64_t lower_bound, int64_t upper_bound,
                           absl::string_view name) override;
  void SetObjective(absl::Span<const LinearTerm> terms,
                    bool maximize) override;
  SolveResult Solve(double time_limit_seconds, std::atomic<bool>* interrupt,
                    const SolutionCallback& on_improvement) override;

  int num_variables() const override { return variables_.size(); }
  int num_constraints() const override { return num_constraints_; }

  // Stops the search after this many conflicts; 0 means no limit. A search
  // stopped this way ends FEASIBLE or NOT_SOLVED without setting
  // time_limit_reached.
  void set_max_number_of_conflicts(int64_t max_number_of_conflicts) {
    max_number_of_conflicts_ = max_number_of_conflicts;
  }

  // 0 lets CP-SAT use every core. A single worker is deterministic.
  void set_num_workers(int num_workers) { num_workers_ = num_workers; }

  // Turns on the CP-SAT search log.
  void set_log_search_progress(bool log_search_progress) {
    log_search_progress_ = log_search_progress;
  }

  const std::string& GetName() const { return solver_name_; }
  const std::string& variable_name(int variable) const {
    return variable_names_[variable];
  }

 private:
  // Returns an empty string iff every term refers to an existing variable.
  std::string FindErrorInTerms(absl::Span<const LinearTerm> terms) const;
  operations_research::sat::LinearExpr ToLinearExpr(
      absl::Span<const LinearTerm> terms) const;

  const std::string solver_name_;
  operations_research::sat::CpModelBuilder builder_;
  std::vector<operations_research::sat::BoolVar> variables_;
  std::vector<std::string> variable_names_;
  int num_constraints_ = 0;
  bool maximize_ = true;
  // The first modelling error, if any.
  std::string model_error_;

  int64_t max_number_of_conflicts_ = 0;
  int num_workers_ = 1;
  bool log_search_progress_ = false;
};

}  // namespace labsched

#endif  // LABSCHED_SOLVER_CP_SAT_SOLVER_H_
