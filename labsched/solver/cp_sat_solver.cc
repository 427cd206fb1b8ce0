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

#include "labsched/solver/cp_sat_solver.h"

#include <atomic>
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "labsched/base/logging.h"
#include "labsched/solver/boolean_linear_solver.h"
#include "ortools/sat/cp_model.h"
#include "ortools/sat/cp_model.pb.h"
#include "ortools/sat/cp_model_solver.h"
#include "ortools/sat/model.h"
#include "ortools/sat/sat_parameters.pb.h"
#include "ortools/util/sorted_interval_list.h"
#include "ortools/util/time_limit.h"

namespace labsched {

namespace sat = ::operations_research::sat;
using ::operations_research::Domain;
using ::operations_research::TimeLimit;

namespace {

BooleanLinearSolver::ResultStatus ToResultStatus(sat::CpSolverStatus status) {
  switch (status) {
    case sat::CpSolverStatus::UNKNOWN:
      return BooleanLinearSolver::NOT_SOLVED;
    case sat::CpSolverStatus::MODEL_INVALID:
      return BooleanLinearSolver::MODEL_INVALID;
    case sat::CpSolverStatus::FEASIBLE:
      return BooleanLinearSolver::FEASIBLE;
    case sat::CpSolverStatus::INFEASIBLE:
      return BooleanLinearSolver::INFEASIBLE;
    case sat::CpSolverStatus::OPTIMAL:
      return BooleanLinearSolver::OPTIMAL;
    default: {
    }
  }
  return BooleanLinearSolver::ABNORMAL;
}

// The objective is integral, CP-SAT reports it as a double.
int64_t IntegralObjective(const sat::CpSolverResponse& response) {
  return static_cast<int64_t>(std::llround(response.objective_value()));
}

}  // namespace

CpSatBooleanLinearSolver::CpSatBooleanLinearSolver(
    absl::string_view solver_name)
    : solver_name_(solver_name) {
  builder_.SetName(solver_name_);
}

int CpSatBooleanLinearSolver::AddBoolVar(absl::string_view name) {
  variables_.push_back(builder_.NewBoolVar().WithName(std::string(name)));
  variable_names_.emplace_back(name);
  return variables_.size() - 1;
}

std::string CpSatBooleanLinearSolver::FindErrorInTerms(
    absl::Span<const LinearTerm> terms) const {
  for (const LinearTerm& term : terms) {
    if (term.variable < 0 || term.variable >= num_variables()) {
      return absl::StrCat("unknown variable ", term.variable);
    }
  }
  return "";
}

sat::LinearExpr CpSatBooleanLinearSolver::ToLinearExpr(
    absl::Span<const LinearTerm> terms) const {
  std::vector<sat::BoolVar> variables;
  std::vector<int64_t> coefficients;
  variables.reserve(terms.size());
  coefficients.reserve(terms.size());
  for (const LinearTerm& term : terms) {
    variables.push_back(variables_[term.variable]);
    coefficients.push_back(term.coefficient);
  }
  return sat::LinearExpr::WeightedSum(variables, coefficients);
}

void CpSatBooleanLinearSolver::AddLinearConstraint(
    absl::Span<const LinearTerm> terms, int64_t lower_bound,
    int64_t upper_bound, absl::string_view name) {
  ++num_constraints_;
  if (!model_error_.empty()) return;
  const std::string error = FindErrorInTerms(terms);
  if (!error.empty()) {
    model_error_ = absl::StrCat("Constraint '", name, "': ", error);
    return;
  }
  if (lower_bound > upper_bound) {
    model_error_ = absl::StrCat("Constraint '", name, "': empty range [",
                                lower_bound, ", ", upper_bound, "]");
    return;
  }
  const bool has_lower_bound = lower_bound != -kInfinity;
  const bool has_upper_bound = upper_bound != kInfinity;
  if (!has_lower_bound && !has_upper_bound) return;
  const sat::LinearExpr expr = ToLinearExpr(terms);
  if (!has_lower_bound) {
    builder_.AddLessOrEqual(expr, upper_bound).WithName(std::string(name));
  } else if (!has_upper_bound) {
    builder_.AddGreaterOrEqual(expr, lower_bound).WithName(std::string(name));
  } else {
    builder_.AddLinearConstraint(expr, Domain(lower_bound, upper_bound))
        .WithName(std::string(name));
  }
}

void CpSatBooleanLinearSolver::SetObjective(absl::Span<const LinearTerm> terms,
                                            bool maximize) {
  const std::string error = FindErrorInTerms(terms);
  if (!error.empty()) {
    if (model_error_.empty()) model_error_ = absl::StrCat("Objective: ", error);
    return;
  }
  maximize_ = maximize;
  if (maximize) {
    builder_.Maximize(ToLinearExpr(terms));
  } else {
    builder_.Minimize(ToLinearExpr(terms));
  }
}

BooleanLinearSolver::SolveResult CpSatBooleanLinearSolver::Solve(
    double time_limit_seconds, std::atomic<bool>* interrupt,
    const SolutionCallback& on_improvement) {
  SolveResult result;
  if (!model_error_.empty()) {
    result.status = MODEL_INVALID;
    result.message = model_error_;
    return result;
  }

  sat::SatParameters parameters;
  parameters.set_max_time_in_seconds(time_limit_seconds);
  parameters.set_num_workers(num_workers_);
  parameters.set_log_search_progress(log_search_progress_);
  if (max_number_of_conflicts_ > 0) {
    parameters.set_max_number_of_conflicts(max_number_of_conflicts_);
  }

  sat::Model sat_model;
  sat_model.Add(sat::NewSatParameters(parameters));
  if (interrupt != nullptr) {
    sat_model.GetOrCreate<TimeLimit>()->RegisterExternalBooleanAsLimit(
        interrupt);
  }

  const auto values_of = [this](const sat::CpSolverResponse& response) {
    std::vector<bool> values(variables_.size());
    for (int i = 0; i < variables_.size(); ++i) {
      values[i] = sat::SolutionBooleanValue(response, variables_[i]);
    }
    return values;
  };

  // Observers are called one at a time, under the solver's response lock.
  int64_t best_objective = 0;
  sat_model.Add(sat::NewFeasibleSolutionObserver(
      [&](const sat::CpSolverResponse& response) {
        const int64_t objective = IntegralObjective(response);
        if (result.num_solutions > 0 &&
            (maximize_ ? objective <= best_objective
                       : objective >= best_objective)) {
          return;
        }
        ++result.num_solutions;
        best_objective = objective;
        VLOG(1) << solver_name_ << ": solution #" << result.num_solutions
                << " with objective " << objective;
        if (on_improvement == nullptr) return;
        BooleanSolution solution;
        solution.values = values_of(response);
        solution.objective_value = objective;
        solution.wall_time = response.wall_time();
        on_improvement(solution);
      }));

  const sat::CpSolverResponse response =
      sat::SolveCpModel(builder_.Build(), &sat_model);

  result.status = ToResultStatus(response.status());
  result.num_branches = response.num_branches();
  result.wall_time = response.wall_time();
  result.interrupted = interrupt != nullptr && interrupt->load();
  result.time_limit_reached =
      result.interrupted || sat_model.GetOrCreate<TimeLimit>()->LimitReached();
  VLOG(2) << solver_name_ << ": " << sat::CpSolverStatus_Name(response.status())
          << " after " << result.num_branches << " branches and "
          << response.num_conflicts() << " conflicts";
  if (result.status == OPTIMAL || result.status == FEASIBLE) {
    result.values = values_of(response);
    result.objective_value = IntegralObjective(response);
  } else if (result.status == MODEL_INVALID) {
    result.message = response.solution_info();
  }
  return result;
}

}  // namespace labsched
