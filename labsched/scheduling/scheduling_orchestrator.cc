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

#include "labsched/scheduling/scheduling_orchestrator.h"

#include <algorithm>
#include <exception>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <system_error>  // NOLINT
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "labsched/base/logging.h"
#include "labsched/base/status_macros.h"
#include "labsched/scheduling/assignment_model.h"
#include "labsched/scheduling/assignment_report.h"
#include "labsched/scheduling/availability_index.h"
#include "labsched/scheduling/lab_scheduling.pb.h"
#include "labsched/scheduling/model_validator.h"
#include "labsched/scheduling/scheduling_errors.h"
#include "labsched/solver/boolean_linear_solver.h"
#include "labsched/solver/cp_sat_solver.h"

namespace labsched {

namespace {

constexpr double kBaseTimeBudgetSeconds = 60.0;
constexpr double kVariablesPerExtraSecond = 100.0;
constexpr double kMaxTimeBudgetSeconds = 600.0;

}  // namespace

double ComputeTimeBudgetSeconds(const SchedulingParameters& parameters,
                                int num_variables) {
  if (parameters.max_time_in_seconds() > 0) {
    return parameters.max_time_in_seconds();
  }
  return std::min(kMaxTimeBudgetSeconds,
                  kBaseTimeBudgetSeconds +
                      num_variables / kVariablesPerExtraSecond);
}

SchedulingOrchestrator::SolverFactory
SchedulingOrchestrator::DefaultSolverFactory() {
  return [](const SchedulingParameters& parameters) {
    auto solver = std::make_unique<CpSatBooleanLinearSolver>("lab_scheduling");
    solver->set_max_number_of_conflicts(parameters.max_number_of_conflicts());
    solver->set_num_workers(parameters.num_workers());
    solver->set_log_search_progress(parameters.log_search_progress());
    return std::unique_ptr<BooleanLinearSolver>(std::move(solver));
  };
}

absl::string_view SchedulingOrchestrator::StateName(State state) {
  switch (state) {
    case State::kIdle:
      return "IDLE";
    case State::kBuilding:
      return "BUILDING";
    case State::kSearching:
      return "SEARCHING";
    case State::kOptimal:
      return "OPTIMAL";
    case State::kFeasible:
      return "FEASIBLE";
    case State::kInfeasible:
      return "INFEASIBLE";
    case State::kTimedOut:
      return "TIMED_OUT";
    case State::kDone:
      return "DONE";
  }
  return "UNKNOWN";
}

SchedulingOrchestrator::SchedulingOrchestrator(
    const LabSchedulingModel& problem, const SchedulingParameters& parameters,
    SolverFactory solver_factory)
    : problem_(problem),
      parameters_(parameters),
      solver_factory_(std::move(solver_factory)) {}

SchedulingOrchestrator::~SchedulingOrchestrator() {
  RequestCancellation();
  if (worker_.joinable()) worker_.join();
}

absl::Status SchedulingOrchestrator::Start(ProgressCallback callback) {
  {
    absl::MutexLock lock(&mutex_);
    if (state_ != State::kIdle) {
      return FailedPreconditionErrorBuilder()
             << "Start() called in state " << StateName(state_);
    }
    state_ = State::kBuilding;
  }
  callback_ = std::move(callback);
  const absl::Status status = Build();
  if (!status.ok()) {
    LOG(WARNING) << "Lab scheduling not started: " << status;
    Finish(status, std::nullopt);
    return status;
  }
  SetState(State::kSearching);
  try {
    worker_ = std::thread([this] { Search(); });
  } catch (const std::system_error& e) {
    const absl::Status failure =
        SolverFailureBuilder() << "cannot start the search thread: "
                               << e.what();
    LOG(ERROR) << "Lab scheduling not started: " << failure;
    Finish(failure, std::nullopt);
    return failure;
  }
  return absl::OkStatus();
}

absl::Status SchedulingOrchestrator::Build() {
  // No solver object is created before the input is known to be valid.
  RETURN_IF_ERROR(ValidateLabSchedulingModel(problem_, parameters_));
  ASSIGN_OR_RETURN(AvailabilityIndex index,
                   AvailabilityIndex::Create(problem_));
  index_.emplace(std::move(index));

  solver_ = solver_factory_(parameters_);
  if (solver_ == nullptr) {
    return SolverFailureBuilder() << "the solver factory returned no solver";
  }
  ASSIGN_OR_RETURN(AssignmentModel model,
                   AssignmentModel::Build(problem_, *index_, parameters_,
                                          solver_.get()));
  model_.emplace(std::move(model));

  time_budget_seconds_ =
      ComputeTimeBudgetSeconds(parameters_, model_->num_variables());
  timer_.Start();

  const AssignmentModel::Statistics& stats = model_->statistics();
  LOG(INFO) << "Lab scheduling model: " << problem_.staff_size()
            << " staff, " << problem_.slots_size() << " slots, "
            << model_->num_variables() << " variables ("
            << stats.num_assignment_variables << " assignments), "
            << model_->num_constraints() << " constraints, "
            << stats.num_unfillable_slots << " unfillable slots, time budget "
            << time_budget_seconds_ << "s";
  return absl::OkStatus();
}

void SchedulingOrchestrator::Search() {
  State outcome = State::kDone;
  absl::StatusOr<AssignmentReport> report;
  try {
    report = SearchAndReport(&outcome);
  } catch (const std::exception& e) {
    report = absl::Status(SolverFailureBuilder()
                          << "the search threw an exception: " << e.what());
  }
  if (!report.ok()) {
    LOG(ERROR) << "Lab scheduling failed: " << report.status();
    Finish(report.status(), std::nullopt);
    return;
  }
  Finish(std::move(report), outcome);
}

absl::StatusOr<AssignmentReport> SchedulingOrchestrator::SearchAndReport(
    State* outcome) {
  double last_reported_value = -std::numeric_limits<double>::infinity();
  int num_improvements = 0;
  bool malformed_solution = false;
  std::string callback_error;
  SolutionSnapshot last_improvement = model_->EmptySnapshot();

  const auto on_improvement = [&](const BooleanSolution& solution) {
    if (malformed_solution || !callback_error.empty()) return;
    if (static_cast<int>(solution.values.size()) != model_->num_variables()) {
      malformed_solution = true;
      return;
    }
    SolutionSnapshot snapshot = model_->DecodeSolution(solution.values);
    if (snapshot.objective_value() <= last_reported_value) return;
    snapshot.set_solution_index(++num_improvements);
    snapshot.set_wall_time_seconds(timer_.Get());
    last_reported_value = snapshot.objective_value();
    last_improvement = snapshot;
    VLOG(1) << "Improvement #" << num_improvements << ": objective "
            << snapshot.objective_value() << ", covered "
            << snapshot.covered_headcount();
    if (callback_ == nullptr) return;
    try {
      callback_(snapshot.objective_value(), snapshot,
                absl::Seconds(snapshot.wall_time_seconds()),
                /*is_final=*/false);
    } catch (const std::exception& e) {
      // Exceptions must not unwind through the solver.
      callback_error = e.what();
      RequestCancellation();
    }
  };

  const BooleanLinearSolver::SolveResult result =
      solver_->Solve(time_budget_seconds_, &cancellation_requested_,
                     on_improvement);
  if (!callback_error.empty()) {
    return SolverFailureBuilder()
           << "the progress callback threw an exception: " << callback_error;
  }
  if (malformed_solution) {
    return SolverFailureBuilder()
           << "the solver reported a solution of the wrong size";
  }
  ASSIGN_OR_RETURN(AssignmentReport report,
                   MakeReport(result, last_improvement, outcome));

  SetState(*outcome);
  LOG(INFO) << "Lab scheduling done: "
            << SchedulingStatus_Name(report.status()) << " ("
            << TerminationReason_Name(report.termination_reason())
            << "), covered " << report.covered_headcount() << " of "
            << report.required_headcount() << " positions in "
            << report.statistics().wall_time_seconds() << "s";
  if (callback_ != nullptr) {
    const SolutionSnapshot& final_snapshot = report.final_snapshot();
    callback_(final_snapshot.objective_value(), final_snapshot,
              absl::Seconds(report.statistics().wall_time_seconds()),
              /*is_final=*/true);
  }
  return report;
}

absl::StatusOr<AssignmentReport> SchedulingOrchestrator::MakeReport(
    const BooleanLinearSolver::SolveResult& result,
    const SolutionSnapshot& last_improvement, State* outcome) const {
  SchedulingStatus status = SCHEDULING_STATUS_UNSPECIFIED;
  TerminationReason reason = TERMINATION_REASON_UNSPECIFIED;
  switch (result.status) {
    case BooleanLinearSolver::OPTIMAL:
      status = OPTIMAL;
      reason = SEARCH_COMPLETED;
      *outcome = State::kOptimal;
      break;
    case BooleanLinearSolver::FEASIBLE:
    case BooleanLinearSolver::NOT_SOLVED:
      if (result.time_limit_reached) {
        status = TIMED_OUT;
        reason = result.interrupted ? CANCELLED : TIME_LIMIT;
        *outcome = State::kTimedOut;
      } else {
        status = FEASIBLE;
        reason = SEARCH_LIMIT;
        *outcome = State::kFeasible;
      }
      break;
    case BooleanLinearSolver::INFEASIBLE:
      status = INFEASIBLE;
      reason = SEARCH_COMPLETED;
      *outcome = State::kInfeasible;
      break;
    case BooleanLinearSolver::ABNORMAL:
    case BooleanLinearSolver::MODEL_INVALID:
      return SolverFailureBuilder()
             << "search ended with status " << ResultStatusName(result.status)
             << (result.message.empty() ? "" : ": ") << result.message;
  }

  SolutionSnapshot final_snapshot;
  if (result.status == BooleanLinearSolver::INFEASIBLE ||
      result.values.empty()) {
    final_snapshot = model_->EmptySnapshot();
  } else if (static_cast<int>(result.values.size()) !=
             model_->num_variables()) {
    return SolverFailureBuilder()
           << "the solver returned " << result.values.size()
           << " values for " << model_->num_variables() << " variables";
  } else {
    final_snapshot = model_->DecodeSolution(result.values);
    final_snapshot.set_solution_index(last_improvement.solution_index());
  }
  final_snapshot.set_wall_time_seconds(timer_.Get());

  RETURN_IF_ERROR(VerifySolutionSnapshot(problem_, *index_, parameters_,
                                         final_snapshot))
      << "final solution";
  AssignmentReport report =
      ExtractAssignmentReport(problem_, *model_, final_snapshot, parameters_);
  report.set_status(status);
  report.set_termination_reason(reason);
  report.set_proven_optimal(status == OPTIMAL);

  const AssignmentModel::Statistics& model_stats = model_->statistics();
  AssignmentReport::Statistics* stats = report.mutable_statistics();
  stats->set_num_variables(model_->num_variables());
  stats->set_num_constraints(model_->num_constraints());
  stats->set_num_pruned_pairs(model_stats.num_unavailable_pairs +
                              model_stats.num_too_long_pairs);
  stats->set_num_branches(result.num_branches);
  stats->set_num_solutions(result.num_solutions);
  stats->set_wall_time_seconds(final_snapshot.wall_time_seconds());

  RETURN_IF_ERROR(
      VerifyAssignmentReport(problem_, *index_, parameters_, report));
  return report;
}

void SchedulingOrchestrator::SetState(State state) {
  absl::MutexLock lock(&mutex_);
  state_ = state;
}

void SchedulingOrchestrator::Finish(absl::StatusOr<AssignmentReport> result,
                                    std::optional<State> outcome) {
  {
    absl::MutexLock lock(&mutex_);
    result_ = std::move(result);
    outcome_ = outcome;
    state_ = State::kDone;
  }
  done_.Notify();
}

void SchedulingOrchestrator::RequestCancellation() {
  cancellation_requested_.store(true, std::memory_order_relaxed);
}

absl::StatusOr<AssignmentReport> SchedulingOrchestrator::Wait() {
  {
    absl::MutexLock lock(&mutex_);
    if (state_ == State::kIdle) {
      return FailedPreconditionErrorBuilder() << "Wait() called before Start()";
    }
  }
  done_.WaitForNotification();
  if (worker_.joinable()) worker_.join();
  absl::MutexLock lock(&mutex_);
  return result_;
}

bool SchedulingOrchestrator::IsDone() const {
  return done_.HasBeenNotified();
}

SchedulingOrchestrator::State SchedulingOrchestrator::state() const {
  absl::MutexLock lock(&mutex_);
  return state_;
}

std::optional<SchedulingOrchestrator::State> SchedulingOrchestrator::outcome()
    const {
  absl::MutexLock lock(&mutex_);
  return outcome_;
}

absl::StatusOr<AssignmentReport> SolveLabScheduling(
    const LabSchedulingModel& problem, const SchedulingParameters& parameters,
    SchedulingOrchestrator::ProgressCallback callback) {
  SchedulingOrchestrator orchestrator(problem, parameters);
  RETURN_IF_ERROR(orchestrator.Start(std::move(callback)));
  return orchestrator.Wait();
}

}  // namespace labsched
