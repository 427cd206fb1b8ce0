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

#ifndef LABSCHED_SCHEDULING_SCHEDULING_ORCHESTRATOR_H_
#define LABSCHED_SCHEDULING_SCHEDULING_ORCHESTRATOR_H_

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>  // NOLINT

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/synchronization/notification.h"
#include "absl/time/time.h"
#include "labsched/base/timer.h"
#include "labsched/scheduling/assignment_model.h"
#include "labsched/scheduling/availability_index.h"
#include "labsched/scheduling/lab_scheduling.pb.h"
#include "labsched/solver/boolean_linear_solver.h"

namespace labsched {

// Runs one lab scheduling problem: validates it, builds the model, searches on
// a dedicated worker thread and produces the AssignmentReport.
//
// State machine:
//
//   kIdle -> kBuilding -> kSearching -> {kOptimal | kFeasible | kInfeasible |
//                                        kTimedOut} -> kDone
//
// kBuilding runs synchronously inside Start(). A ConfigurationError found
// there is returned by Start(), the state becomes kDone and no thread is
// started. Otherwise Start() returns immediately and the search runs until it
// completes, hits the time budget or is cancelled.
//
// Usage:
//   SchedulingOrchestrator orchestrator(problem, parameters);
//   RETURN_IF_ERROR(orchestrator.Start(
//       [](double objective, const SolutionSnapshot& snapshot,
//          absl::Duration elapsed, bool is_final) { ... }));
//   ...
//   ASSIGN_OR_RETURN(const AssignmentReport report, orchestrator.Wait());
//
// Each orchestrator owns its copy of the problem, its model and its solver;
// independent orchestrators can run concurrently.
class SchedulingOrchestrator {
 public:
  enum class State {
    kIdle,
    kBuilding,
    kSearching,
    kOptimal,
    kFeasible,
    kInfeasible,
    kTimedOut,
    kDone,
  };

  // Called on the worker thread for every strictly improving solution, then
  // exactly once with is_final = true and the final snapshot (the empty
  // assignment if nothing better was found). Not called if the run ends with
  // a SolverFailure.
  using ProgressCallback =
      std::function<void(double objective_value, const SolutionSnapshot&,
                         absl::Duration elapsed, bool is_final)>;

  using SolverFactory = std::function<std::unique_ptr<BooleanLinearSolver>(
      const SchedulingParameters&)>;

  // A CpSatBooleanLinearSolver honouring max_number_of_conflicts,
  // num_workers and log_search_progress.
  static SolverFactory DefaultSolverFactory();

  SchedulingOrchestrator(const LabSchedulingModel& problem,
                         const SchedulingParameters& parameters,
                         SolverFactory solver_factory = DefaultSolverFactory());

  SchedulingOrchestrator(const SchedulingOrchestrator&) = delete;
  SchedulingOrchestrator& operator=(const SchedulingOrchestrator&) = delete;

  // Requests cancellation and joins the worker.
  ~SchedulingOrchestrator();

  // May only be called once. `callback` may be null.
  absl::Status Start(ProgressCallback callback);

  // Cooperative: the search stops at its next check and the run ends with the
  // best solution found so far, as TIMED_OUT with termination reason
  // CANCELLED. Has no effect once the search is over. Thread-safe.
  void RequestCancellation();

  // Blocks until the run is over and returns its report, the error returned
  // by Start(), or a SolverFailure if the search could not produce a valid
  // result or threw. Must not be called concurrently from several threads.
  absl::StatusOr<AssignmentReport> Wait();

  bool IsDone() const;
  State state() const;

  // The terminal state of the run (kOptimal ... kTimedOut), or nullopt while
  // running and after a failure.
  std::optional<State> outcome() const;

  // Valid once Start() succeeded.
  double time_budget_seconds() const { return time_budget_seconds_; }

  static absl::string_view StateName(State state);

 private:
  absl::Status Build();
  void Search();
  // Runs the solver and packages its result. May throw.
  absl::StatusOr<AssignmentReport> SearchAndReport(State* outcome);
  // Checks and packages the result of the solver.
  absl::StatusOr<AssignmentReport> MakeReport(
      const BooleanLinearSolver::SolveResult& result,
      const SolutionSnapshot& last_improvement, State* outcome) const;
  void SetState(State state) ABSL_LOCKS_EXCLUDED(mutex_);
  void Finish(absl::StatusOr<AssignmentReport> result,
              std::optional<State> outcome) ABSL_LOCKS_EXCLUDED(mutex_);

  const LabSchedulingModel problem_;
  const SchedulingParameters parameters_;
  const SolverFactory solver_factory_;

  // Set by Start(), read-only afterwards.
  std::optional<AvailabilityIndex> index_;
  std::optional<AssignmentModel> model_;
  std::unique_ptr<BooleanLinearSolver> solver_;
  // Started when the search budget starts.
  WallTimer timer_;
  ProgressCallback callback_;
  double time_budget_seconds_ = 0.0;

  std::atomic<bool> cancellation_requested_{false};
  std::thread worker_;
  absl::Notification done_;

  mutable absl::Mutex mutex_;
  State state_ ABSL_GUARDED_BY(mutex_) = State::kIdle;
  std::optional<State> outcome_ ABSL_GUARDED_BY(mutex_);
  absl::StatusOr<AssignmentReport> result_ ABSL_GUARDED_BY(mutex_);
};

// The search time budget: max_time_in_seconds when positive, otherwise 60
// seconds plus one second per 100 decision variables, capped at 600 seconds.
double ComputeTimeBudgetSeconds(const SchedulingParameters& parameters,
                                int num_variables);

// Runs a whole orchestrator synchronously.
absl::StatusOr<AssignmentReport> SolveLabScheduling(
    const LabSchedulingModel& problem, const SchedulingParameters& parameters,
    SchedulingOrchestrator::ProgressCallback callback = nullptr);

}  // namespace labsched

#endif  // LABSCHED_SCHEDULING_SCHEDULING_ORCHESTRATOR_H_
