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
#include <cstdint>
#include <limits>
#include <random>
#include <vector>

#include "absl/random/distributions.h"
#include "gtest/gtest.h"
#include "labsched/base/gmock.h"
#include "labsched/solver/boolean_linear_solver.h"

namespace labsched {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

constexpr double kNoTimeLimit = std::numeric_limits<double>::infinity();

// maximize 10 x0 + 13 x1 + 7 x2 + 8 x3
// s.t.     3 x0 + 4 x1 + 2 x2 + 3 x3 <= 7
void BuildKnapsack(BooleanLinearSolver* solver) {
  for (int i = 0; i < 4; ++i) solver->AddBoolVar("x");
  solver->AddLinearConstraint({{0, 3}, {1, 4}, {2, 2}, {3, 3}},
                              -BooleanLinearSolver::kInfinity, 7, "capacity");
  solver->SetObjective({{0, 10}, {1, 13}, {2, 7}, {3, 8}}, /*maximize=*/true);
}

TEST(CpSatBooleanLinearSolverTest, SolvesSmallKnapsackToOptimality) {
  CpSatBooleanLinearSolver solver("knapsack");
  BuildKnapsack(&solver);
  EXPECT_EQ(solver.num_variables(), 4);
  EXPECT_EQ(solver.num_constraints(), 1);
  const BooleanLinearSolver::SolveResult result =
      solver.Solve(kNoTimeLimit, nullptr, nullptr);
  EXPECT_EQ(result.status, BooleanLinearSolver::OPTIMAL);
  EXPECT_EQ(result.objective_value, 23);
  EXPECT_THAT(result.values, ElementsAre(true, true, false, false));
  EXPECT_GE(result.num_solutions, 1);
  EXPECT_FALSE(result.time_limit_reached);
  EXPECT_FALSE(result.interrupted);
}

TEST(CpSatBooleanLinearSolverTest, EmptyModelIsOptimal) {
  CpSatBooleanLinearSolver solver("empty");
  const BooleanLinearSolver::SolveResult result =
      solver.Solve(kNoTimeLimit, nullptr, nullptr);
  EXPECT_EQ(result.status, BooleanLinearSolver::OPTIMAL);
  EXPECT_EQ(result.objective_value, 0);
  EXPECT_TRUE(result.values.empty());
}

TEST(CpSatBooleanLinearSolverTest, DetectsInfeasibility) {
  CpSatBooleanLinearSolver solver("infeasible");
  solver.AddBoolVar("a");
  solver.AddBoolVar("b");
  EXPECT_EQ(solver.GetName(), "infeasible");
  EXPECT_EQ(solver.variable_name(1), "b");
  solver.AddLinearConstraint({{0, 1}, {1, 1}}, 3,
                             BooleanLinearSolver::kInfinity, "too_many");
  solver.SetObjective({{0, 1}}, /*maximize=*/true);
  const BooleanLinearSolver::SolveResult result =
      solver.Solve(kNoTimeLimit, nullptr, nullptr);
  EXPECT_EQ(result.status, BooleanLinearSolver::INFEASIBLE);
  EXPECT_EQ(result.num_solutions, 0);
  EXPECT_TRUE(result.values.empty());
}

TEST(CpSatBooleanLinearSolverTest, OddCycleIsInfeasible) {
  // a + b = 1, a + c = 1, b + c = 1 has no 0-1 solution.
  CpSatBooleanLinearSolver solver("odd_cycle");
  for (int i = 0; i < 3; ++i) solver.AddBoolVar("v");
  solver.AddLinearConstraint({{0, 1}, {1, 1}}, 1, 1, "ab");
  solver.AddLinearConstraint({{0, 1}, {2, 1}}, 1, 1, "ac");
  solver.AddLinearConstraint({{1, 1}, {2, 1}}, 1, 1, "bc");
  EXPECT_EQ(solver.Solve(kNoTimeLimit, nullptr, nullptr).status,
            BooleanLinearSolver::INFEASIBLE);
}

TEST(CpSatBooleanLinearSolverTest, Minimizes) {
  CpSatBooleanLinearSolver solver("minimize");
  solver.AddBoolVar("cheap");
  solver.AddBoolVar("expensive");
  solver.AddLinearConstraint({{0, 1}, {1, 1}}, 1,
                             BooleanLinearSolver::kInfinity, "cover");
  solver.SetObjective({{0, 1}, {1, 2}}, /*maximize=*/false);
  const BooleanLinearSolver::SolveResult result =
      solver.Solve(kNoTimeLimit, nullptr, nullptr);
  EXPECT_EQ(result.status, BooleanLinearSolver::OPTIMAL);
  EXPECT_EQ(result.objective_value, 1);
  EXPECT_THAT(result.values, ElementsAre(true, false));
}

TEST(CpSatBooleanLinearSolverTest, NegativeCoefficients) {
  // x0 - x1 >= 0 means x1 implies x0; x0 is penalized.
  CpSatBooleanLinearSolver solver("implication");
  solver.AddBoolVar("x0");
  solver.AddBoolVar("x1");
  solver.AddLinearConstraint({{0, 1}, {1, -1}}, 0,
                             BooleanLinearSolver::kInfinity, "x1_implies_x0");
  solver.SetObjective({{0, -2}, {1, 5}}, /*maximize=*/true);
  const BooleanLinearSolver::SolveResult result =
      solver.Solve(kNoTimeLimit, nullptr, nullptr);
  EXPECT_EQ(result.status, BooleanLinearSolver::OPTIMAL);
  EXPECT_EQ(result.objective_value, 3);
  EXPECT_THAT(result.values, ElementsAre(true, true));
}

TEST(CpSatBooleanLinearSolverTest, CardinalityConstraint) {
  CpSatBooleanLinearSolver solver("cardinality");
  std::vector<LinearTerm> ones;
  std::vector<LinearTerm> weights;
  for (int i = 0; i < 5; ++i) {
    const int var = solver.AddBoolVar("x");
    ones.push_back({var, 1});
    weights.push_back({var, i + 1});
  }
  solver.AddLinearConstraint(ones, -BooleanLinearSolver::kInfinity, 2,
                             "at_most_two");
  solver.SetObjective(weights, /*maximize=*/true);
  const BooleanLinearSolver::SolveResult result =
      solver.Solve(kNoTimeLimit, nullptr, nullptr);
  EXPECT_EQ(result.status, BooleanLinearSolver::OPTIMAL);
  EXPECT_EQ(result.objective_value, 9);
  EXPECT_THAT(result.values, ElementsAre(false, false, false, true, true));
}

TEST(CpSatBooleanLinearSolverTest, CallbackSeesStrictlyImprovingSolutions) {
  CpSatBooleanLinearSolver solver("callback");
  solver.AddBoolVar("big");
  solver.AddBoolVar("small_a");
  solver.AddBoolVar("small_b");
  solver.AddLinearConstraint({{0, 6}, {1, 5}, {2, 5}},
                             -BooleanLinearSolver::kInfinity, 10, "capacity");
  solver.SetObjective({{0, 7}, {1, 6}, {2, 6}}, /*maximize=*/true);

  std::vector<int64_t> objectives;
  const BooleanLinearSolver::SolveResult result = solver.Solve(
      kNoTimeLimit, nullptr, [&objectives](const BooleanSolution& solution) {
        EXPECT_EQ(solution.values.size(), 3);
        objectives.push_back(solution.objective_value);
      });
  EXPECT_EQ(result.status, BooleanLinearSolver::OPTIMAL);
  EXPECT_EQ(result.objective_value, 12);
  ASSERT_EQ(objectives.size(), result.num_solutions);
  ASSERT_GE(objectives.size(), 1);
  EXPECT_EQ(objectives.back(), 12);
  for (int i = 1; i < objectives.size(); ++i) {
    EXPECT_GT(objectives[i], objectives[i - 1]);
  }
}

TEST(CpSatBooleanLinearSolverTest, InterruptionBeforeTheSearch) {
  CpSatBooleanLinearSolver solver("interrupted");
  BuildKnapsack(&solver);
  std::atomic<bool> stop(true);
  const BooleanLinearSolver::SolveResult result =
      solver.Solve(kNoTimeLimit, &stop, nullptr);
  EXPECT_NE(result.status, BooleanLinearSolver::OPTIMAL);
  EXPECT_TRUE(result.time_limit_reached);
  EXPECT_TRUE(result.interrupted);
}

TEST(CpSatBooleanLinearSolverTest, ZeroTimeLimit) {
  CpSatBooleanLinearSolver solver("no_time");
  BuildKnapsack(&solver);
  const BooleanLinearSolver::SolveResult result =
      solver.Solve(0.0, nullptr, nullptr);
  EXPECT_NE(result.status, BooleanLinearSolver::OPTIMAL);
  EXPECT_TRUE(result.time_limit_reached);
  EXPECT_FALSE(result.interrupted);
}

TEST(CpSatBooleanLinearSolverTest, RejectsUnknownVariable) {
  CpSatBooleanLinearSolver solver("invalid");
  solver.AddBoolVar("x");
  solver.AddLinearConstraint({{3, 1}}, 0, 1, "bad_index");
  const BooleanLinearSolver::SolveResult result =
      solver.Solve(kNoTimeLimit, nullptr, nullptr);
  EXPECT_EQ(result.status, BooleanLinearSolver::MODEL_INVALID);
  EXPECT_THAT(result.message, HasSubstr("bad_index"));
}

TEST(CpSatBooleanLinearSolverTest, RejectsUnknownObjectiveVariable) {
  CpSatBooleanLinearSolver solver("invalid");
  solver.AddBoolVar("x");
  solver.SetObjective({{0, 1}, {-1, 1}}, /*maximize=*/true);
  const BooleanLinearSolver::SolveResult result =
      solver.Solve(kNoTimeLimit, nullptr, nullptr);
  EXPECT_EQ(result.status, BooleanLinearSolver::MODEL_INVALID);
  EXPECT_THAT(result.message, HasSubstr("Objective"));
}

TEST(CpSatBooleanLinearSolverTest, RejectsEmptyRange) {
  CpSatBooleanLinearSolver solver("invalid");
  solver.AddBoolVar("x");
  solver.AddLinearConstraint({{0, 1}}, 1, 0, "empty");
  EXPECT_EQ(solver.Solve(kNoTimeLimit, nullptr, nullptr).status,
            BooleanLinearSolver::MODEL_INVALID);
}

// Exhaustive enumeration of all assignments, for small models only.
int64_t BruteForceOptimum(int num_vars,
                          const std::vector<std::vector<LinearTerm>>& rows,
                          const std::vector<int64_t>& upper_bounds,
                          const std::vector<LinearTerm>& objective,
                          bool* feasible) {
  *feasible = false;
  int64_t best = 0;
  for (int mask = 0; mask < (1 << num_vars); ++mask) {
    bool ok = true;
    for (int r = 0; r < rows.size() && ok; ++r) {
      int64_t activity = 0;
      for (const LinearTerm& term : rows[r]) {
        if (mask & (1 << term.variable)) activity += term.coefficient;
      }
      ok = activity <= upper_bounds[r];
    }
    if (!ok) continue;
    int64_t value = 0;
    for (const LinearTerm& term : objective) {
      if (mask & (1 << term.variable)) value += term.coefficient;
    }
    if (!*feasible || value > best) best = value;
    *feasible = true;
  }
  return best;
}

TEST(CpSatBooleanLinearSolverTest, MatchesBruteForceOnRandomModels) {
  std::mt19937 random(12345);
  for (int trial = 0; trial < 50; ++trial) {
    const int num_vars = absl::Uniform<int>(random, 1, 11);
    const int num_rows = absl::Uniform<int>(random, 1, 6);
    CpSatBooleanLinearSolver solver("random");
    for (int i = 0; i < num_vars; ++i) solver.AddBoolVar("x");
    std::vector<std::vector<LinearTerm>> rows(num_rows);
    std::vector<int64_t> upper_bounds(num_rows);
    for (int r = 0; r < num_rows; ++r) {
      for (int i = 0; i < num_vars; ++i) {
        if (absl::Bernoulli(random, 0.6)) {
          rows[r].push_back({i, absl::Uniform<int64_t>(random, -3, 8)});
        }
      }
      upper_bounds[r] = absl::Uniform<int64_t>(random, -2, 12);
      solver.AddLinearConstraint(rows[r], -BooleanLinearSolver::kInfinity,
                                 upper_bounds[r], "row");
    }
    std::vector<LinearTerm> objective;
    for (int i = 0; i < num_vars; ++i) {
      objective.push_back({i, absl::Uniform<int64_t>(random, -5, 20)});
    }
    solver.SetObjective(objective, /*maximize=*/true);

    bool feasible = false;
    const int64_t expected = BruteForceOptimum(num_vars, rows, upper_bounds,
                                               objective, &feasible);
    const BooleanLinearSolver::SolveResult result =
        solver.Solve(kNoTimeLimit, nullptr, nullptr);
    if (feasible) {
      ASSERT_EQ(result.status, BooleanLinearSolver::OPTIMAL) << trial;
      EXPECT_EQ(result.objective_value, expected) << trial;
    } else {
      EXPECT_EQ(result.status, BooleanLinearSolver::INFEASIBLE) << trial;
    }
  }
}

}  // namespace
}  // namespace labsched
