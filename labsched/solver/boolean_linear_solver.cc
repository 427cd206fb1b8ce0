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

#include "labsched/solver/boolean_linear_solver.h"

#include <string>

namespace labsched {

std::string ResultStatusName(BooleanLinearSolver::ResultStatus status) {
  switch (status) {
    case BooleanLinearSolver::OPTIMAL:
      return "OPTIMAL";
    case BooleanLinearSolver::FEASIBLE:
      return "FEASIBLE";
    case BooleanLinearSolver::INFEASIBLE:
      return "INFEASIBLE";
    case BooleanLinearSolver::NOT_SOLVED:
      return "NOT_SOLVED";
    case BooleanLinearSolver::ABNORMAL:
      return "ABNORMAL";
    case BooleanLinearSolver::MODEL_INVALID:
      return "MODEL_INVALID";
  }
  return "UNKNOWN";
}

}  // namespace labsched
