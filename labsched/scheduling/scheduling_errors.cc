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

#include "labsched/scheduling/scheduling_errors.h"

#include <cstdlib>

#include "absl/status/status.h"
#include "labsched/base/status_builder.h"

namespace labsched {

StatusBuilder FileErrorBuilder(const absl::Status& status) {
  const absl::StatusCode code = status.code() == absl::StatusCode::kNotFound
                                    ? absl::StatusCode::kNotFound
                                    : absl::StatusCode::kUnavailable;
  return StatusBuilder(absl::Status(code, status.message()));
}

bool IsParseError(const absl::Status& status) {
  return status.code() == absl::StatusCode::kInvalidArgument;
}

bool IsConfigurationError(const absl::Status& status) {
  return status.code() == absl::StatusCode::kFailedPrecondition;
}

bool IsSolverFailure(const absl::Status& status) {
  return status.code() == absl::StatusCode::kInternal;
}

int ExitCodeForStatus(const absl::Status& status) {
  if (IsParseError(status)) return 2;
  if (IsConfigurationError(status)) return 3;
  if (IsSolverFailure(status)) return 4;
  return EXIT_FAILURE;
}

}  // namespace labsched
