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

// The three error classes of lab scheduling, all expressed as absl::Status:
//
//   ParseError          kInvalidArgument     malformed text in the input
//                                            records (time label, day name,
//                                            number, CSV quoting).
//   ConfigurationError  kFailedPrecondition  structurally invalid input or
//                                            parameters, detected before any
//                                            solver object exists.
//   SolverFailure       kInternal            the search could not run to a
//                                            usable result.
//
// Infeasibility and time-outs are not errors; they are reported through
// AssignmentReport.status. Failures to read or write files belong to none of
// the three classes.

#ifndef LABSCHED_SCHEDULING_SCHEDULING_ERRORS_H_
#define LABSCHED_SCHEDULING_SCHEDULING_ERRORS_H_

#include "absl/status/status.h"
#include "labsched/base/status_builder.h"

namespace labsched {

inline StatusBuilder ParseErrorBuilder() {
  return InvalidArgumentErrorBuilder();
}

inline StatusBuilder ConfigurationErrorBuilder() {
  return FailedPreconditionErrorBuilder();
}

inline StatusBuilder SolverFailureBuilder() { return InternalErrorBuilder(); }

// Annotates a failure of the file layer. A missing file keeps kNotFound and
// any other failure becomes kUnavailable, so that an unreadable input is
// never mistaken for a ParseError.
StatusBuilder FileErrorBuilder(const absl::Status& status);

bool IsParseError(const absl::Status& status);
bool IsConfigurationError(const absl::Status& status);
bool IsSolverFailure(const absl::Status& status);

// Process exit code for a failed run: 2 for a ParseError, 3 for a
// ConfigurationError, 4 for a SolverFailure and EXIT_FAILURE otherwise.
int ExitCodeForStatus(const absl::Status& status);

}  // namespace labsched

#endif  // LABSCHED_SCHEDULING_SCHEDULING_ERRORS_H_
