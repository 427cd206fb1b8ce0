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

#ifndef LABSCHED_SCHEDULING_ASSIGNMENT_REPORT_H_
#define LABSCHED_SCHEDULING_ASSIGNMENT_REPORT_H_

#include <string>

#include "absl/status/status.h"
#include "labsched/scheduling/assignment_model.h"
#include "labsched/scheduling/availability_index.h"
#include "labsched/scheduling/lab_scheduling.pb.h"

namespace labsched {

// Builds the per slot, per staff and shortfall sections of the report of
// `snapshot`, and copies the snapshot and its objective. Every slot appears,
// in model order, even with nothing assigned. The status, termination
// reason and statistics are left to the caller.
AssignmentReport ExtractAssignmentReport(
    const LabSchedulingModel& problem, const AssignmentModel& assignment_model,
    const SolutionSnapshot& snapshot, const SchedulingParameters& parameters);

// Checks every hard constraint on a snapshot: headcount, availability, total
// and daily hours, lab cap and double booking. Returns a SolverFailure
// describing the first violation.
absl::Status VerifySolutionSnapshot(const LabSchedulingModel& problem,
                                    const AvailabilityIndex& index,
                                    const SchedulingParameters& parameters,
                                    const SolutionSnapshot& snapshot);

// VerifySolutionSnapshot() on the final snapshot, plus the consistency of the
// slot and staff sections with it.
absl::Status VerifyAssignmentReport(const LabSchedulingModel& problem,
                                    const AvailabilityIndex& index,
                                    const SchedulingParameters& parameters,
                                    const AssignmentReport& report);

// Human readable summary: status line, one line per slot, one line per staff
// member and the list of shortfalls.
std::string FormatAssignmentReport(const AssignmentReport& report);

}  // namespace labsched

#endif  // LABSCHED_SCHEDULING_ASSIGNMENT_REPORT_H_
