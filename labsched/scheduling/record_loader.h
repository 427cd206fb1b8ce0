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

// Loading of the three input tables of lab scheduling into a
// LabSchedulingModel:
//
//   staff hours      one row per staff member: name ("TA" or "Name") and
//                    hired hours ("Hired for" or "Hours").
//   unavailability   availability form responses: a "Name" column and one
//                    column per time range, labelled like
//                    "Unavailable times [8am to 9am]", whose cells list the
//                    weekdays the person cannot work in that range
//                    ("Monday, Wednesday").
//   requirements     one row per lab slot: "Day", "Start", "End",
//                    "Required", and optionally "Lab Section" and "Id".
//
// Malformed text (numbers, days, time labels) is a ParseError; well-formed
// but unusable values (negative hours, duplicate names, a non-positive
// headcount, missing columns) are ConfigurationErrors. SchedulingParameters
// are read from protobuf text format.

#ifndef LABSCHED_SCHEDULING_RECORD_LOADER_H_
#define LABSCHED_SCHEDULING_RECORD_LOADER_H_

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "labsched/scheduling/csv_table.h"
#include "labsched/scheduling/lab_scheduling.pb.h"

namespace labsched {

// Appends one StaffMember per row. Names are trimmed; rows whose cells are
// all blank are ignored.
absl::Status LoadStaffHours(const CsvTable& table, LabSchedulingModel* model);

// Appends the unavailability intervals of the staff members already in
// `model`. Responses from unknown names are logged and skipped, and staff
// members without a response get has_availability = false. When a name has
// several responses, the first one is used.
absl::Status LoadUnavailability(const CsvTable& table,
                                LabSchedulingModel* model);

// Appends one Slot per row, in row order. Times may be written "9", "13:30"
// or "1:30pm". Rows without an "Id" get "slot-<row number>".
absl::Status LoadRequirements(const CsvTable& table, LabSchedulingModel* model);

// Parses the three CSV documents and loads them in order. Errors name the
// table they come from.
absl::StatusOr<LabSchedulingModel> LoadLabSchedulingModel(
    absl::string_view staff_hours_csv, absl::string_view unavailability_csv,
    absl::string_view requirements_csv);

// Parses `file_text` as SchedulingParameters in text format and merges
// `overrides_text` over it. Either may be empty. Text that does not parse is
// a ConfigurationError, whichever of the two it comes from.
absl::StatusOr<SchedulingParameters> ParseSchedulingParameters(
    absl::string_view file_text, absl::string_view overrides_text);

}  // namespace labsched

#endif  // LABSCHED_SCHEDULING_RECORD_LOADER_H_
