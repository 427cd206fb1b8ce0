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

// Command line driver: staffs lab slots from three CSV exports.
//
// Example:
//
// solve --staff_hours="Max Availability.csv" \
//       --responses=Responses.csv \
//       --requirements=Requirements.csv \
//       --params="secondary_objective: BALANCE_UTILIZATION" \
//       --max_time_in_seconds=30 \
//       --output=/tmp/report.textproto
//
// Progress is logged as better assignments are found; the final report is
// printed on stdout.

#include <cstdlib>
#include <iostream>
#include <string>

#include "absl/flags/flag.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "labsched/base/file.h"
#include "labsched/base/init_google.h"
#include "labsched/base/logging.h"
#include "labsched/base/status_macros.h"
#include "labsched/scheduling/assignment_report.h"
#include "labsched/scheduling/lab_scheduling.pb.h"
#include "labsched/scheduling/record_loader.h"
#include "labsched/scheduling/scheduling_errors.h"
#include "labsched/scheduling/scheduling_orchestrator.h"

ABSL_FLAG(std::string, staff_hours, "",
          "REQUIRED: CSV file with the hired hours of each staff member "
          "(columns 'TA' and 'Hired for').");
ABSL_FLAG(std::string, responses, "",
          "REQUIRED: CSV file with the availability form responses (a 'Name' "
          "column and one '[<start> to <end>]' column per time range).");
ABSL_FLAG(std::string, requirements, "",
          "REQUIRED: CSV file with the lab slots (columns 'Day', 'Start', "
          "'End', 'Required' and optionally 'Lab Section' and 'Id').");
ABSL_FLAG(std::string, params_file, "",
          "File with SchedulingParameters in text format.");
ABSL_FLAG(std::string, params, "",
          "SchedulingParameters in text format, merged over --params_file.");
ABSL_FLAG(double, max_time_in_seconds, -1.0,
          "If non-negative, overrides the time budget of the parameters. 0 "
          "means an automatic budget.");
ABSL_FLAG(std::string, output, "",
          "If set, the AssignmentReport is written to this file in text "
          "format.");

namespace labsched {
namespace {

constexpr char kUsageStr[] =
    "Assigns staff members to lab slots from CSV exports, see solve.cc.";

// Reads a file named by a flag. Failures are file errors, not input errors.
absl::StatusOr<std::string> ReadFlagFile(absl::string_view flag_name,
                                         const std::string& path) {
  absl::StatusOr<std::string> contents =
      file::GetContents(path, file::Defaults());
  if (!contents.ok()) {
    return FileErrorBuilder(contents.status()) << "reading --" << flag_name;
  }
  return contents;
}

absl::StatusOr<SchedulingParameters> ReadParameters() {
  std::string file_text;
  if (!absl::GetFlag(FLAGS_params_file).empty()) {
    ASSIGN_OR_RETURN(file_text,
                     ReadFlagFile("params_file",
                                  absl::GetFlag(FLAGS_params_file)));
  }
  ASSIGN_OR_RETURN(
      SchedulingParameters parameters,
      ParseSchedulingParameters(file_text, absl::GetFlag(FLAGS_params)));
  if (absl::GetFlag(FLAGS_max_time_in_seconds) >= 0) {
    parameters.set_max_time_in_seconds(
        absl::GetFlag(FLAGS_max_time_in_seconds));
  }
  return parameters;
}

void LogProgress(double objective_value, const SolutionSnapshot& snapshot,
                 absl::Duration elapsed, bool is_final) {
  if (is_final) return;
  LOG(INFO) << "Solution #" << snapshot.solution_index() << ": "
            << snapshot.covered_headcount() << " positions covered, objective "
            << objective_value << ", after " << absl::FormatDuration(elapsed);
}

absl::Status Run() {
  QCHECK(!absl::GetFlag(FLAGS_staff_hours).empty())
      << "--staff_hours is required";
  QCHECK(!absl::GetFlag(FLAGS_responses).empty()) << "--responses is required";
  QCHECK(!absl::GetFlag(FLAGS_requirements).empty())
      << "--requirements is required";

  ASSIGN_OR_RETURN(
      const std::string staff_hours,
      ReadFlagFile("staff_hours", absl::GetFlag(FLAGS_staff_hours)));
  ASSIGN_OR_RETURN(const std::string responses,
                   ReadFlagFile("responses", absl::GetFlag(FLAGS_responses)));
  ASSIGN_OR_RETURN(
      const std::string requirements,
      ReadFlagFile("requirements", absl::GetFlag(FLAGS_requirements)));
  ASSIGN_OR_RETURN(
      const LabSchedulingModel model,
      LoadLabSchedulingModel(staff_hours, responses, requirements));
  ASSIGN_OR_RETURN(const SchedulingParameters parameters, ReadParameters());

  SchedulingOrchestrator orchestrator(model, parameters);
  RETURN_IF_ERROR(orchestrator.Start(LogProgress));
  LOG(INFO) << "Searching for at most " << orchestrator.time_budget_seconds()
            << "s";
  ASSIGN_OR_RETURN(const AssignmentReport report, orchestrator.Wait());

  std::cout << FormatAssignmentReport(report);
  if (!absl::GetFlag(FLAGS_output).empty()) {
    const absl::Status written = file::SetTextProto(
        absl::GetFlag(FLAGS_output), report, file::Defaults());
    if (!written.ok()) {
      return FileErrorBuilder(written) << "writing --output";
    }
    LOG(INFO) << "Wrote the report to '" << absl::GetFlag(FLAGS_output)
              << "'";
  }
  return absl::OkStatus();
}

}  // namespace
}  // namespace labsched

int main(int argc, char** argv) {
  InitGoogle(labsched::kUsageStr, &argc, &argv);
  const absl::Status status = labsched::Run();
  if (!status.ok()) {
    LOG(ERROR) << status;
    return labsched::ExitCodeForStatus(status);
  }
  return EXIT_SUCCESS;
}
