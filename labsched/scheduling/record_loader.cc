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

#include "labsched/scheduling/record_loader.h"

#include <cmath>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "google/protobuf/text_format.h"
#include "labsched/base/logging.h"
#include "labsched/base/status_macros.h"
#include "labsched/scheduling/csv_table.h"
#include "labsched/scheduling/lab_scheduling.pb.h"
#include "labsched/scheduling/scheduling_errors.h"
#include "labsched/scheduling/time_interval.h"

namespace labsched {

namespace {

bool IsBlankRow(absl::Span<const std::string> row) {
  for (const std::string& cell : row) {
    if (!absl::StripAsciiWhitespace(cell).empty()) return false;
  }
  return true;
}

absl::StatusOr<int> RequiredColumn(const CsvTable& table,
                                   absl::Span<const absl::string_view> names) {
  const std::optional<int> column = table.FindColumn(names);
  if (!column.has_value()) {
    return ConfigurationErrorBuilder()
           << "missing column '" << absl::StrJoin(names, "' or '") << "'";
  }
  return *column;
}

absl::StatusOr<int> RequiredColumn(const CsvTable& table,
                                   absl::string_view name) {
  return RequiredColumn(table, absl::MakeConstSpan(&name, 1));
}

bool IsTimeRangeColumn(absl::string_view label) {
  return absl::StrContains(label, "[") ||
         absl::StrContains(absl::AsciiStrToLower(label), " to ");
}

struct RangeColumn {
  int column;
  std::string label;
  int start_minute;
  int end_minute;
};

}  // namespace

absl::Status LoadStaffHours(const CsvTable& table, LabSchedulingModel* model) {
  const absl::string_view kNameColumns[] = {"TA", "Name"};
  const absl::string_view kHoursColumns[] = {"Hired for", "Hours"};
  ASSIGN_OR_RETURN(const int name_column, RequiredColumn(table, kNameColumns));
  ASSIGN_OR_RETURN(const int hours_column,
                   RequiredColumn(table, kHoursColumns));

  absl::flat_hash_set<std::string> names;
  for (const StaffMember& staff : model->staff()) names.insert(staff.name());
  for (int row = 0; row < table.num_rows(); ++row) {
    if (IsBlankRow(table.row(row))) continue;
    const absl::string_view name =
        absl::StripAsciiWhitespace(table.cell(row, name_column));
    if (name.empty()) {
      return ConfigurationErrorBuilder()
             << "staff hours line " << table.line_number(row)
             << ": empty staff name";
    }
    if (!names.insert(std::string(name)).second) {
      return ConfigurationErrorBuilder()
             << "duplicate staff name '" << name << "' on line "
             << table.line_number(row);
    }
    const absl::string_view hours_text =
        absl::StripAsciiWhitespace(table.cell(row, hours_column));
    double hours = 0.0;
    if (!absl::SimpleAtod(hours_text, &hours) || !std::isfinite(hours)) {
      return ParseErrorBuilder() << "staff '" << name << "': hired hours '"
                                 << hours_text << "' is not a number";
    }
    if (hours < 0) {
      return ConfigurationErrorBuilder()
             << "staff '" << name << "': negative hired hours " << hours;
    }
    StaffMember* staff = model->add_staff();
    staff->set_name(std::string(name));
    staff->set_hours_hired(hours);
  }
  return absl::OkStatus();
}

absl::Status LoadUnavailability(const CsvTable& table,
                                LabSchedulingModel* model) {
  ASSIGN_OR_RETURN(const int name_column, RequiredColumn(table, "Name"));
  std::vector<RangeColumn> ranges;
  for (int column = 0; column < table.num_columns(); ++column) {
    const std::string& label = table.header()[column];
    if (column == name_column || !IsTimeRangeColumn(label)) continue;
    const absl::StatusOr<std::pair<int, int>> range =
        ParseTimeRangeLabel(label);
    if (!range.ok()) {
      return ParseErrorBuilder() << "unavailability column '" << label
                                 << "': " << range.status().message();
    }
    ranges.push_back({column, label, range->first, range->second});
  }
  if (ranges.empty()) {
    return ConfigurationErrorBuilder()
           << "no time range columns in the unavailability table";
  }

  absl::flat_hash_map<std::string, int> staff_by_name;
  for (int s = 0; s < model->staff_size(); ++s) {
    staff_by_name[model->staff(s).name()] = s;
  }
  std::vector<bool> responded(model->staff_size(), false);
  for (int row = 0; row < table.num_rows(); ++row) {
    if (IsBlankRow(table.row(row))) continue;
    const std::string name(
        absl::StripAsciiWhitespace(table.cell(row, name_column)));
    const auto it = staff_by_name.find(name);
    if (it == staff_by_name.end()) {
      LOG(WARNING) << "Skipping the response on line "
                   << table.line_number(row) << " from '" << name
                   << "', who is not in the staff hours table";
      continue;
    }
    if (responded[it->second]) {
      LOG(WARNING) << "Ignoring the extra response of '" << name
                   << "' on line " << table.line_number(row);
      continue;
    }
    responded[it->second] = true;
    for (const RangeColumn& range : ranges) {
      for (const absl::string_view day_text :
           absl::StrSplit(table.cell(row, range.column), ',',
                          absl::SkipWhitespace())) {
        const absl::string_view trimmed = absl::StripAsciiWhitespace(day_text);
        const absl::StatusOr<Weekday> day = ParseWeekday(trimmed);
        if (!day.ok()) {
          return ParseErrorBuilder()
                 << "staff '" << name << "', column '" << range.label
                 << "': unknown day '" << trimmed << "'";
        }
        UnavailabilityInterval* interval = model->add_unavailability();
        interval->set_staff_name(name);
        interval->set_day(*day);
        interval->set_start_minute(range.start_minute);
        interval->set_end_minute(range.end_minute);
      }
    }
  }

  std::vector<std::string> missing;
  for (int s = 0; s < model->staff_size(); ++s) {
    if (responded[s]) continue;
    model->mutable_staff(s)->set_has_availability(false);
    missing.push_back(model->staff(s).name());
  }
  if (!missing.empty()) {
    LOG(WARNING) << "No availability response from " << missing.size()
                 << " staff members, who will not be assigned: "
                 << absl::StrJoin(missing, ", ");
  }
  return absl::OkStatus();
}

absl::Status LoadRequirements(const CsvTable& table,
                              LabSchedulingModel* model) {
  ASSIGN_OR_RETURN(const int day_column, RequiredColumn(table, "Day"));
  ASSIGN_OR_RETURN(const int start_column, RequiredColumn(table, "Start"));
  ASSIGN_OR_RETURN(const int end_column, RequiredColumn(table, "End"));
  ASSIGN_OR_RETURN(const int required_column,
                   RequiredColumn(table, "Required"));
  const absl::string_view kLabColumns[] = {"Lab Section", "Section", "Lab"};
  const std::optional<int> lab_column = table.FindColumn(kLabColumns);
  const std::optional<int> id_column = table.FindColumn("Id");

  for (int row = 0; row < table.num_rows(); ++row) {
    if (IsBlankRow(table.row(row))) continue;
    const int line = table.line_number(row);
    const auto cell = [&](int column) {
      return absl::StripAsciiWhitespace(table.cell(row, column));
    };

    Slot* slot = model->add_slots();
    const absl::string_view id = id_column.has_value() ? cell(*id_column) : "";
    slot->set_id(id.empty() ? absl::StrCat("slot-", row + 1)
                            : std::string(id));
    if (lab_column.has_value()) slot->set_label(std::string(cell(*lab_column)));

    const absl::string_view day_text = cell(day_column);
    if (day_text.empty()) {
      return ConfigurationErrorBuilder()
             << "requirement line " << line << ": missing day";
    }
    const absl::StatusOr<Weekday> day = ParseWeekday(day_text);
    if (!day.ok()) {
      return ParseErrorBuilder() << "requirement line " << line << ": "
                                 << day.status().message();
    }
    slot->set_day(*day);

    const absl::StatusOr<int> start =
        ParseTimeOfDay(cell(start_column), MeridiemPolicy::kOptional);
    const absl::StatusOr<int> end =
        ParseTimeOfDay(cell(end_column), MeridiemPolicy::kOptional);
    if (!start.ok() || !end.ok()) {
      return ParseErrorBuilder()
             << "requirement line " << line << ": "
             << (start.ok() ? end.status() : start.status()).message();
    }
    if (*start >= *end) {
      return ConfigurationErrorBuilder()
             << "requirement line " << line << ": start "
             << FormatTimeOfDay(*start) << " is not before end "
             << FormatTimeOfDay(*end);
    }
    slot->set_start_minute(*start);
    slot->set_end_minute(*end);

    const absl::string_view required_text = cell(required_column);
    double required = 0.0;
    if (!absl::SimpleAtod(required_text, &required) ||
        std::floor(required) != required || required > 1e6) {
      return ConfigurationErrorBuilder()
             << "requirement line " << line << ": required headcount '"
             << required_text << "' is not an integer";
    }
    if (required <= 0) {
      return ConfigurationErrorBuilder()
             << "requirement line " << line
             << ": required headcount must be positive, got " << required;
    }
    slot->set_required_headcount(static_cast<int>(required));
  }
  return absl::OkStatus();
}

absl::StatusOr<LabSchedulingModel> LoadLabSchedulingModel(
    absl::string_view staff_hours_csv, absl::string_view unavailability_csv,
    absl::string_view requirements_csv) {
  LabSchedulingModel model;
  absl::StatusOr<CsvTable> table = CsvTable::Parse(staff_hours_csv);
  RETURN_IF_ERROR(table.status()) << "in the staff hours";
  RETURN_IF_ERROR(LoadStaffHours(*table, &model)) << "in the staff hours";

  table = CsvTable::Parse(unavailability_csv);
  RETURN_IF_ERROR(table.status()) << "in the unavailability responses";
  RETURN_IF_ERROR(LoadUnavailability(*table, &model))
      << "in the unavailability responses";

  table = CsvTable::Parse(requirements_csv);
  RETURN_IF_ERROR(table.status()) << "in the requirements";
  RETURN_IF_ERROR(LoadRequirements(*table, &model)) << "in the requirements";

  LOG(INFO) << "Loaded " << model.staff_size() << " staff members, "
            << model.unavailability_size() << " unavailability intervals and "
            << model.slots_size() << " slots";
  return model;
}

absl::StatusOr<SchedulingParameters> ParseSchedulingParameters(
    absl::string_view file_text, absl::string_view overrides_text) {
  SchedulingParameters parameters;
  if (!google::protobuf::TextFormat::ParseFromString(std::string(file_text),
                                                     &parameters)) {
    return ConfigurationErrorBuilder()
           << "could not parse the parameters file as SchedulingParameters";
  }
  if (!google::protobuf::TextFormat::MergeFromString(
          std::string(overrides_text), &parameters)) {
    return ConfigurationErrorBuilder()
           << "could not parse the parameter overrides as "
              "SchedulingParameters: "
           << overrides_text;
  }
  return parameters;
}

}  // namespace labsched
