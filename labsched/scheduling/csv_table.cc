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

#include "labsched/scheduling/csv_table.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"
#include "absl/types/span.h"
#include "labsched/scheduling/scheduling_errors.h"

namespace labsched {

namespace {

constexpr absl::string_view kByteOrderMark = "\xEF\xBB\xBF";

bool IsBlank(const std::vector<std::string>& record) {
  return record.size() == 1 && record[0].empty();
}

}  // namespace

absl::StatusOr<CsvTable> CsvTable::Parse(absl::string_view contents) {
  absl::ConsumePrefix(&contents, kByteOrderMark);

  std::vector<std::vector<std::string>> records;
  std::vector<int> record_lines;
  std::vector<std::string> record(1);
  int line = 1;
  int record_line = 1;
  size_t i = 0;
  const size_t size = contents.size();

  const auto end_record = [&]() {
    if (!IsBlank(record)) {
      records.push_back(std::move(record));
      record_lines.push_back(record_line);
    }
    record.assign(1, std::string());
  };

  while (i < size) {
    const char c = contents[i];
    if (c == '"' && record.back().empty()) {
      const int quote_line = line;
      ++i;
      bool closed = false;
      while (i < size) {
        const char q = contents[i++];
        if (q == '"') {
          if (i < size && contents[i] == '"') {
            record.back().push_back('"');
            ++i;
          } else {
            closed = true;
            break;
          }
        } else {
          if (q == '\n') ++line;
          record.back().push_back(q);
        }
      }
      if (!closed) {
        return ParseErrorBuilder()
               << "unterminated quoted field starting on line " << quote_line;
      }
      if (i < size && contents[i] != ',' && contents[i] != '\n' &&
          contents[i] != '\r') {
        return ParseErrorBuilder()
               << "unexpected text after a closing quote on line " << line;
      }
      continue;
    }
    if (c == ',') {
      record.emplace_back();
      ++i;
    } else if (c == '\n' || c == '\r') {
      i += (c == '\r' && i + 1 < size && contents[i + 1] == '\n') ? 2 : 1;
      end_record();
      ++line;
      record_line = line;
    } else {
      record.back().push_back(c);
      ++i;
    }
  }
  end_record();

  if (records.empty()) {
    return ParseErrorBuilder() << "the table has no header";
  }
  CsvTable table;
  table.header_ = std::move(records[0]);
  const int width = table.header_.size();
  for (int r = 1; r < records.size(); ++r) {
    std::vector<std::string>& fields = records[r];
    if (fields.size() > width) {
      return ParseErrorBuilder()
             << "the record on line " << record_lines[r] << " has "
             << fields.size() << " fields, the header has " << width;
    }
    fields.resize(width);
    table.rows_.push_back(std::move(fields));
    table.line_numbers_.push_back(record_lines[r]);
  }
  return table;
}

std::optional<int> CsvTable::FindColumn(
    absl::Span<const absl::string_view> names) const {
  for (const absl::string_view name : names) {
    for (int column = 0; column < header_.size(); ++column) {
      if (absl::EqualsIgnoreCase(absl::StripAsciiWhitespace(header_[column]),
                                 name)) {
        return column;
      }
    }
  }
  return std::nullopt;
}

}  // namespace labsched
