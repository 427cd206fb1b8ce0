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

#ifndef LABSCHED_SCHEDULING_CSV_TABLE_H_
#define LABSCHED_SCHEDULING_CSV_TABLE_H_

#include <optional>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"

namespace labsched {

// A comma separated table whose first record is the header.
//
// Parse() follows RFC 4180: a field may be enclosed in double quotes, in
// which case it may contain commas, line breaks and doubled quotes standing
// for one quote. Records end with "\n" or "\r\n". Blank lines are skipped, a
// leading UTF-8 byte order mark is dropped, and records shorter than the
// header are padded with empty fields. Fields are kept verbatim (no
// trimming).
class CsvTable {
 public:
  // Returns a ParseError for an unterminated quoted field, text after a
  // closing quote, a record longer than the header, or an empty input.
  static absl::StatusOr<CsvTable> Parse(absl::string_view contents);

  absl::Span<const std::string> header() const { return header_; }
  int num_columns() const { return header_.size(); }
  int num_rows() const { return rows_.size(); }
  absl::Span<const std::string> row(int index) const { return rows_[index]; }
  const std::string& cell(int row, int column) const {
    return rows_[row][column];
  }
  // Line of the input where the record starts, 1-based.
  int line_number(int row) const { return line_numbers_[row]; }

  // Index of the first column whose label, with surrounding whitespace
  // removed, equals one of `names` ignoring case. Names are tried in order.
  std::optional<int> FindColumn(
      absl::Span<const absl::string_view> names) const;
  std::optional<int> FindColumn(absl::string_view name) const {
    return FindColumn(absl::MakeConstSpan(&name, 1));
  }

 private:
  CsvTable() = default;

  std::vector<std::string> header_;
  std::vector<std::vector<std::string>> rows_;
  std::vector<int> line_numbers_;
};

}  // namespace labsched

#endif  // LABSCHED_SCHEDULING_CSV_TABLE_H_
