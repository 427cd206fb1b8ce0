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

#include "labsched/base/file.h"

#include <cstdio>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/message.h"
#include "google/protobuf/text_format.h"

namespace file {

absl::StatusOr<std::string> GetContents(absl::string_view path,
                                        Options options) {
  std::string contents;
  absl::Status status = GetContents(path, &contents, options);
  if (!status.ok()) {
    return status;
  }
  return contents;
}

absl::Status GetContents(absl::string_view file_name, std::string* output,
                         Options options) {
  if (options != Defaults()) {
    return absl::InvalidArgumentError("Unsupported file options.");
  }
  const std::string null_terminated_name(file_name);
  FILE* const f = fopen(null_terminated_name.c_str(), "rb");
  if (f == nullptr) {
    return absl::NotFoundError(
        absl::StrCat("Could not open '", file_name, "'."));
  }
  output->clear();
  char buffer[4096];
  size_t read;
  while ((read = fread(buffer, 1, sizeof(buffer), f)) > 0) {
    output->append(buffer, read);
  }
  const bool read_error = ferror(f) != 0;
  if (fclose(f) != 0 || read_error) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not read from '", file_name, "'."));
  }
  return absl::OkStatus();
}

absl::Status SetContents(absl::string_view file_name,
                         absl::string_view contents, Options options) {
  if (options != Defaults()) {
    return absl::InvalidArgumentError("Unsupported file options.");
  }
  const std::string null_terminated_name(file_name);
  FILE* const f = fopen(null_terminated_name.c_str(), "wb");
  if (f == nullptr) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not open '", file_name, "' for writing."));
  }
  const bool written =
      fwrite(contents.data(), 1, contents.size(), f) == contents.size();
  // Close even if the write failed.
  const bool closed = fclose(f) == 0;
  if (!written || !closed) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not write ", contents.size(), " bytes to '",
                     file_name, "'."));
  }
  return absl::OkStatus();
}

absl::Status SetTextProto(absl::string_view file_name,
                          const google::protobuf::Message& proto,
                          Options options) {
  std::string proto_string;
  if (!google::protobuf::TextFormat::PrintToString(proto, &proto_string)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not write proto to '", file_name, "'."));
  }
  return SetContents(file_name, proto_string, options);
}

}  // namespace file
