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

#ifndef LABSCHED_BASE_STATUS_BUILDER_H_
#define LABSCHED_BASE_STATUS_BUILDER_H_

#include <sstream>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"

namespace labsched {

// Streams an annotation onto a base status. The annotation becomes the
// message when the base status has none, and is appended after "; "
// otherwise.
class StatusBuilder {
 public:
  explicit StatusBuilder(const absl::StatusCode code)
      : base_status_(code, /*msg=*/{}) {}

  explicit StatusBuilder(const absl::Status status)
      : base_status_(std::move(status)) {}

  operator absl::Status() const {  // NOLINT
    const std::string annotation = ss_.str();
    if (annotation.empty()) {
      return base_status_;
    }
    if (base_status_.message().empty()) {
      return absl::Status(base_status_.code(), annotation);
    }
    const std::string annotated_message =
        absl::StrCat(base_status_.message(), "; ", annotation);
    return absl::Status(base_status_.code(), annotated_message);
  }

  template <class T>
  StatusBuilder& operator<<(const T& t) {
    ss_ << t;
    return *this;
  }

 private:
  const absl::Status base_status_;
  std::ostringstream ss_;
};

inline StatusBuilder FailedPreconditionErrorBuilder() {
  return StatusBuilder(absl::StatusCode::kFailedPrecondition);
}

inline StatusBuilder InternalErrorBuilder() {
  return StatusBuilder(absl::StatusCode::kInternal);
}

inline StatusBuilder InvalidArgumentErrorBuilder() {
  return StatusBuilder(absl::StatusCode::kInvalidArgument);
}

}  // namespace labsched

#endif  // LABSCHED_BASE_STATUS_BUILDER_H_
