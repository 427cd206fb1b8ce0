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

#ifndef LABSCHED_BASE_INIT_GOOGLE_H_
#define LABSCHED_BASE_INIT_GOOGLE_H_

#include <vector>

#include "absl/flags/declare.h"  // IWYU pragma: keep
#include "absl/flags/flag.h"     // IWYU pragma: keep
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/initialize.h"
#include "absl/strings/string_view.h"

// Initializes logging, sets the usage message and parses the command line
// flags. Returns the positional arguments, starting with the program name.
//
// Must be called early in main(), before other threads start.
inline std::vector<char*> InitGoogle(absl::string_view usage, int* argc,
                                     char*** argv) {
  absl::InitializeLog();
  if (!usage.empty()) {
    absl::SetProgramUsageMessage(usage);
  }
  return absl::ParseCommandLine(*argc, *argv);
}

#endif  // LABSCHED_BASE_INIT_GOOGLE_H_
