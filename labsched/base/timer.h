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

#ifndef LABSCHED_BASE_TIMER_H_
#define LABSCHED_BASE_TIMER_H_

#include <cstdint>

#include "absl/time/clock.h"

namespace labsched {

// Wall-clock stopwatch. Get() returns the seconds elapsed since Start().
class WallTimer {
 public:
  WallTimer() : running_(false), start_(0) {}

  // When Start() is called multiple times, only the most recent is used.
  void Start() {
    running_ = true;
    start_ = absl::GetCurrentTimeNanos();
  }
  double Get() const { return GetNanos() * 1e-9; }

 private:
  int64_t GetNanos() const {
    return running_ ? absl::GetCurrentTimeNanos() - start_ : 0;
  }

  bool running_;
  int64_t start_;
};

}  // namespace labsched

#endif  // LABSCHED_BASE_TIMER_H_
