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

#ifndef LABSCHED_SCHEDULING_MODEL_VALIDATOR_H_
#define LABSCHED_SCHEDULING_MODEL_VALIDATOR_H_

#include <string>

#include "absl/status/status.h"
#include "labsched/scheduling/lab_scheduling.pb.h"

namespace labsched {

// Returns an empty string iff the model is structurally valid. Otherwise,
// returns a description of the first error encountered: a missing or
// duplicate staff name, negative or non-finite hired hours, an empty slot
// list, a missing or duplicate slot id, a slot or unavailability interval
// with no day or with times outside 0 <= start < end <= 1440, or a slot
// requiring fewer than one staff member.
//
// Unavailability records naming unknown staff members are checked by
// AvailabilityIndex::Create().
std::string FindErrorInLabSchedulingModel(const LabSchedulingModel& model);

// Returns an empty string iff the parameters can be used with the model.
// The daily cap and the lab cap must be positive, the balance step must be
// positive when used, and at least one slot must fit in the daily cap.
std::string FindErrorInSchedulingParameters(
    const SchedulingParameters& parameters, const LabSchedulingModel& model);

// Both checks above, as a ConfigurationError.
absl::Status ValidateLabSchedulingModel(
    const LabSchedulingModel& model, const SchedulingParameters& parameters);

}  // namespace labsched

#endif  // LABSCHED_SCHEDULING_MODEL_VALIDATOR_H_
