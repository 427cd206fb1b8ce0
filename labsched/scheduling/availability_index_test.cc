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

#include "labsched/scheduling/availability_index.h"

#include <optional>

#include "absl/status/statusor.h"
#include "gtest/gtest.h"
#include "labsched/base/gmock.h"
#include "labsched/scheduling/lab_scheduling.pb.h"
#include "labsched/scheduling/scheduling_errors.h"
#include "labsched/scheduling/time_interval.h"

namespace labsched {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

void AddUnavailability(LabSchedulingModel* model, const char* name,
                       Weekday day, int start_hour, int end_hour) {
  UnavailabilityInterval* interval = model->add_unavailability();
  interval->set_staff_name(name);
  interval->set_day(day);
  interval->set_start_minute(start_hour * 60);
  interval->set_end_minute(end_hour * 60);
}

LabSchedulingModel TwoStaffModel() {
  LabSchedulingModel model;
  model.add_staff()->set_name("Ada");
  model.add_staff()->set_name("Brian");
  return model;
}

TEST(AvailabilityIndexTest, NoRecordsMeansAvailable) {
  ASSERT_OK_AND_ASSIGN(const AvailabilityIndex index,
                       AvailabilityIndex::Create(TwoStaffModel()));
  EXPECT_EQ(index.num_staff(), 2);
  EXPECT_TRUE(index.IsAvailable(0, TimeInterval{MONDAY, 9 * 60, 10 * 60}));
  EXPECT_TRUE(index.IsAvailable(1, TimeInterval{SUNDAY, 0, kMinutesPerDay}));
}

TEST(AvailabilityIndexTest, ExactMatchIsUnavailable) {
  LabSchedulingModel model = TwoStaffModel();
  AddUnavailability(&model, "Ada", MONDAY, 9, 10);
  ASSERT_OK_AND_ASSIGN(const AvailabilityIndex index,
                       AvailabilityIndex::Create(model));
  Slot slot;
  slot.set_day(MONDAY);
  slot.set_start_minute(9 * 60);
  slot.set_end_minute(10 * 60);
  EXPECT_FALSE(index.IsAvailable(0, slot));
  EXPECT_TRUE(index.IsAvailable(1, slot));
  slot.set_day(TUESDAY);
  EXPECT_TRUE(index.IsAvailable(0, slot));
}

TEST(AvailabilityIndexTest, TouchingIntervalsDoNotConflict) {
  LabSchedulingModel model = TwoStaffModel();
  AddUnavailability(&model, "Ada", MONDAY, 9, 10);
  AddUnavailability(&model, "Ada", MONDAY, 12, 13);
  ASSERT_OK_AND_ASSIGN(const AvailabilityIndex index,
                       AvailabilityIndex::Create(model));
  EXPECT_TRUE(index.IsAvailable(0, TimeInterval{MONDAY, 8 * 60, 9 * 60}));
  EXPECT_TRUE(index.IsAvailable(0, TimeInterval{MONDAY, 10 * 60, 12 * 60}));
  EXPECT_TRUE(index.IsAvailable(0, TimeInterval{MONDAY, 13 * 60, 14 * 60}));
  EXPECT_FALSE(
      index.IsAvailable(0, TimeInterval{MONDAY, 11 * 60 + 30, 12 * 60 + 1}));
  EXPECT_FALSE(index.IsAvailable(0, TimeInterval{MONDAY, 8 * 60, 14 * 60}));
  EXPECT_FALSE(
      index.IsAvailable(0, TimeInterval{MONDAY, 9 * 60 + 15, 9 * 60 + 45}));
}

TEST(AvailabilityIndexTest, MergesContiguousAndOverlappingIntervals) {
  LabSchedulingModel model = TwoStaffModel();
  AddUnavailability(&model, "Brian", WEDNESDAY, 10, 11);
  AddUnavailability(&model, "Brian", WEDNESDAY, 8, 9);
  AddUnavailability(&model, "Brian", WEDNESDAY, 9, 10);
  AddUnavailability(&model, "Brian", WEDNESDAY, 14, 16);
  AddUnavailability(&model, "Brian", WEDNESDAY, 15, 17);
  ASSERT_OK_AND_ASSIGN(const AvailabilityIndex index,
                       AvailabilityIndex::Create(model));
  EXPECT_THAT(index.UnavailableIntervals(1, WEDNESDAY),
              ElementsAre(TimeInterval{WEDNESDAY, 8 * 60, 11 * 60},
                          TimeInterval{WEDNESDAY, 14 * 60, 17 * 60}));
  EXPECT_THAT(index.UnavailableIntervals(0, WEDNESDAY), IsEmpty());
  EXPECT_THAT(index.UnavailableIntervals(1, THURSDAY), IsEmpty());
}

TEST(AvailabilityIndexTest, StaffWithoutResponseIsNeverAvailable) {
  LabSchedulingModel model = TwoStaffModel();
  model.mutable_staff(1)->set_has_availability(false);
  ASSERT_OK_AND_ASSIGN(const AvailabilityIndex index,
                       AvailabilityIndex::Create(model));
  EXPECT_TRUE(index.IsAvailable(0, TimeInterval{FRIDAY, 9 * 60, 10 * 60}));
  EXPECT_FALSE(index.IsAvailable(1, TimeInterval{FRIDAY, 9 * 60, 10 * 60}));
}

TEST(AvailabilityIndexTest, StaffIndex) {
  ASSERT_OK_AND_ASSIGN(const AvailabilityIndex index,
                       AvailabilityIndex::Create(TwoStaffModel()));
  EXPECT_EQ(index.StaffIndex("Brian"), std::optional<int>(1));
  EXPECT_EQ(index.StaffIndex("Carla"), std::nullopt);
}

TEST(AvailabilityIndexTest, UnknownStaffIsAConfigurationError) {
  LabSchedulingModel model = TwoStaffModel();
  AddUnavailability(&model, "Carla", MONDAY, 9, 10);
  const absl::StatusOr<AvailabilityIndex> index =
      AvailabilityIndex::Create(model);
  ASSERT_FALSE(index.ok());
  EXPECT_TRUE(IsConfigurationError(index.status()));
  EXPECT_THAT(index.status().message(), HasSubstr("Carla"));
}

TEST(AvailabilityIndexTest, DuplicateStaffIsAConfigurationError) {
  LabSchedulingModel model = TwoStaffModel();
  model.add_staff()->set_name("Ada");
  const absl::StatusOr<AvailabilityIndex> index =
      AvailabilityIndex::Create(model);
  ASSERT_FALSE(index.ok());
  EXPECT_TRUE(IsConfigurationError(index.status()));
}

}  // namespace
}  // namespace labsched
