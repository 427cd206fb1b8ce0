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

#include "labsched/scheduling/model_validator.h"

#include "gtest/gtest.h"
#include "labsched/base/gmock.h"
#include "labsched/base/parse_test_proto.h"
#include "labsched/scheduling/lab_scheduling.pb.h"
#include "labsched/scheduling/scheduling_errors.h"

namespace labsched {
namespace {

using ::testing::HasSubstr;
using ::testing::IsEmpty;

LabSchedulingModel ValidModel() {
  return ParseTestProto(R"pb(
    staff { name: "Ada" hours_hired: 6 }
    staff { name: "Brian" hours_hired: 2.5 }
    unavailability {
      staff_name: "Ada"
      day: MONDAY
      start_minute: 540
      end_minute: 600
    }
    slots {
      id: "lab1-mon"
      day: MONDAY
      start_minute: 540
      end_minute: 660
      required_headcount: 2
      label: "Lab 1"
    }
  )pb");
}

TEST(FindErrorInLabSchedulingModelTest, ValidModel) {
  EXPECT_THAT(FindErrorInLabSchedulingModel(ValidModel()), IsEmpty());
  EXPECT_OK(ValidateLabSchedulingModel(ValidModel(), SchedulingParameters()));
}

TEST(FindErrorInLabSchedulingModelTest, DuplicateStaffName) {
  LabSchedulingModel model = ValidModel();
  model.mutable_staff(1)->set_name("Ada");
  EXPECT_THAT(FindErrorInLabSchedulingModel(model),
              HasSubstr("duplicate staff name 'Ada'"));
}

TEST(FindErrorInLabSchedulingModelTest, InvalidHiredHours) {
  LabSchedulingModel model = ValidModel();
  model.mutable_staff(0)->set_hours_hired(-1);
  EXPECT_THAT(FindErrorInLabSchedulingModel(model), HasSubstr("hired hours"));
}

TEST(FindErrorInLabSchedulingModelTest, EmptyRequirementSet) {
  LabSchedulingModel model = ValidModel();
  model.clear_slots();
  EXPECT_THAT(FindErrorInLabSchedulingModel(model),
              HasSubstr("empty requirement set"));
}

TEST(FindErrorInLabSchedulingModelTest, NonPositiveHeadcount) {
  LabSchedulingModel model = ValidModel();
  model.mutable_slots(0)->set_required_headcount(0);
  EXPECT_THAT(FindErrorInLabSchedulingModel(model),
              HasSubstr("non-positive required headcount"));
}

TEST(FindErrorInLabSchedulingModelTest, DuplicateSlotId) {
  LabSchedulingModel model = ValidModel();
  *model.add_slots() = model.slots(0);
  EXPECT_THAT(FindErrorInLabSchedulingModel(model),
              HasSubstr("duplicate slot id"));
}

TEST(FindErrorInLabSchedulingModelTest, BadTimeRanges) {
  LabSchedulingModel model = ValidModel();
  model.mutable_slots(0)->set_end_minute(540);
  EXPECT_THAT(FindErrorInLabSchedulingModel(model),
              HasSubstr("does not start before it ends"));

  model = ValidModel();
  model.mutable_slots(0)->clear_day();
  EXPECT_THAT(FindErrorInLabSchedulingModel(model), HasSubstr("has no day"));

  model = ValidModel();
  model.mutable_unavailability(0)->set_end_minute(1500);
  EXPECT_THAT(FindErrorInLabSchedulingModel(model),
              HasSubstr("outside of the day"));
}

TEST(FindErrorInSchedulingParametersTest, Defaults) {
  const SchedulingParameters parameters;
  EXPECT_EQ(parameters.max_daily_hours(), 4.0);
  EXPECT_EQ(parameters.max_labs_per_staff(), 3);
  EXPECT_EQ(parameters.secondary_objective(),
            SchedulingParameters::NO_SECONDARY_OBJECTIVE);
  EXPECT_THAT(FindErrorInSchedulingParameters(parameters, ValidModel()),
              IsEmpty());
}

TEST(FindErrorInSchedulingParametersTest, NonPositiveCaps) {
  SchedulingParameters parameters;
  parameters.set_max_daily_hours(0);
  EXPECT_THAT(FindErrorInSchedulingParameters(parameters, ValidModel()),
              HasSubstr("max_daily_hours"));

  parameters = SchedulingParameters();
  parameters.set_max_labs_per_staff(-2);
  EXPECT_THAT(FindErrorInSchedulingParameters(parameters, ValidModel()),
              HasSubstr("max_labs_per_staff"));

  parameters = SchedulingParameters();
  parameters.set_secondary_objective(SchedulingParameters::BALANCE_UTILIZATION);
  parameters.set_balance_step_minutes(0);
  EXPECT_THAT(FindErrorInSchedulingParameters(parameters, ValidModel()),
              HasSubstr("balance_step_minutes"));
}

TEST(FindErrorInSchedulingParametersTest, NegativeSearchLimits) {
  SchedulingParameters parameters;
  EXPECT_EQ(parameters.num_workers(), 1);
  parameters.set_max_number_of_conflicts(-1);
  EXPECT_THAT(FindErrorInSchedulingParameters(parameters, ValidModel()),
              HasSubstr("max_number_of_conflicts"));

  parameters = SchedulingParameters();
  parameters.set_num_workers(-4);
  EXPECT_THAT(FindErrorInSchedulingParameters(parameters, ValidModel()),
              HasSubstr("num_workers"));

  parameters.set_num_workers(0);
  EXPECT_THAT(FindErrorInSchedulingParameters(parameters, ValidModel()),
              IsEmpty());
}

TEST(FindErrorInSchedulingParametersTest, DailyCapShorterThanEverySlot) {
  SchedulingParameters parameters;
  parameters.set_max_daily_hours(1.5);
  EXPECT_THAT(FindErrorInSchedulingParameters(parameters, ValidModel()),
              HasSubstr("shorter than every slot"));
  parameters.set_max_daily_hours(2);
  EXPECT_THAT(FindErrorInSchedulingParameters(parameters, ValidModel()),
              IsEmpty());
}

TEST(ValidateLabSchedulingModelTest, ReturnsConfigurationErrors) {
  LabSchedulingModel model = ValidModel();
  model.mutable_slots(0)->set_required_headcount(0);
  const absl::Status status =
      ValidateLabSchedulingModel(model, SchedulingParameters());
  EXPECT_TRUE(IsConfigurationError(status)) << status;
  EXPECT_THAT(status.message(), HasSubstr("lab1-mon"));
}

}  // namespace
}  // namespace labsched
