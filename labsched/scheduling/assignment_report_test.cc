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

#include "labsched/scheduling/assignment_report.h"

#include <optional>
#include <string>

#include "absl/status/status.h"
#include "gtest/gtest.h"
#include "labsched/base/gmock.h"
#include "labsched/base/parse_test_proto.h"
#include "labsched/scheduling/assignment_model.h"
#include "labsched/scheduling/availability_index.h"
#include "labsched/scheduling/lab_scheduling.pb.h"
#include "labsched/scheduling/scheduling_errors.h"
#include "labsched/solver/cp_sat_solver.h"

namespace labsched {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

class AssignmentReportTest : public ::testing::Test {
 protected:
  static LabSchedulingModel TestProblem() {
    return ParseTestProto(R"pb(
      staff { name: "Ada" hours_hired: 4 }
      staff { name: "Brian" hours_hired: 2 }
      staff { name: "Carla" hours_hired: 3 has_availability: false }
      unavailability {
        staff_name: "Brian"
        day: TUESDAY
        start_minute: 540
        end_minute: 600
      }
      slots {
        id: "lab1-mon"
        label: "Lab 1"
        day: MONDAY
        start_minute: 540
        end_minute: 660
        required_headcount: 2
      }
      slots {
        id: "lab1-tue"
        label: "Lab 1"
        day: TUESDAY
        start_minute: 540
        end_minute: 600
        required_headcount: 1
      }
      slots {
        id: "lab2-mon"
        label: "Lab 2"
        day: MONDAY
        start_minute: 600
        end_minute: 720
        required_headcount: 1
      }
      slots {
        id: "late"
        day: FRIDAY
        start_minute: 1200
        end_minute: 1440
        required_headcount: 1
      }
    )pb");
  }

  AssignmentReportTest() : problem_(TestProblem()) {}

  void SetUp() override {
    ASSERT_OK_AND_ASSIGN(index_, AvailabilityIndex::Create(problem_));
    ASSERT_OK_AND_ASSIGN(model_, AssignmentModel::Build(problem_, *index_,
                                                        parameters_, &solver_));
  }

  // Ada works Monday morning and Tuesday, Brian Monday morning.
  SolutionSnapshot ValidSnapshot() const {
    return ParseTestProto(R"pb(
      objective_value: 3
      covered_headcount: 3
      slots { staff_indices: 0 staff_indices: 1 }
      slots { staff_indices: 0 }
      slots {}
      slots {}
    )pb");
  }

  absl::Status Verify(const SolutionSnapshot& snapshot) const {
    return VerifySolutionSnapshot(problem_, *index_, parameters_, snapshot);
  }

  const LabSchedulingModel problem_;
  const SchedulingParameters parameters_;
  CpSatBooleanLinearSolver solver_{"report"};
  std::optional<AvailabilityIndex> index_;
  std::optional<AssignmentModel> model_;
};

TEST_F(AssignmentReportTest, SlotSection) {
  const AssignmentReport report = ExtractAssignmentReport(
      problem_, *model_, ValidSnapshot(), parameters_);
  ASSERT_EQ(report.slots_size(), 4);
  EXPECT_EQ(report.covered_headcount(), 3);
  EXPECT_EQ(report.required_headcount(), 5);
  EXPECT_EQ(report.objective_value(), 3);

  const SlotReport& monday = report.slots(0);
  EXPECT_EQ(monday.id(), "lab1-mon");
  EXPECT_EQ(monday.label(), "Lab 1");
  EXPECT_THAT(monday.assigned_staff(), ElementsAre("Ada", "Brian"));
  EXPECT_EQ(monday.shortfall(), 0);
  EXPECT_DOUBLE_EQ(monday.fill_ratio(), 1.0);

  // A slot with nothing assigned is still reported.
  const SlotReport& lab2 = report.slots(2);
  EXPECT_THAT(lab2.assigned_staff(), IsEmpty());
  EXPECT_EQ(lab2.shortfall(), 1);
  EXPECT_DOUBLE_EQ(lab2.fill_ratio(), 0.0);
  EXPECT_FALSE(lab2.unfillable());

  // Only Ada can work the four hour slot.
  EXPECT_FALSE(report.slots(3).unfillable());
}

TEST_F(AssignmentReportTest, ShortfallSection) {
  const AssignmentReport report = ExtractAssignmentReport(
      problem_, *model_, ValidSnapshot(), parameters_);
  ASSERT_EQ(report.shortfalls_size(), 2);
  EXPECT_EQ(report.shortfalls(0).slot_id(), "lab2-mon");
  EXPECT_EQ(report.shortfalls(0).shortfall(), 1);
  EXPECT_EQ(report.shortfalls(1).slot_id(), "late");
  EXPECT_EQ(report.shortfalls(1).assigned_count(), 0);
}

TEST_F(AssignmentReportTest, StaffSection) {
  const AssignmentReport report = ExtractAssignmentReport(
      problem_, *model_, ValidSnapshot(), parameters_);
  ASSERT_EQ(report.staff_size(), 3);

  const StaffReport& ada = report.staff(0);
  EXPECT_DOUBLE_EQ(ada.hours_used(), 3.0);
  EXPECT_DOUBLE_EQ(ada.hours_hired(), 4.0);
  EXPECT_DOUBLE_EQ(ada.remaining_hours(), 1.0);
  EXPECT_EQ(ada.slot_count(), 2);
  EXPECT_EQ(ada.lab_count(), 1);
  EXPECT_EQ(ada.lab_cap(), 3);
  EXPECT_THAT(ada.assigned_slot_ids(), ElementsAre("lab1-mon", "lab1-tue"));
  ASSERT_EQ(ada.daily_hours_size(), 2);
  EXPECT_EQ(ada.daily_hours(0).day(), MONDAY);
  EXPECT_DOUBLE_EQ(ada.daily_hours(0).hours(), 2.0);
  EXPECT_EQ(ada.daily_hours(1).day(), TUESDAY);
  EXPECT_DOUBLE_EQ(ada.daily_hours(1).hours(), 1.0);

  const StaffReport& carla = report.staff(2);
  EXPECT_FALSE(carla.has_availability());
  EXPECT_EQ(carla.slot_count(), 0);
  EXPECT_DOUBLE_EQ(carla.hours_used(), 0.0);
}

TEST_F(AssignmentReportTest, UnfillableSlotIsFlagged) {
  // With Ada at zero hours, nobody can work the four hour slot.
  LabSchedulingModel problem = problem_;
  problem.mutable_staff(0)->set_hours_hired(0);
  ASSERT_OK_AND_ASSIGN(const AvailabilityIndex index,
                       AvailabilityIndex::Create(problem));
  CpSatBooleanLinearSolver solver("unfillable");
  ASSERT_OK_AND_ASSIGN(
      const AssignmentModel model,
      AssignmentModel::Build(problem, index, parameters_, &solver));
  const AssignmentReport report = ExtractAssignmentReport(
      problem, model, model.EmptySnapshot(), parameters_);
  EXPECT_TRUE(report.slots(3).unfillable());
  ASSERT_EQ(report.shortfalls_size(), 4);
  EXPECT_TRUE(report.shortfalls(3).unfillable());
  EXPECT_OK(VerifyAssignmentReport(problem, index, parameters_, report));
}

TEST_F(AssignmentReportTest, ValidReportVerifies) {
  EXPECT_OK(Verify(ValidSnapshot()));
  const AssignmentReport report = ExtractAssignmentReport(
      problem_, *model_, ValidSnapshot(), parameters_);
  EXPECT_OK(VerifyAssignmentReport(problem_, *index_, parameters_, report));
}

TEST_F(AssignmentReportTest, DetectsOverstaffing) {
  SolutionSnapshot snapshot = ValidSnapshot();
  snapshot.mutable_slots(1)->add_staff_indices(1);
  snapshot.set_covered_headcount(4);
  const absl::Status status = Verify(snapshot);
  EXPECT_TRUE(IsSolverFailure(status));
  EXPECT_THAT(status.message(), HasSubstr("lab1-tue"));
}

TEST_F(AssignmentReportTest, DetectsUnavailableStaff) {
  SolutionSnapshot snapshot = ValidSnapshot();
  snapshot.mutable_slots(1)->set_staff_indices(0, 1);
  const absl::Status status = Verify(snapshot);
  EXPECT_TRUE(IsSolverFailure(status));
  EXPECT_THAT(status.message(), HasSubstr("not available"));

  snapshot = ValidSnapshot();
  snapshot.mutable_slots(2)->add_staff_indices(2);
  snapshot.set_covered_headcount(4);
  EXPECT_THAT(Verify(snapshot).message(), HasSubstr("Carla"));
}

TEST_F(AssignmentReportTest, DetectsDoubleBookingAndHourCaps) {
  // Brian on both Monday slots, which overlap from 10:00 to 11:00.
  SolutionSnapshot snapshot = ValidSnapshot();
  snapshot.mutable_slots(2)->add_staff_indices(1);
  snapshot.set_covered_headcount(4);
  EXPECT_THAT(Verify(snapshot).message(), HasSubstr("double-booked"));

  snapshot = ValidSnapshot();
  snapshot.mutable_slots(3)->add_staff_indices(1);
  snapshot.set_covered_headcount(4);
  EXPECT_THAT(Verify(snapshot).message(), HasSubstr("hired hours"));
}

TEST_F(AssignmentReportTest, DetectsDailyAndLabCaps) {
  LabSchedulingModel problem = problem_;
  problem.mutable_staff(0)->set_hours_hired(10);
  ASSERT_OK_AND_ASSIGN(const AvailabilityIndex index,
                       AvailabilityIndex::Create(problem));
  SchedulingParameters parameters;
  parameters.set_max_daily_hours(2.5);
  parameters.set_max_labs_per_staff(1);
  // Ada: Monday 9-11 (Lab 1) and Friday 20-24 (its own lab).
  SolutionSnapshot snapshot = ParseTestProto(R"pb(
    covered_headcount: 2
    slots { staff_indices: 0 }
    slots {}
    slots {}
    slots { staff_indices: 0 }
  )pb");
  absl::Status status =
      VerifySolutionSnapshot(problem, index, parameters, snapshot);
  EXPECT_THAT(status.message(), HasSubstr("Friday"));

  parameters.set_max_daily_hours(4);
  status = VerifySolutionSnapshot(problem, index, parameters, snapshot);
  EXPECT_THAT(status.message(), HasSubstr("labs"));
}

TEST_F(AssignmentReportTest, DetectsInconsistentCounts) {
  SolutionSnapshot snapshot = ValidSnapshot();
  snapshot.set_covered_headcount(2);
  EXPECT_TRUE(IsSolverFailure(Verify(snapshot)));

  snapshot = ValidSnapshot();
  snapshot.add_slots();
  EXPECT_TRUE(IsSolverFailure(Verify(snapshot)));
}

TEST_F(AssignmentReportTest, Format) {
  AssignmentReport report = ExtractAssignmentReport(problem_, *model_,
                                                    ValidSnapshot(), parameters_);
  report.set_status(OPTIMAL);
  report.set_proven_optimal(true);
  report.set_termination_reason(SEARCH_COMPLETED);
  const std::string text = FormatAssignmentReport(report);
  EXPECT_THAT(text, HasSubstr("Status: OPTIMAL, proven optimal"));
  EXPECT_THAT(text, HasSubstr("covered 3 of 5 positions"));
  EXPECT_THAT(text, HasSubstr("Monday 9:00-11:00"));
  EXPECT_THAT(text, HasSubstr("Ada, Brian"));
  EXPECT_THAT(text, HasSubstr("lab2-mon: 1 of 1 missing"));
  EXPECT_THAT(text, HasSubstr("(no response)"));
}

}  // namespace
}  // namespace labsched
