#include "partplanner.h"
#include "test_helpers.h"

#include <gtest/gtest.h>

#include <cstdio>

using namespace b2client;

TEST(PartPlannerTest, ExactMultiple) {
  const auto outcome = PlanParts(2 * kMinPartSize, kMinPartSize);
  ASSERT_TRUE(outcome.IsSuccess());
  const PartPlan &plan = outcome.GetResult();
  ASSERT_EQ(plan.part_count_, 2);
  ASSERT_EQ(plan.part_size_, kMinPartSize);
  ASSERT_EQ(plan.total_size_, 2 * kMinPartSize);
  ASSERT_EQ(plan.PartLength(1), kMinPartSize);
  ASSERT_EQ(plan.PartLength(2), kMinPartSize);
}

TEST(PartPlannerTest, RemainderGoesToLastPart) {
  const auto outcome = PlanParts(kMinPartSize + 1, kMinPartSize);
  ASSERT_TRUE(outcome.IsSuccess());
  const PartPlan &plan = outcome.GetResult();
  ASSERT_EQ(plan.part_count_, 2);
  ASSERT_EQ(plan.PartLength(1), kMinPartSize);
  ASSERT_EQ(plan.PartLength(2), 1);
}

TEST(PartPlannerTest, EmptySizeIsOnePart) {
  const auto outcome = PlanParts(0, kDefaultPartSize);
  ASSERT_TRUE(outcome.IsSuccess());
  ASSERT_EQ(outcome.GetResult().part_count_, 1);
  ASSERT_EQ(outcome.GetResult().PartLength(1), 0);
}

TEST(PartPlannerTest, CountCoversSize) {
  const tOffset part_size = 7 * kOneMB;
  for (tOffset size :
       {tOffset{1}, part_size - 1, part_size, part_size + 1,
        10 * part_size + 3, tOffset{123456789}}) {
    const auto outcome = PlanParts(size, part_size);
    ASSERT_TRUE(outcome.IsSuccess());
    const PartPlan &plan = outcome.GetResult();
    ASSERT_EQ(plan.part_count_, (size + part_size - 1) / part_size) << size;
    ASSERT_GE(plan.part_count_ * plan.part_size_, size);
    ASSERT_LT((plan.part_count_ - 1) * plan.part_size_, size);
  }
}

TEST(PartPlannerTest, SameInputSamePlan) {
  const auto first = PlanParts(123456789, kMinPartSize);
  const auto second = PlanParts(123456789, kMinPartSize);
  ASSERT_TRUE(first.IsSuccess());
  ASSERT_TRUE(second.IsSuccess());
  ASSERT_EQ(first.GetResult().part_count_, second.GetResult().part_count_);
  ASSERT_EQ(first.GetResult().part_size_, second.GetResult().part_size_);
}

TEST(PartPlannerTest, PartSizeBounds) {
  ASSERT_TRUE(ValidatePartSize(kMinPartSize).IsSuccess());
  ASSERT_TRUE(ValidatePartSize(kMaxPartSize).IsSuccess());

  const auto too_small = PlanParts(100, kMinPartSize - 1);
  ASSERT_FALSE(too_small.IsSuccess());
  ASSERT_EQ(too_small.GetError().GetErrorType(), B2Errors::CONFIG);

  const auto too_large = PlanParts(100, kMaxPartSize + 1);
  ASSERT_FALSE(too_large.IsSuccess());
  ASSERT_EQ(too_large.GetError().GetErrorType(), B2Errors::CONFIG);
}

TEST(PartPlannerTest, NegativeSizeFailure) {
  const auto outcome = PlanParts(-1, kMinPartSize);
  ASSERT_FALSE(outcome.IsSuccess());
  ASSERT_EQ(outcome.GetError().GetErrorType(), B2Errors::CONFIG);
}

TEST(PartPlannerTest, PlanForLocalFile) {
  const std::string path = testing_helpers::WriteTempFile(
      "planner", testing_helpers::MakeContent(1000));

  const auto outcome = PlanPartsForFile(path, kMinPartSize);
  ASSERT_TRUE(outcome.IsSuccess());
  ASSERT_EQ(outcome.GetResult().total_size_, 1000);
  ASSERT_EQ(outcome.GetResult().part_count_, 1);

  std::remove(path.c_str());
}

TEST(PartPlannerTest, PlanForMissingFileFailure) {
  const auto outcome = PlanPartsForFile(
      testing_helpers::MakeTempPath("planner-missing"), kMinPartSize);
  ASSERT_FALSE(outcome.IsSuccess());
  ASSERT_EQ(outcome.GetError().GetErrorType(), B2Errors::CONFIG);
}
