#include "analysis.hpp"

#include <vector>

#include "absl/status/status.h"
#include "gtest/gtest.h"

namespace assign_groups {
namespace {

TEST(AnalyzeAssignmentTest, CountsCollisionsPerCell) {
    const std::vector<ImmersionStudent> students = {
        {"Ann", "Archer", "Math", {1, 2}},
        {"Bob", "Baker", "Math", {1, 1}},
        {"Cid", "Cook", "Math", {1, 2}},
        {"Dee", "Dyer", "Art", {2, 2}},
    };
    const std::vector<PreferenceMatrix> prefs = {
        MatrixFromRows({{1, 2}, {2, 1}, {1, 3}, {3, 1}}),
        MatrixFromRows({{2, 1}, {1, 2}, {2, 1}, {4, 2}}),
    };
    absl::StatusOr<AssignmentStats> stats = AnalyzeAssignment(students, prefs);
    ASSERT_TRUE(stats.ok()) << stats.status();

    // Week 1: 1 + 2 + 1 + 1, week 2: 1 + 1 + 1 + 2.
    EXPECT_DOUBLE_EQ(stats->mean_preference, 10.0 / 8.0);
    // Week 1 puts three students in option 1 and one in option 2.
    EXPECT_EQ(stats->max_imbalance, 2);

    EXPECT_EQ(stats->ProgramCount(1, 1, "Math"), 2);
    EXPECT_EQ(stats->ProgramCount(2, 2, "Math"), 1);
    EXPECT_EQ(stats->ProgramCount(2, 1, "Math"), 0);
    EXPECT_EQ(stats->program_collisions.size(), 2u);

    EXPECT_EQ(stats->PairCount("Archer, Ann", "Cook, Cid"), 2);
    EXPECT_EQ(stats->PairCount("Cook, Cid", "Archer, Ann"), 2);
    EXPECT_EQ(stats->PairCount("Archer, Ann", "Baker, Bob"), 1);
    EXPECT_EQ(stats->PairCount("Baker, Bob", "Dyer, Dee"), 0);
    EXPECT_EQ(stats->pair_collisions.count({"Baker, Bob", "Dyer, Dee"}), 0u);
}

TEST(AnalyzeAssignmentTest, SentinelWeeksDoNotCountTowardMean) {
    const std::vector<ImmersionStudent> students = {
        {"Ann", "Archer", "Math", {1, 1}},
        {"Bob", "Baker", "Art", {2, 2}},
    };
    const std::vector<PreferenceMatrix> prefs = {
        PreferenceMatrix(2, 2),
        MatrixFromRows({{3, 1}, {1, 2}}),
    };
    absl::StatusOr<AssignmentStats> stats = AnalyzeAssignment(students, prefs);
    ASSERT_TRUE(stats.ok()) << stats.status();
    EXPECT_DOUBLE_EQ(stats->mean_preference, 2.5);
    EXPECT_EQ(stats->max_imbalance, 0);
    EXPECT_TRUE(stats->pair_collisions.empty());
    EXPECT_TRUE(stats->program_collisions.empty());
}

TEST(AnalyzeAssignmentTest, EmptyOptionsCountAsImbalance) {
    const std::vector<ImmersionStudent> students = {
        {"Ann", "Archer", "Math", {1}},
        {"Bob", "Baker", "Art", {1}},
    };
    absl::StatusOr<AssignmentStats> stats =
        AnalyzeAssignment(students, {MatrixFromRows({{1, 2, 3}, {1, 2, 3}})});
    ASSERT_TRUE(stats.ok()) << stats.status();
    EXPECT_EQ(stats->max_imbalance, 2);
    EXPECT_EQ(stats->PairCount("Archer, Ann", "Baker, Bob"), 1);
}

TEST(AnalyzeAssignmentTest, RequiresCompleteAssignment) {
    std::vector<ImmersionStudent> students = {
        {"Ann", "Archer", "Math", {1, 2}},
        {"Bob", "Baker", "Art", {1}},
    };
    const std::vector<PreferenceMatrix> prefs = {PreferenceMatrix(2, 2), PreferenceMatrix(2, 2)};
    EXPECT_EQ(AnalyzeAssignment(students, prefs).status().code(),
              absl::StatusCode::kInvalidArgument);

    students[1].assigned = {1, 3};
    EXPECT_EQ(AnalyzeAssignment(students, prefs).status().code(),
              absl::StatusCode::kInvalidArgument);

    students[1].assigned = {1, 2};
    EXPECT_EQ(AnalyzeAssignment(students, {PreferenceMatrix(3, 2), PreferenceMatrix(2, 2)})
                  .status()
                  .code(),
              absl::StatusCode::kInvalidArgument);
}

}  // namespace
}  // namespace assign_groups
