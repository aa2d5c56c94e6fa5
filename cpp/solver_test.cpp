#include "solver.hpp"

#include "absl/status/status.h"
#include "gtest/gtest.h"
#include "ortools/sat/cp_model.h"

namespace assign_groups {
namespace {

TEST(TerminationStatusTest, Names) {
    EXPECT_EQ(TerminationStatusName(TerminationStatus::kOptimal), "OPTIMAL");
    EXPECT_EQ(TerminationStatusName(TerminationStatus::kTimeLimit), "TIME_LIMIT");
    EXPECT_EQ(TerminationStatusName(TerminationStatus::kInfeasible), "INFEASIBLE");
    EXPECT_EQ(TerminationStatusName(TerminationStatus::kOther), "OTHER");
}

TEST(TerminationStatusTest, ConvertsCpSatStatuses) {
    EXPECT_EQ(CpSatSolver::ConvertStatus(sat::CpSolverStatus::OPTIMAL),
              TerminationStatus::kOptimal);
    EXPECT_EQ(CpSatSolver::ConvertStatus(sat::CpSolverStatus::FEASIBLE),
              TerminationStatus::kTimeLimit);
    EXPECT_EQ(CpSatSolver::ConvertStatus(sat::CpSolverStatus::UNKNOWN),
              TerminationStatus::kTimeLimit);
    EXPECT_EQ(CpSatSolver::ConvertStatus(sat::CpSolverStatus::INFEASIBLE),
              TerminationStatus::kInfeasible);
    EXPECT_EQ(CpSatSolver::ConvertStatus(sat::CpSolverStatus::MODEL_INVALID),
              TerminationStatus::kOther);
}

TEST(SolveResultTest, GapOnlyForTimeLimitedSolutions) {
    SolveResult result;
    result.status = TerminationStatus::kTimeLimit;
    result.values = {1.0};
    result.objective = 4.0;
    result.best_bound = 3.0;
    ASSERT_TRUE(result.RelativeGap().has_value());
    EXPECT_DOUBLE_EQ(*result.RelativeGap(), 0.25);

    // Small objectives are not blown up.
    result.objective = 0.5;
    result.best_bound = 0.0;
    EXPECT_DOUBLE_EQ(*result.RelativeGap(), 0.5);

    result.status = TerminationStatus::kOptimal;
    EXPECT_FALSE(result.RelativeGap().has_value());

    result.status = TerminationStatus::kTimeLimit;
    result.values.clear();
    EXPECT_FALSE(result.RelativeGap().has_value());
}

TEST(CpSatSolverTest, ParametersFollowOptions) {
    SolverOptions options;
    options.verbose = true;
    options.time_limit_secs = 12.5;
    options.tuning = {{"num_workers", "1"}, {"relative_gap_limit", "0.01"}};
    absl::StatusOr<sat::SatParameters> parameters = CpSatSolver::MakeParameters(options);
    ASSERT_TRUE(parameters.ok()) << parameters.status();
    EXPECT_TRUE(parameters->log_search_progress());
    EXPECT_DOUBLE_EQ(parameters->max_time_in_seconds(), 12.5);
    EXPECT_EQ(parameters->num_workers(), 1);
    EXPECT_DOUBLE_EQ(parameters->relative_gap_limit(), 0.01);
    EXPECT_EQ(parameters->random_seed(), 42);
}

TEST(CpSatSolverTest, RejectsUnknownTuning) {
    SolverOptions options;
    options.tuning = {{"no_such_parameter", "3"}};
    CpSatSolver solver;
    sat::CpModelBuilder model;
    model.NewBoolVar();
    absl::StatusOr<SolveResult> result = solver.Solve(model.Build(), options);
    EXPECT_EQ(result.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(CpSatSolverTest, SolvesSmallModel) {
    sat::CpModelBuilder model;
    const sat::BoolVar a = model.NewBoolVar();
    const sat::BoolVar b = model.NewBoolVar();
    model.AddExactlyOne({a, b});
    sat::DoubleLinearExpr objective;
    objective.AddTerm(a, 2.5);
    objective.AddTerm(b, 1.0);
    model.Minimize(objective);

    CpSatSolver solver;
    absl::StatusOr<SolveResult> result = solver.Solve(model.Build(), SolverOptions{});
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(result->status, TerminationStatus::kOptimal);
    ASSERT_EQ(result->values.size(), 2u);
    EXPECT_EQ(result->values[a.index()], 0.0);
    EXPECT_EQ(result->values[b.index()], 1.0);
    EXPECT_DOUBLE_EQ(result->objective, 1.0);
}

TEST(CpSatSolverTest, InfeasibleModelHasNoValues) {
    sat::CpModelBuilder model;
    const sat::BoolVar a = model.NewBoolVar();
    model.AddEquality(a, 1);
    model.AddEquality(a, 0);

    CpSatSolver solver;
    absl::StatusOr<SolveResult> result = solver.Solve(model.Build(), SolverOptions{});
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(result->status, TerminationStatus::kInfeasible);
    EXPECT_FALSE(result->HasSolution());
}

}  // namespace
}  // namespace assign_groups
