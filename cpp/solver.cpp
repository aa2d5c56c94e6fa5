#include "solver.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "google/protobuf/text_format.h"
#include "ortools/sat/cp_model_solver.h"
#include "ortools/sat/model.h"

using namespace std;

namespace assign_groups {

string TerminationStatusName(TerminationStatus status) {
    switch (status) {
        case TerminationStatus::kOptimal:
            return "OPTIMAL";
        case TerminationStatus::kTimeLimit:
            return "TIME_LIMIT";
        case TerminationStatus::kInfeasible:
            return "INFEASIBLE";
        case TerminationStatus::kOther:
            return "OTHER";
    }
    return "OTHER";
}

optional<double> SolveResult::RelativeGap() const {
    if (status != TerminationStatus::kTimeLimit || !HasSolution()) return nullopt;
    return std::abs(objective - best_bound) / std::max(1.0, std::abs(objective));
}

TerminationStatus CpSatSolver::ConvertStatus(sat::CpSolverStatus status) {
    switch (status) {
        case sat::CpSolverStatus::OPTIMAL:
            return TerminationStatus::kOptimal;
        // CP-SAT only stops short of a proof when a limit was reached.
        case sat::CpSolverStatus::FEASIBLE:
        case sat::CpSolverStatus::UNKNOWN:
            return TerminationStatus::kTimeLimit;
        case sat::CpSolverStatus::INFEASIBLE:
            return TerminationStatus::kInfeasible;
        default:
            return TerminationStatus::kOther;
    }
}

absl::StatusOr<sat::SatParameters> CpSatSolver::MakeParameters(const SolverOptions& options) {
    sat::SatParameters parameters;
    parameters.set_log_search_progress(options.verbose);
    if (options.time_limit_secs > 0) {
        parameters.set_max_time_in_seconds(options.time_limit_secs);
    }
    parameters.set_random_seed(42);
    parameters.set_randomize_search(false);

    for (const auto& [name, value] : options.tuning) {
        const string text = absl::StrCat(name, ": ", value);
        if (!google::protobuf::TextFormat::MergeFromString(text, &parameters)) {
            return absl::InvalidArgumentError(
                absl::StrCat("CP-SAT rejected solver option '", text, "'"));
        }
    }
    return parameters;
}

absl::StatusOr<SolveResult> CpSatSolver::Solve(const sat::CpModelProto& model,
                                               const SolverOptions& options) {
    absl::StatusOr<sat::SatParameters> parameters = MakeParameters(options);
    if (!parameters.ok()) return parameters.status();

    sat::Model cp_model;
    cp_model.Add(sat::NewSatParameters(*parameters));
    const sat::CpSolverResponse response = sat::SolveCpModel(model, &cp_model);

    VLOG(1) << "CP-SAT finished with " << sat::CpSolverStatus_Name(response.status())
            << " after " << response.wall_time() << "s";

    SolveResult result;
    result.status = ConvertStatus(response.status());
    result.objective = response.objective_value();
    result.best_bound = response.best_objective_bound();
    result.wall_time_secs = response.wall_time();
    if (response.status() == sat::CpSolverStatus::OPTIMAL ||
        response.status() == sat::CpSolverStatus::FEASIBLE) {
        result.values.reserve(response.solution_size());
        for (const int64_t v : response.solution()) {
            result.values.push_back(static_cast<double>(v));
        }
    }
    return result;
}

}  // namespace assign_groups
