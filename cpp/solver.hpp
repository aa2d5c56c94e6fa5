#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "ortools/sat/cp_model.pb.h"
#include "ortools/sat/sat_parameters.pb.h"

namespace assign_groups {

namespace sat = operations_research::sat;

// Outcome of a solve, reduced to what the model builders act on.
enum class TerminationStatus {
    kOptimal,
    kTimeLimit,
    kInfeasible,
    kOther,
};

// "OPTIMAL", "TIME_LIMIT", "INFEASIBLE" or "OTHER".
std::string TerminationStatusName(TerminationStatus status);

struct SolverOptions {
    bool verbose = false;
    double time_limit_secs = 60.0;
    // Solver-specific parameters, passed through without interpretation.
    // For CP-SAT these are SatParameters fields, e.g. {"num_workers", "8"}.
    std::vector<std::pair<std::string, std::string>> tuning;
};

struct SolveResult {
    TerminationStatus status = TerminationStatus::kOther;
    // One entry per model variable, indexed like the model's variables.
    // Empty when the solver found no solution.
    std::vector<double> values;
    double objective = 0.0;
    double best_bound = 0.0;
    double wall_time_secs = 0.0;

    bool HasSolution() const { return !values.empty(); }

    // |objective - best_bound| / max(1, |objective|), only for a time-limited
    // solve that produced a solution.
    std::optional<double> RelativeGap() const;
};

// The external optimizer. Implementations take a finished model, block until
// it is solved or the time limit is hit, and report whatever they have.
class Solver {
public:
    virtual ~Solver() = default;

    virtual absl::StatusOr<SolveResult> Solve(const sat::CpModelProto& model,
                                              const SolverOptions& options) = 0;
};

// Solves with OR-Tools CP-SAT.
class CpSatSolver : public Solver {
public:
    absl::StatusOr<SolveResult> Solve(const sat::CpModelProto& model,
                                      const SolverOptions& options) override;

    // Builds the SatParameters for `options`; fails when CP-SAT does not
    // recognize one of the tuning entries.
    static absl::StatusOr<sat::SatParameters> MakeParameters(const SolverOptions& options);

    static TerminationStatus ConvertStatus(sat::CpSolverStatus status);
};

}  // namespace assign_groups
