#pragma once

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "extract.hpp"
#include "ortools/sat/cp_model.h"
#include "solver.hpp"
#include "students.hpp"

namespace assign_groups {

// How the same-program and repeat-partner penalties count collisions.
enum class PenaltyMode {
    // Linear formulation: penalize each occurrence beyond the first, i.e.
    // max(0, count - 1) per (option, program) and per pair of students.
    kExtraOccurrences,
    // Legacy formulation: the number of same-program pairs sharing an option,
    // plus the squared number of options each pair shares. Breaks ties
    // differently and counts the first meeting too.
    kPairwiseProducts,
};

struct ImmersionOptions {
    double preference_weight = 1.0;
    double imbalance_weight = 1.0;
    double same_program_weight = 1.0;
    double same_partner_weight = 1.0;
    // Whether weeks with an all-zero preference matrix still count toward the
    // group size imbalance penalty.
    bool balance_sentinel_weeks = true;
    PenaltyMode penalty_mode = PenaltyMode::kExtraOccurrences;
    SolverOptions solver;
};

struct ImmersionResult {
    // False when every student was already fully assigned and the solver was
    // not called.
    bool solved = false;
    TerminationStatus status = TerminationStatus::kOther;
};

// Checks shapes, preference domains, stored assignments and weights.
absl::Status ValidateImmersionInputs(const std::vector<ImmersionStudent>& students,
                                     const std::vector<PreferenceMatrix>& preferences,
                                     const ImmersionOptions& options);

// Formulates the multi-week assignment on a CpModelBuilder. Options of all
// weeks are laid out back to back; x[i][c] is true when student i picks
// concatenated option c.
class ImmersionModel {
public:
    ImmersionModel(const std::vector<ImmersionStudent>& students,
                   const std::vector<PreferenceMatrix>& preferences,
                   const ImmersionOptions& options, sat::CpModelBuilder* model);

    void InitAssignment();
    // Weeks already stored on a student are fixed to their stored option.
    void FixPreassigned();
    void AddImbalance();
    void AddSameProgram();
    void AddSamePartner();
    sat::DoubleLinearExpr BuildObjective() const;

    std::vector<std::vector<int>> AssignmentIndices() const;
    const WeekLayout& layout() const { return week_layout; }
    const std::vector<int>& first_free_week() const { return free_from; }

private:
    // Helper: Boolean that is true exactly when a and b both are.
    sat::BoolVar NewAnd(sat::BoolVar a, sat::BoolVar b);

    const std::vector<ImmersionStudent>& students;
    const std::vector<PreferenceMatrix>& preferences;
    const ImmersionOptions& options;
    sat::CpModelBuilder* model;

    int num_students;
    WeekLayout week_layout;
    std::vector<int> free_from;
    std::vector<std::vector<sat::BoolVar>> x;

    std::vector<sat::IntVar> week_max_size;
    std::vector<sat::IntVar> week_min_size;
    std::vector<sat::IntVar> program_excess;
    std::vector<sat::BoolVar> program_products;
    std::vector<sat::IntVar> partner_excess;
    std::vector<sat::IntVar> partner_squares;
};

// Extends every student's assignment by one option per remaining week.
//
// Weeks already stored on a student are kept fixed and only the following
// weeks are optimized; the choices are appended in place. When every student
// is already fully assigned this logs a warning and changes nothing. A
// non-optimal solve is logged as an error and the best solution found is
// still applied; without any solution the students are left untouched.
absl::StatusOr<ImmersionResult> AssignImmersion(std::vector<ImmersionStudent>& students,
                                                const std::vector<PreferenceMatrix>& preferences,
                                                Solver& solver,
                                                const ImmersionOptions& options = {});

// Same, solved with CP-SAT.
absl::StatusOr<ImmersionResult> AssignImmersion(std::vector<ImmersionStudent>& students,
                                                const std::vector<PreferenceMatrix>& preferences,
                                                const ImmersionOptions& options = {});

}  // namespace assign_groups
