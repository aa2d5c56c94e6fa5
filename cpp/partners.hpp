#pragma once

#include <cstdint>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "ortools/sat/cp_model.h"
#include "solver.hpp"
#include "students.hpp"

namespace assign_groups {

// Scores are fixed-point in the model: a score of 1.25 becomes 1250.
inline constexpr int kScoreScale = 1000;

// Largest scaled deviation bound accepted, well inside CP-SAT's int64 range.
inline constexpr double kMaxDeviationBound = 1e18;

struct PartnerOptions {
    SolverOptions solver;
};

struct PartnerAssignment {
    std::vector<std::vector<PartnerStudent>> groups;
    TerminationStatus status = TerminationStatus::kOther;
};

// Checks the inputs of AssignPartners without building anything.
absl::Status ValidatePartnerInputs(const std::vector<PartnerStudent>& students, int num_groups,
                                   const PreferenceMatrix& preferences);

// Formulates the balanced partition with partner bonuses on a CpModelBuilder.
//
// The objective is the L1 norm of the per-group score deviations plus, for
// each pair with a nonzero preference, the preference value whenever the
// pair shares a group. Negative preferences therefore pull pairs together
// and must outweigh the balance term to win.
class PartnerModel {
public:
    PartnerModel(const std::vector<PartnerStudent>& students, int num_groups,
                 const PreferenceMatrix& preferences, sat::CpModelBuilder* model);

    // assign[i][g] for every student and group; each student in one group.
    void InitAssignment();
    // Group sizes stay within [floor(n/g), ceil(n/g)]; with more groups than
    // students that is [0, 1].
    void AddGroupSizes();
    // Epigraph of the summed absolute score deviations.
    void AddScoreBalance();
    // Co-assignment indicators for pairs with a nonzero preference.
    void AddPairing();
    sat::DoubleLinearExpr BuildObjective() const;

    // Variable indices of assign[i][g], for extraction.
    std::vector<std::vector<int>> AssignmentIndices() const;

    int min_group_size() const { return min_size; }
    int max_group_size() const { return max_size; }

private:
    int num_students;
    int num_groups;
    const PreferenceMatrix& preferences;
    sat::CpModelBuilder* model;

    int min_size;
    int max_size;
    std::vector<int64_t> scaled_scores;

    std::vector<std::vector<sat::BoolVar>> assign;
    std::vector<sat::IntVar> group_size;
    sat::IntVar total_deviation;

    struct Pairing {
        int first;
        int second;
        sat::BoolVar together;
    };
    std::vector<Pairing> pairings;
};

// Splits `students` into `num_groups` groups, balancing the mean score and
// honoring partner preferences. The students are not modified.
//
// A non-optimal solve is reported with LOG(ERROR) and the best solution found
// is still returned; with no solution at all the groups are empty.
absl::StatusOr<PartnerAssignment> AssignPartners(const std::vector<PartnerStudent>& students,
                                                 int num_groups,
                                                 const PreferenceMatrix& preferences,
                                                 Solver& solver,
                                                 const PartnerOptions& options = {});

// Same, solved with CP-SAT.
absl::StatusOr<PartnerAssignment> AssignPartners(const std::vector<PartnerStudent>& students,
                                                 int num_groups,
                                                 const PreferenceMatrix& preferences,
                                                 const PartnerOptions& options = {});

}  // namespace assign_groups
