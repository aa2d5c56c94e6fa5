#include "partners.hpp"

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <optional>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "extract.hpp"
#include "ortools/util/sorted_interval_list.h"

using namespace std;
using operations_research::Domain;

namespace assign_groups {

absl::Status ValidatePartnerInputs(const vector<PartnerStudent>& students, int num_groups,
                                   const PreferenceMatrix& preferences) {
    const int n = students.size();
    if (n == 0) {
        return absl::InvalidArgumentError("no students to assign");
    }
    if (num_groups < 1) {
        return absl::InvalidArgumentError(
            absl::StrFormat("number of groups must be positive, got %d", num_groups));
    }
    double abs_score_sum = 0.0;
    for (const PartnerStudent& s : students) {
        if (!std::isfinite(s.score)) {
            return absl::InvalidArgumentError(absl::StrFormat(
                "score of %s %s must be finite, got %g", s.first_name, s.last_name, s.score));
        }
        abs_score_sum += std::abs(s.score) * kScoreScale;
    }
    // Upper bound of total_deviation, see AddScoreBalance.
    const int64_t max_size = (static_cast<int64_t>(n) + num_groups - 1) / num_groups;
    const double deviation_bound =
        static_cast<double>(num_groups) * (n + max_size) * abs_score_sum;
    if (deviation_bound > kMaxDeviationBound) {
        return absl::InvalidArgumentError(
            absl::StrFormat("scores are too large to balance exactly (bound %g)", deviation_bound));
    }
    if (preferences.rows() != n || preferences.cols() != n) {
        return absl::InvalidArgumentError(
            absl::StrFormat("dimensions of preferences (%d x %d) must match students (%d)",
                            preferences.rows(), preferences.cols(), n));
    }
    if (!preferences.IsSymmetric()) {
        return absl::InvalidArgumentError("preferences must be symmetric");
    }
    for (double v : preferences.values()) {
        if (!std::isfinite(v)) {
            return absl::InvalidArgumentError("preferences must be finite");
        }
    }
    return absl::OkStatus();
}

PartnerModel::PartnerModel(const vector<PartnerStudent>& students, int num_groups,
                           const PreferenceMatrix& preferences, sat::CpModelBuilder* model)
    : num_students(students.size()), num_groups(num_groups),
      preferences(preferences), model(model),
      min_size(num_students / num_groups),
      max_size((static_cast<int64_t>(num_students) + num_groups - 1) / num_groups),
      scaled_scores(num_students), assign(num_students) {
    for (int i = 0; i < num_students; ++i) {
        scaled_scores[i] = std::llround(students[i].score * kScoreScale);
    }
}

void PartnerModel::InitAssignment() {
    for (int i = 0; i < num_students; ++i) {
        assign[i].resize(num_groups);
        for (int g = 0; g < num_groups; ++g) {
            assign[i][g] = model->NewBoolVar().WithName(absl::StrCat("assign_", i, "_", g));
        }
        model->AddExactlyOne(assign[i]);
    }
}

void PartnerModel::AddGroupSizes() {
    group_size.resize(num_groups);
    for (int g = 0; g < num_groups; ++g) {
        group_size[g] = model->NewIntVar(Domain(min_size, max_size))
                            .WithName(absl::StrCat("group_size_", g));
        sat::LinearExpr members;
        for (int i = 0; i < num_students; ++i) {
            members += assign[i][g];
        }
        model->AddEquality(group_size[g], members);
    }
}

void PartnerModel::AddScoreBalance() {
    // n * (group score sum - size * mean), kept integral by working on
    // n times the deviation.
    int64_t total_score = 0;
    int64_t abs_score_sum = 0;
    for (int64_t s : scaled_scores) {
        total_score += s;
        abs_score_sum += std::llabs(s);
    }
    const int64_t bound = num_students * abs_score_sum + max_size * std::llabs(total_score);

    sat::LinearExpr deviation_sum;
    for (int g = 0; g < num_groups; ++g) {
        sat::LinearExpr deviation;
        for (int i = 0; i < num_students; ++i) {
            deviation += assign[i][g] * (num_students * scaled_scores[i]);
        }
        deviation -= group_size[g] * total_score;

        sat::IntVar abs_deviation =
            model->NewIntVar(Domain(0, bound)).WithName(absl::StrCat("abs_deviation_", g));
        model->AddGreaterOrEqual(abs_deviation, deviation);
        model->AddGreaterOrEqual(abs_deviation, -deviation);
        deviation_sum += abs_deviation;
    }
    total_deviation = model->NewIntVar(Domain(0, num_groups * bound)).WithName("total_deviation");
    model->AddGreaterOrEqual(total_deviation, deviation_sum);
}

void PartnerModel::AddPairing() {
    for (int i1 = 0; i1 < num_students; ++i1) {
        for (int i2 = i1 + 1; i2 < num_students; ++i2) {
            const double preference = preferences.at(i1, i2);
            if (preference == 0.0) continue;
            for (int g = 0; g < num_groups; ++g) {
                sat::BoolVar together = model->NewBoolVar();
                // together <= (assign[i1][g] + assign[i2][g]) / 2
                model->AddLessOrEqual(2 * together, assign[i1][g] + assign[i2][g]);
                if (preference > 0.0) {
                    // A penalty has to be paid whenever the pair meets.
                    model->AddGreaterOrEqual(together + 1, assign[i1][g] + assign[i2][g]);
                }
                pairings.push_back({i1, i2, together});
            }
        }
    }
}

sat::DoubleLinearExpr PartnerModel::BuildObjective() const {
    sat::DoubleLinearExpr objective;
    objective.AddTerm(total_deviation, 1.0 / (static_cast<double>(num_students) * kScoreScale));
    for (const Pairing& p : pairings) {
        objective.AddTerm(p.together, preferences.at(p.first, p.second));
    }
    return objective;
}

vector<vector<int>> PartnerModel::AssignmentIndices() const {
    vector<vector<int>> indices(num_students, vector<int>(num_groups));
    for (int i = 0; i < num_students; ++i) {
        for (int g = 0; g < num_groups; ++g) {
            indices[i][g] = assign[i][g].index();
        }
    }
    return indices;
}

namespace {

// Helper: Report a solve that did not prove optimality
void ReportPartnerTermination(const SolveResult& result) {
    LOG(ERROR) << "Solver terminated with status " << TerminationStatusName(result.status);
    if (result.status != TerminationStatus::kTimeLimit) return;
    const optional<double> gap = result.RelativeGap();
    if (gap.has_value()) {
        LOG(ERROR) << "Relative optimality gap: " << absl::StrFormat("%.4g%%", *gap * 100.0);
    }
    LOG(ERROR) << "The time limit of the solver was reached. Increase the time limit or "
                  "relax the optimality gap tolerance, or strengthen the partner bonuses "
                  "so that they dominate the score balance.";
}

}  // namespace

absl::StatusOr<PartnerAssignment> AssignPartners(const vector<PartnerStudent>& students,
                                                 int num_groups,
                                                 const PreferenceMatrix& preferences,
                                                 Solver& solver, const PartnerOptions& options) {
    absl::Status valid = ValidatePartnerInputs(students, num_groups, preferences);
    if (!valid.ok()) return valid;

    sat::CpModelBuilder model;
    PartnerModel partners(students, num_groups, preferences, &model);
    partners.InitAssignment();
    partners.AddGroupSizes();
    partners.AddScoreBalance();
    partners.AddPairing();
    model.Minimize(partners.BuildObjective());

    VLOG(1) << "Partner model: " << students.size() << " students, " << num_groups
            << " groups of " << partners.min_group_size() << " to "
            << partners.max_group_size();

    absl::StatusOr<SolveResult> result = solver.Solve(model.Build(), options.solver);
    if (!result.ok()) return result.status();

    PartnerAssignment assignment;
    assignment.status = result->status;
    assignment.groups.resize(num_groups);
    if (result->status != TerminationStatus::kOptimal) {
        ReportPartnerTermination(*result);
    }
    if (!result->HasSolution()) return assignment;
    if (static_cast<int>(result->values.size()) != model.Proto().variables_size()) {
        return absl::InternalError(
            absl::StrFormat("solver returned %d values for %d variables", result->values.size(),
                            model.Proto().variables_size()));
    }

    const vector<vector<int>> members =
        ExtractGroups(result->values, partners.AssignmentIndices(), num_groups);
    for (int g = 0; g < num_groups; ++g) {
        for (int i : members[g]) {
            assignment.groups[g].push_back(students[i]);
        }
    }
    return assignment;
}

absl::StatusOr<PartnerAssignment> AssignPartners(const vector<PartnerStudent>& students,
                                                 int num_groups,
                                                 const PreferenceMatrix& preferences,
                                                 const PartnerOptions& options) {
    CpSatSolver solver;
    return AssignPartners(students, num_groups, preferences, solver, options);
}

}  // namespace assign_groups
