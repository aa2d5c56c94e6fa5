#include "immersion.hpp"

#include <cmath>
#include <map>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "ortools/util/sorted_interval_list.h"

using namespace std;
using operations_research::Domain;

namespace assign_groups {

absl::Status ValidateImmersionInputs(const vector<ImmersionStudent>& students,
                                     const vector<PreferenceMatrix>& preferences,
                                     const ImmersionOptions& options) {
    const int num_students = students.size();
    const int num_weeks = preferences.size();
    if (num_students == 0) {
        return absl::InvalidArgumentError("no students to assign");
    }
    if (num_weeks == 0) {
        return absl::InvalidArgumentError("at least one week of preferences is required");
    }

    for (int w = 0; w < num_weeks; ++w) {
        const PreferenceMatrix& week = preferences[w];
        if (week.rows() != num_students) {
            return absl::InvalidArgumentError(absl::StrFormat(
                "all weeks must have the same number of students: week %d has %d rows, "
                "expected %d",
                w + 1, week.rows(), num_students));
        }
        if (week.cols() == 0) {
            return absl::InvalidArgumentError(absl::StrFormat("week %d has no options", w + 1));
        }
        if (week.IsZero()) continue;
        for (double v : week.values()) {
            if (!(v > 0.0) || !std::isfinite(v)) {
                return absl::InvalidArgumentError(absl::StrFormat(
                    "preferences of week %d must be strictly positive (or all zero), got %g",
                    w + 1, v));
            }
        }
    }

    for (const ImmersionStudent& s : students) {
        if (static_cast<int>(s.assigned.size()) > num_weeks) {
            return absl::InvalidArgumentError(
                absl::StrFormat("%s %s has %d assigned weeks but there are only %d", s.first_name,
                                s.last_name, s.assigned.size(), num_weeks));
        }
        for (int w = 0; w < static_cast<int>(s.assigned.size()); ++w) {
            const int option = s.assigned[w];
            if (option < 1 || option > preferences[w].cols()) {
                return absl::InvalidArgumentError(absl::StrFormat(
                    "%s %s is assigned option %d in week %d, expected 1 to %d", s.first_name,
                    s.last_name, option, w + 1, preferences[w].cols()));
            }
        }
    }

    const double weights[] = {options.preference_weight, options.imbalance_weight,
                              options.same_program_weight, options.same_partner_weight};
    for (double weight : weights) {
        if (!(weight >= 0.0) || !std::isfinite(weight)) {
            return absl::InvalidArgumentError(
                absl::StrCat("penalty weights must be finite and non-negative, got ", weight));
        }
    }
    return absl::OkStatus();
}

ImmersionModel::ImmersionModel(const vector<ImmersionStudent>& students,
                               const vector<PreferenceMatrix>& preferences,
                               const ImmersionOptions& options, sat::CpModelBuilder* model)
    : students(students), preferences(preferences), options(options), model(model),
      num_students(students.size()), free_from(students.size()), x(students.size()) {
    vector<int> num_options;
    num_options.reserve(preferences.size());
    for (const PreferenceMatrix& week : preferences) {
        num_options.push_back(week.cols());
    }
    week_layout = WeekLayout::FromOptionCounts(num_options);
    for (int i = 0; i < num_students; ++i) {
        free_from[i] = students[i].assigned.size();
    }
}

void ImmersionModel::InitAssignment() {
    for (int i = 0; i < num_students; ++i) {
        x[i].resize(week_layout.total_options());
        for (int c = 0; c < week_layout.total_options(); ++c) {
            x[i][c] = model->NewBoolVar().WithName(absl::StrCat("x_", i, "_", c));
        }
        // One option per student per week.
        for (int w = 0; w < week_layout.num_weeks(); ++w) {
            vector<sat::BoolVar> week_choices(x[i].begin() + week_layout.offsets[w],
                                              x[i].begin() + week_layout.offsets[w + 1]);
            model->AddExactlyOne(week_choices);
        }
    }
}

void ImmersionModel::FixPreassigned() {
    for (int i = 0; i < num_students; ++i) {
        const vector<int>& assigned = students[i].assigned;
        for (int w = 0; w < static_cast<int>(assigned.size()); ++w) {
            model->AddEquality(x[i][week_layout.offsets[w] + assigned[w] - 1], 1);
        }
    }
}

void ImmersionModel::AddImbalance() {
    if (options.imbalance_weight == 0.0) return;
    for (int w = 0; w < week_layout.num_weeks(); ++w) {
        if (!options.balance_sentinel_weeks && preferences[w].IsZero()) continue;
        vector<sat::LinearExpr> occupancy(week_layout.num_options(w));
        for (int k = 0; k < week_layout.num_options(w); ++k) {
            for (int i = 0; i < num_students; ++i) {
                occupancy[k] += x[i][week_layout.offsets[w] + k];
            }
        }
        sat::IntVar largest = model->NewIntVar(Domain(0, num_students));
        sat::IntVar smallest = model->NewIntVar(Domain(0, num_students));
        model->AddMaxEquality(largest, occupancy);
        model->AddMinEquality(smallest, occupancy);
        week_max_size.push_back(largest);
        week_min_size.push_back(smallest);
    }
}

void ImmersionModel::AddSameProgram() {
    if (options.same_program_weight == 0.0) return;

    map<string, vector<int>> programs;
    for (int i = 0; i < num_students; ++i) {
        programs[students[i].program].push_back(i);
    }

    for (const auto& [program, members] : programs) {
        const int count = members.size();
        if (count < 2) continue;
        for (int c = 0; c < week_layout.total_options(); ++c) {
            if (options.penalty_mode == PenaltyMode::kExtraOccurrences) {
                sat::LinearExpr same;
                for (int i : members) {
                    same += x[i][c];
                }
                sat::IntVar excess = model->NewIntVar(Domain(0, count - 1));
                model->AddGreaterOrEqual(excess, same - 1);
                program_excess.push_back(excess);
            } else {
                for (int a = 0; a < count; ++a) {
                    for (int b = a + 1; b < count; ++b) {
                        program_products.push_back(NewAnd(x[members[a]][c], x[members[b]][c]));
                    }
                }
            }
        }
    }
}

void ImmersionModel::AddSamePartner() {
    if (options.same_partner_weight == 0.0) return;
    const int num_weeks = week_layout.num_weeks();
    // With a single week no pair can meet twice.
    if (options.penalty_mode == PenaltyMode::kExtraOccurrences && num_weeks < 2) return;

    for (int i1 = 0; i1 < num_students; ++i1) {
        for (int i2 = i1 + 1; i2 < num_students; ++i2) {
            sat::LinearExpr shared;
            for (int c = 0; c < week_layout.total_options(); ++c) {
                shared += NewAnd(x[i1][c], x[i2][c]);
            }
            if (options.penalty_mode == PenaltyMode::kExtraOccurrences) {
                sat::IntVar excess = model->NewIntVar(Domain(0, num_weeks - 1));
                model->AddGreaterOrEqual(excess, shared - 1);
                partner_excess.push_back(excess);
            } else {
                sat::IntVar square = model->NewIntVar(Domain(0, num_weeks * num_weeks));
                model->AddMultiplicationEquality(square, shared, shared);
                partner_squares.push_back(square);
            }
        }
    }
}

sat::BoolVar ImmersionModel::NewAnd(sat::BoolVar a, sat::BoolVar b) {
    sat::BoolVar both = model->NewBoolVar();
    model->AddBoolAnd({a, b}).OnlyEnforceIf(both);
    model->AddBoolOr({a.Not(), b.Not()}).OnlyEnforceIf(both.Not());
    return both;
}

sat::DoubleLinearExpr ImmersionModel::BuildObjective() const {
    sat::DoubleLinearExpr objective;

    if (options.preference_weight != 0.0) {
        for (int w = 0; w < week_layout.num_weeks(); ++w) {
            const PreferenceMatrix& week = preferences[w];
            // Weeks decided elsewhere carry no preference cost.
            if (week.IsZero()) continue;
            for (int i = 0; i < num_students; ++i) {
                for (int k = 0; k < week.cols(); ++k) {
                    objective.AddTerm(x[i][week_layout.offsets[w] + k],
                                      options.preference_weight * week.at(i, k));
                }
            }
        }
    }

    for (size_t w = 0; w < week_max_size.size(); ++w) {
        objective.AddTerm(week_max_size[w], options.imbalance_weight);
        objective.AddTerm(week_min_size[w], -options.imbalance_weight);
    }
    for (const sat::IntVar& excess : program_excess) {
        objective.AddTerm(excess, options.same_program_weight);
    }
    for (const sat::BoolVar& product : program_products) {
        objective.AddTerm(product, options.same_program_weight);
    }
    for (const sat::IntVar& excess : partner_excess) {
        objective.AddTerm(excess, options.same_partner_weight);
    }
    for (const sat::IntVar& square : partner_squares) {
        objective.AddTerm(square, options.same_partner_weight);
    }
    return objective;
}

vector<vector<int>> ImmersionModel::AssignmentIndices() const {
    vector<vector<int>> indices(num_students);
    for (int i = 0; i < num_students; ++i) {
        indices[i].reserve(x[i].size());
        for (const sat::BoolVar& var : x[i]) {
            indices[i].push_back(var.index());
        }
    }
    return indices;
}

absl::StatusOr<ImmersionResult> AssignImmersion(vector<ImmersionStudent>& students,
                                                const vector<PreferenceMatrix>& preferences,
                                                Solver& solver, const ImmersionOptions& options) {
    absl::Status valid = ValidateImmersionInputs(students, preferences, options);
    if (!valid.ok()) return valid;

    ImmersionResult result;
    bool all_assigned = true;
    for (const ImmersionStudent& s : students) {
        if (s.assigned.size() < preferences.size()) {
            all_assigned = false;
            break;
        }
    }
    if (all_assigned) {
        LOG(WARNING) << "All students are already assigned to groups (use Unassign to reset)";
        return result;
    }

    sat::CpModelBuilder model;
    ImmersionModel immersion(students, preferences, options, &model);
    immersion.InitAssignment();
    immersion.FixPreassigned();
    immersion.AddImbalance();
    immersion.AddSameProgram();
    immersion.AddSamePartner();
    model.Minimize(immersion.BuildObjective());

    VLOG(1) << "Immersion model: " << students.size() << " students, "
            << immersion.layout().num_weeks() << " weeks, "
            << immersion.layout().total_options() << " options in total";

    absl::StatusOr<SolveResult> solve = solver.Solve(model.Build(), options.solver);
    if (!solve.ok()) return solve.status();

    result.solved = true;
    result.status = solve->status;
    if (solve->status != TerminationStatus::kOptimal) {
        LOG(ERROR) << "Solver terminated with status " << TerminationStatusName(solve->status);
    }
    if (!solve->HasSolution()) return result;
    if (static_cast<int>(solve->values.size()) != model.Proto().variables_size()) {
        return absl::InternalError(absl::StrFormat("solver returned %d values for %d variables",
                                                   solve->values.size(),
                                                   model.Proto().variables_size()));
    }

    absl::StatusOr<vector<vector<int>>> choices =
        ExtractWeekChoices(solve->values, immersion.AssignmentIndices(), immersion.layout(),
                           immersion.first_free_week());
    if (!choices.ok()) return choices.status();
    AppendWeekChoices(*choices, students);
    return result;
}

absl::StatusOr<ImmersionResult> AssignImmersion(vector<ImmersionStudent>& students,
                                                const vector<PreferenceMatrix>& preferences,
                                                const ImmersionOptions& options) {
    CpSatSolver solver;
    return AssignImmersion(students, preferences, solver, options);
}

}  // namespace assign_groups
