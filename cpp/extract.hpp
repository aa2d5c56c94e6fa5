#pragma once

#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "students.hpp"

namespace assign_groups {

// Solver values need not be exactly integral; an indicator counts as chosen
// once it is above this threshold.
inline constexpr double kSelectedThreshold = 0.5;

inline bool IsSelected(const std::vector<double>& values, int index) {
    return values[index] > kSelectedThreshold;
}

// indicators[i][g] is the variable index of "student i is in group g".
// Returns, per group, the students whose indicator is selected, in student
// order.
std::vector<std::vector<int>> ExtractGroups(const std::vector<double>& values,
                                            const std::vector<std::vector<int>>& indicators,
                                            int num_groups);

// Week layout of the concatenated option space: week w covers indicator
// columns [offsets[w], offsets[w + 1]).
struct WeekLayout {
    std::vector<int> offsets;

    int num_weeks() const { return static_cast<int>(offsets.size()) - 1; }
    int num_options(int week) const { return offsets[week + 1] - offsets[week]; }
    int total_options() const { return offsets.back(); }

    static WeekLayout FromOptionCounts(const std::vector<int>& num_options);
};

// indicators[i][c] is the variable index of "student i picks concatenated
// option c". For each student, returns the 1-based option picked in every
// week from first_free_week[i] on, in week order. Fails when some free week
// has no selected option.
absl::StatusOr<std::vector<std::vector<int>>> ExtractWeekChoices(
    const std::vector<double>& values, const std::vector<std::vector<int>>& indicators,
    const WeekLayout& layout, const std::vector<int>& first_free_week);

// Appends the extracted choices to the students' sequences. Weeks already on
// a student are left as they are.
void AppendWeekChoices(const std::vector<std::vector<int>>& choices,
                       std::vector<ImmersionStudent>& students);

}  // namespace assign_groups
