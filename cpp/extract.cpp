#include "extract.hpp"

#include "absl/strings/str_cat.h"

using namespace std;

namespace assign_groups {

vector<vector<int>> ExtractGroups(const vector<double>& values,
                                  const vector<vector<int>>& indicators, int num_groups) {
    vector<vector<int>> groups(num_groups);
    for (int i = 0; i < static_cast<int>(indicators.size()); ++i) {
        for (int g = 0; g < num_groups; ++g) {
            if (IsSelected(values, indicators[i][g])) groups[g].push_back(i);
        }
    }
    return groups;
}

WeekLayout WeekLayout::FromOptionCounts(const vector<int>& num_options) {
    WeekLayout layout;
    layout.offsets.reserve(num_options.size() + 1);
    layout.offsets.push_back(0);
    for (int n : num_options) {
        layout.offsets.push_back(layout.offsets.back() + n);
    }
    return layout;
}

absl::StatusOr<vector<vector<int>>> ExtractWeekChoices(const vector<double>& values,
                                                       const vector<vector<int>>& indicators,
                                                       const WeekLayout& layout,
                                                       const vector<int>& first_free_week) {
    vector<vector<int>> choices(indicators.size());
    for (int i = 0; i < static_cast<int>(indicators.size()); ++i) {
        for (int w = first_free_week[i]; w < layout.num_weeks(); ++w) {
            int chosen = 0;
            for (int k = 0; k < layout.num_options(w); ++k) {
                if (IsSelected(values, indicators[i][layout.offsets[w] + k])) {
                    chosen = k + 1;
                    break;
                }
            }
            if (chosen == 0) {
                return absl::InternalError(absl::StrCat("no option selected for student ", i,
                                                        " in week ", w + 1));
            }
            choices[i].push_back(chosen);
        }
    }
    return choices;
}

void AppendWeekChoices(const vector<vector<int>>& choices, vector<ImmersionStudent>& students) {
    for (int i = 0; i < static_cast<int>(students.size()); ++i) {
        auto& assigned = students[i].assigned;
        assigned.insert(assigned.end(), choices[i].begin(), choices[i].end());
    }
}

}  // namespace assign_groups
