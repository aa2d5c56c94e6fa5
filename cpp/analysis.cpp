#include "analysis.hpp"

#include <algorithm>

#include "absl/status/status.h"
#include "absl/strings/str_format.h"

using namespace std;

namespace assign_groups {

int AssignmentStats::PairCount(const string& a, const string& b) const {
    auto it = pair_collisions.find(PairKey(a, b));
    return it == pair_collisions.end() ? 0 : it->second;
}

int AssignmentStats::ProgramCount(int week, int option, const string& program) const {
    auto it = program_collisions.find({week, option, program});
    return it == program_collisions.end() ? 0 : it->second;
}

absl::StatusOr<AssignmentStats> AnalyzeAssignment(const vector<ImmersionStudent>& students,
                                                  const vector<PreferenceMatrix>& preferences) {
    const int num_students = students.size();
    const int num_weeks = preferences.size();
    for (int w = 0; w < num_weeks; ++w) {
        if (preferences[w].rows() != num_students) {
            return absl::InvalidArgumentError(absl::StrFormat(
                "week %d has %d rows, expected %d", w + 1, preferences[w].rows(), num_students));
        }
    }
    for (const ImmersionStudent& s : students) {
        if (static_cast<int>(s.assigned.size()) != num_weeks) {
            return absl::InvalidArgumentError(
                absl::StrFormat("%s %s is assigned in %d of %d weeks", s.first_name, s.last_name,
                                s.assigned.size(), num_weeks));
        }
        for (int w = 0; w < num_weeks; ++w) {
            if (s.assigned[w] < 1 || s.assigned[w] > preferences[w].cols()) {
                return absl::InvalidArgumentError(
                    absl::StrFormat("%s %s has option %d in week %d, expected 1 to %d",
                                    s.first_name, s.last_name, s.assigned[w], w + 1,
                                    preferences[w].cols()));
            }
        }
    }

    AssignmentStats stats;

    double preference_sum = 0.0;
    int scored = 0;
    for (int w = 0; w < num_weeks; ++w) {
        const PreferenceMatrix& week = preferences[w];
        if (week.IsZero()) continue;
        for (int i = 0; i < num_students; ++i) {
            preference_sum += week.at(i, students[i].assigned[w] - 1);
            ++scored;
        }
    }
    if (scored > 0) stats.mean_preference = preference_sum / scored;

    for (int w = 0; w < num_weeks; ++w) {
        vector<int> occupancy(preferences[w].cols(), 0);
        if (occupancy.empty()) continue;
        for (const ImmersionStudent& s : students) {
            ++occupancy[s.assigned[w] - 1];
        }
        const auto [smallest, largest] = minmax_element(occupancy.begin(), occupancy.end());
        stats.max_imbalance = max(stats.max_imbalance, *largest - *smallest);
    }

    for (int i1 = 0; i1 < num_students; ++i1) {
        const string key1 = StudentKey(students[i1]);
        for (int i2 = i1 + 1; i2 < num_students; ++i2) {
            int shared = 0;
            for (int w = 0; w < num_weeks; ++w) {
                if (students[i1].assigned[w] == students[i2].assigned[w]) ++shared;
            }
            if (shared > 0) {
                stats.pair_collisions[PairKey(key1, StudentKey(students[i2]))] += shared;
            }
        }
    }

    map<ProgramCell, int> members;
    for (const ImmersionStudent& s : students) {
        for (int w = 0; w < num_weeks; ++w) {
            ++members[{w + 1, s.assigned[w], s.program}];
        }
    }
    for (const auto& [cell, count] : members) {
        if (count > 1) stats.program_collisions[cell] = count - 1;
    }
    return stats;
}

}  // namespace assign_groups
