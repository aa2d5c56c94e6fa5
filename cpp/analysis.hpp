#pragma once

#include <map>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "students.hpp"

namespace assign_groups {

// A (week, option, program) cell; week and option are 1-based.
struct ProgramCell {
    int week;
    int option;
    std::string program;

    bool operator<(const ProgramCell& other) const {
        return std::tie(week, option, program) < std::tie(other.week, other.option, other.program);
    }
    bool operator==(const ProgramCell& other) const {
        return week == other.week && option == other.option && program == other.program;
    }
};

struct AssignmentStats {
    // Mean preference of the chosen options, over weeks that are not all zero.
    double mean_preference = 0.0;
    // Largest (max - min) option occupancy over all weeks.
    int max_imbalance = 0;
    // Number of weeks each pair of students shared an option, keyed by the
    // ordered "Last, First" names. Pairs that never met are absent.
    std::map<std::pair<std::string, std::string>, int> pair_collisions;
    // Students beyond the first from the same program in one option, per
    // cell holding at least two of them.
    std::map<ProgramCell, int> program_collisions;

    // Lookups that read absent entries as zero.
    int PairCount(const std::string& a, const std::string& b) const;
    int ProgramCount(int week, int option, const std::string& program) const;
};

// Computes the statistics of a finished assignment. Every student must be
// assigned in every week.
absl::StatusOr<AssignmentStats> AnalyzeAssignment(const std::vector<ImmersionStudent>& students,
                                                  const std::vector<PreferenceMatrix>& preferences);

}  // namespace assign_groups
