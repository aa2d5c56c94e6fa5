#include "report.hpp"

#include <algorithm>
#include <cmath>
#include <map>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

using namespace std;

namespace assign_groups {

string FormatScore(double value) {
    string text = absl::StrCat(value);
    if (std::isfinite(value) && !absl::StrContains(text, ".") && !absl::StrContains(text, "e")) {
        absl::StrAppend(&text, ".0");
    }
    return text;
}

void WriteStats(ostream& os, const AssignmentStats& stats) {
    os << "Mean preference score: " << FormatScore(stats.mean_preference) << "\n";
    os << "Maximum imbalance in group size: " << stats.max_imbalance << "\n";

    int max_program = 0;
    map<string, int> per_program;
    for (const auto& [cell, count] : stats.program_collisions) {
        max_program = max(max_program, count);
        per_program[cell.program] += count;
    }
    os << "Two or more students from the same program assigned to the same group "
          "(\"program collisions\"):\n";
    os << "  Total number of program collisions: " << stats.program_collisions.size() << "\n";
    os << "  Maximum number of collisions in a single group: " << max_program << "\n";
    os << "  Number of times each program appears in a collision: {"
       << absl::StrJoin(per_program, ", ",
                        [](string* out, const pair<const string, int>& entry) {
                            absl::StrAppend(out, entry.first, " => ", entry.second);
                        })
       << "}\n";

    int repeated_pairs = 0;
    int max_pair = 0;
    for (const auto& [names, count] : stats.pair_collisions) {
        if (count > 1) ++repeated_pairs;
        max_pair = max(max_pair, count);
    }
    os << "Two or more students sharing a group in more than one week "
          "(\"student collisions\"):\n";
    os << "  Total number of student collisions: " << repeated_pairs << "\n";
    os << "  Maximum number of collisions for a single pair: " << max_pair << "\n";
}

void WriteGroups(ostream& os, const vector<vector<PartnerStudent>>& groups) {
    for (size_t g = 0; g < groups.size(); ++g) {
        double total = 0.0;
        vector<string> members;
        for (const PartnerStudent& s : groups[g]) {
            total += s.score;
            members.push_back(absl::StrCat(s.first_name, " ", s.last_name, " (", s.score, ")"));
        }
        const double mean = groups[g].empty() ? 0.0 : total / groups[g].size();
        os << "Group " << g + 1 << ": " << absl::StrJoin(members, ", ")
           << " [mean score " << FormatScore(mean) << "]\n";
    }
}

}  // namespace assign_groups
