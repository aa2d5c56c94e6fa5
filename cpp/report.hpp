#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "analysis.hpp"
#include "students.hpp"

namespace assign_groups {

// Shortest round-trip form of a score; integral values keep a ".0" suffix.
std::string FormatScore(double value);

// Writes the collision report. The wording is consumed by other tools and
// must not change.
void WriteStats(std::ostream& os, const AssignmentStats& stats);

// One line per group: the members, then the group's mean score.
void WriteGroups(std::ostream& os, const std::vector<std::vector<PartnerStudent>>& groups);

}  // namespace assign_groups
