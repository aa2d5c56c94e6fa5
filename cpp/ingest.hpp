#pragma once

#include <functional>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "students.hpp"

namespace assign_groups {

// A table already split into cells, one inner vector per row.
using Rows = std::vector<std::vector<std::string>>;

struct PartnerInput {
    std::vector<PartnerStudent> students;
    PreferenceMatrix preferences;
};

// Rows of `first, last, score[, partners]`. The optional fourth cell lists
// requested partners as comma-separated "First Last" names; each request
// sets preferences(i, j) and preferences(j, i) to `bonus`. Student names
// must be unique.
absl::StatusOr<PartnerInput> ParsePartnerRows(const Rows& rows, double bonus = -1.0);

struct ImmersionInput {
    std::vector<ImmersionStudent> students;
    PreferenceMatrix preferences;
    std::vector<std::string> option_labels;
};

// Turns one preference cell into its value, e.g. mapping "first choice" to 1.
using CellParser = std::function<absl::StatusOr<double>(absl::string_view)>;

// The default CellParser: the cell must hold a number.
absl::StatusOr<double> ParseNumericCell(absl::string_view cell);

// Rows of `first, last, program, v1, ..., vk`, one week per table. Each
// preference cell goes through `parser`. The labels come from the header
// cells after the third; an empty header yields "Option 1" .. "Option k".
absl::StatusOr<ImmersionInput> ParseImmersionRows(const std::vector<std::string>& header,
                                                  const Rows& rows,
                                                  const CellParser& parser = ParseNumericCell);

}  // namespace assign_groups
