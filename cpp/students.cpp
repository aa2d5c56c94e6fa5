#include "students.hpp"

#include <utility>

#include "absl/log/check.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

using namespace std;

namespace assign_groups {

PreferenceMatrix::PreferenceMatrix(int rows, int cols, vector<double> values)
    : rows_(rows), cols_(cols), values_(std::move(values)) {
    CHECK_EQ(static_cast<int>(values_.size()), rows_ * cols_);
}

bool PreferenceMatrix::IsZero() const {
    for (double v : values_) {
        if (v != 0.0) return false;
    }
    return true;
}

bool PreferenceMatrix::IsSymmetric() const {
    if (rows_ != cols_) return false;
    for (int i = 0; i < rows_; ++i) {
        for (int j = i + 1; j < cols_; ++j) {
            if (at(i, j) != at(j, i)) return false;
        }
    }
    return true;
}

PreferenceMatrix MatrixFromRows(const vector<vector<double>>& rows) {
    const int num_rows = rows.size();
    const int num_cols = rows.empty() ? 0 : rows[0].size();
    vector<double> values;
    values.reserve(num_rows * num_cols);
    for (const auto& row : rows) {
        CHECK_EQ(static_cast<int>(row.size()), num_cols) << "ragged preference rows";
        values.insert(values.end(), row.begin(), row.end());
    }
    return PreferenceMatrix(num_rows, num_cols, std::move(values));
}

bool operator==(const PartnerStudent& a, const PartnerStudent& b) {
    return a.first_name == b.first_name && a.last_name == b.last_name;
}

bool operator!=(const PartnerStudent& a, const PartnerStudent& b) { return !(a == b); }

ostream& operator<<(ostream& os, const PartnerStudent& s) {
    return os << s.first_name << " " << s.last_name << " (" << s.score << ")";
}

bool operator==(const ImmersionStudent& a, const ImmersionStudent& b) {
    return a.first_name == b.first_name && a.last_name == b.last_name &&
           a.program == b.program && a.assigned == b.assigned;
}

bool operator!=(const ImmersionStudent& a, const ImmersionStudent& b) { return !(a == b); }

ostream& operator<<(ostream& os, const ImmersionStudent& s) {
    return os << s.first_name << " " << s.last_name << " (" << s.program << ") ["
              << absl::StrJoin(s.assigned, ", ") << "]";
}

void Unassign(vector<ImmersionStudent>& students) {
    for (auto& s : students) {
        s.assigned.clear();
    }
}

string FullName(const string& first_name, const string& last_name) {
    return absl::StrCat(first_name, " ", last_name);
}

string StudentKey(const ImmersionStudent& s) {
    return absl::StrCat(s.last_name, ", ", s.first_name);
}

pair<string, string> PairKey(const string& a, const string& b) {
    if (b < a) return {b, a};
    return {a, b};
}

}  // namespace assign_groups
