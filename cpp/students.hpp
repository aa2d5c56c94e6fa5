#pragma once

#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace assign_groups {

// Dense row-major matrix of preference values. Row i belongs to the i-th
// student of the accompanying student list.
class PreferenceMatrix {
public:
    PreferenceMatrix() : rows_(0), cols_(0) {}
    PreferenceMatrix(int rows, int cols) : rows_(rows), cols_(cols), values_(rows * cols, 0.0) {}
    PreferenceMatrix(int rows, int cols, std::vector<double> values);

    int rows() const { return rows_; }
    int cols() const { return cols_; }

    double at(int i, int j) const { return values_[i * cols_ + j]; }
    void set(int i, int j, double value) { values_[i * cols_ + j] = value; }

    const std::vector<double>& values() const { return values_; }

    // True when every entry is exactly zero. An all-zero week matrix marks a
    // week whose choices were made elsewhere.
    bool IsZero() const;
    bool IsSymmetric() const;

    bool operator==(const PreferenceMatrix& other) const {
        return rows_ == other.rows_ && cols_ == other.cols_ && values_ == other.values_;
    }

private:
    int rows_;
    int cols_;
    std::vector<double> values_;
};

// Builds a matrix from nested rows, e.g. {{1, 4}, {4, 1}}. All rows must have
// the same length.
PreferenceMatrix MatrixFromRows(const std::vector<std::vector<double>>& rows);

// Student taking part in a single-round partition.
struct PartnerStudent {
    std::string first_name;
    std::string last_name;
    double score;
};

// Students are the same person when the names match; the score is ignored.
bool operator==(const PartnerStudent& a, const PartnerStudent& b);
bool operator!=(const PartnerStudent& a, const PartnerStudent& b);
std::ostream& operator<<(std::ostream& os, const PartnerStudent& s);

// Student taking part in a multi-week assignment. assigned[w] is the 1-based
// option chosen for week w; AssignImmersion appends to it in place.
struct ImmersionStudent {
    std::string first_name;
    std::string last_name;
    std::string program;
    std::vector<int> assigned;
};

bool operator==(const ImmersionStudent& a, const ImmersionStudent& b);
bool operator!=(const ImmersionStudent& a, const ImmersionStudent& b);
std::ostream& operator<<(std::ostream& os, const ImmersionStudent& s);

// Clears every student's assignment sequence. This is the only way to reset
// the state accumulated by AssignImmersion.
void Unassign(std::vector<ImmersionStudent>& students);

// "First Last", the form partner requests use.
std::string FullName(const std::string& first_name, const std::string& last_name);

// "Last, First", the key used in collision statistics.
std::string StudentKey(const ImmersionStudent& s);

// The two keys in lexicographic order, so (a, b) and (b, a) agree.
std::pair<std::string, std::string> PairKey(const std::string& a, const std::string& b);

}  // namespace assign_groups
