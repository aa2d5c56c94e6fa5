#include "ingest.hpp"

#include <map>
#include <utility>

#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"

using namespace std;

namespace assign_groups {

absl::StatusOr<PartnerInput> ParsePartnerRows(const Rows& rows, double bonus) {
    PartnerInput input;
    map<string, int> index_by_name;
    vector<pair<int, string>> requests;

    for (int i = 0; i < static_cast<int>(rows.size()); ++i) {
        const vector<string>& row = rows[i];
        if (row.size() < 3) {
            return absl::InvalidArgumentError(
                absl::StrCat("row ", i + 1, " needs first name, last name and score"));
        }
        double score;
        if (!absl::SimpleAtod(row[2], &score)) {
            return absl::InvalidArgumentError(
                absl::StrCat("row ", i + 1, ": cannot parse score '", row[2], "'"));
        }
        input.students.push_back({row[0], row[1], score});
        if (!index_by_name.emplace(FullName(row[0], row[1]), i).second) {
            return absl::InvalidArgumentError(absl::StrCat(
                "row ", i + 1, ": duplicate student '", FullName(row[0], row[1]), "'"));
        }
        if (row.size() > 3 && !absl::StripAsciiWhitespace(row[3]).empty()) {
            requests.emplace_back(i, row[3]);
        }
    }

    const int n = input.students.size();
    input.preferences = PreferenceMatrix(n, n);
    for (const auto& [i, names] : requests) {
        for (absl::string_view name : absl::StrSplit(names, ',', absl::SkipWhitespace())) {
            const string partner(absl::StripAsciiWhitespace(name));
            auto it = index_by_name.find(partner);
            if (it == index_by_name.end()) {
                return absl::InvalidArgumentError(
                    absl::StrCat("row ", i + 1, ": unknown partner '", partner, "'"));
            }
            input.preferences.set(i, it->second, bonus);
            input.preferences.set(it->second, i, bonus);
        }
    }
    return input;
}

absl::StatusOr<double> ParseNumericCell(absl::string_view cell) {
    double v;
    if (!absl::SimpleAtod(cell, &v)) {
        return absl::InvalidArgumentError(absl::StrCat("cannot parse preference '", cell, "'"));
    }
    return v;
}

absl::StatusOr<ImmersionInput> ParseImmersionRows(const vector<string>& header, const Rows& rows,
                                                  const CellParser& parser) {
    ImmersionInput input;
    if (rows.empty()) {
        return absl::InvalidArgumentError("no student rows");
    }
    const int num_options = static_cast<int>(rows[0].size()) - 3;
    if (num_options < 1) {
        return absl::InvalidArgumentError(
            "rows need first name, last name, program and at least one preference");
    }

    vector<double> values;
    values.reserve(rows.size() * num_options);
    for (int i = 0; i < static_cast<int>(rows.size()); ++i) {
        const vector<string>& row = rows[i];
        if (static_cast<int>(row.size()) - 3 != num_options) {
            return absl::InvalidArgumentError(absl::StrCat("row ", i + 1, " has ",
                                                           static_cast<int>(row.size()) - 3,
                                                           " preferences, expected ", num_options));
        }
        input.students.push_back({row[0], row[1], row[2], {}});
        for (int k = 0; k < num_options; ++k) {
            absl::StatusOr<double> v = parser(row[3 + k]);
            if (!v.ok()) {
                return absl::InvalidArgumentError(
                    absl::StrCat("row ", i + 1, ": ", v.status().message()));
            }
            values.push_back(*v);
        }
    }
    input.preferences = PreferenceMatrix(rows.size(), num_options, std::move(values));

    if (header.empty()) {
        for (int k = 0; k < num_options; ++k) {
            input.option_labels.push_back(absl::StrCat("Option ", k + 1));
        }
    } else if (static_cast<int>(header.size()) - 3 != num_options) {
        return absl::InvalidArgumentError(absl::StrCat(
            "header has ", static_cast<int>(header.size()) - 3, " option labels, expected ",
            num_options));
    } else {
        input.option_labels.assign(header.begin() + 3, header.end());
    }
    return input;
}

}  // namespace assign_groups
