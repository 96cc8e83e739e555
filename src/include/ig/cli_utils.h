#pragma once

#include <algorithm>
#include <string>
#include <vector>

namespace ig {
namespace cli_utils {

// Number of single-character insertions, deletions or substitutions needed
// to turn `a` into `b`
inline size_t edit_distance(const std::string& a, const std::string& b) {
    std::vector<size_t> row(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) row[j] = j;
    for (size_t i = 1; i <= a.size(); ++i) {
        size_t diag = row[0];
        row[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t up = row[j];
            size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
            row[j] = std::min({row[j] + 1, row[j - 1] + 1, diag + cost});
            diag = up;
        }
    }
    return row[b.size()];
}

// Closest known option, or "" when nothing is close enough to be a typo
inline std::string closest_option(const std::string& arg, const std::vector<std::string>& options) {
    std::string best;
    size_t best_distance = 0;
    for (auto const& option : options) {
        size_t d = edit_distance(arg, option);
        if (best.empty() || d < best_distance) {
            best = option;
            best_distance = d;
        }
    }
    size_t threshold = std::max<size_t>(2, arg.size() * 2 / 5);
    return (!best.empty() && best_distance <= threshold) ? best : std::string();
}

inline std::string unknown_option_message(const std::string& arg, const std::vector<std::string>& options) {
    std::string msg = "Unknown argument: " + arg;
    std::string suggestion = closest_option(arg, options);
    if (!suggestion.empty()) msg += "\n  Did you mean '" + suggestion + "'?";
    return msg;
}

}  // namespace cli_utils
}  // namespace ig
