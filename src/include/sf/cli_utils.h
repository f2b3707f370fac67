#pragma once

#include <algorithm>
#include <string>
#include <vector>

namespace sf {
namespace cli_utils {

// Number of single-character edits turning a into b.
inline size_t edit_distance(const std::string& a, const std::string& b) {
    std::vector<size_t> prev(b.size() + 1), cur(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) prev[j] = j;
    for (size_t i = 1; i <= a.size(); ++i) {
        cur[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t substitution = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, substitution});
        }
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

// Closest known option, or "" when nothing is within a few edits.
inline std::string closest_option(const std::string& arg, const std::vector<std::string>& options) {
    std::string best;
    size_t best_distance = 0;
    for (auto const& option : options) {
        size_t d = edit_distance(arg, option);
        if (best.empty() or d < best_distance) {
            best = option;
            best_distance = d;
        }
    }
    size_t threshold = std::max<size_t>(3, arg.size() * 2 / 5);
    return best_distance <= threshold ? best : "";
}

inline std::string unknown_option_message(const std::string& arg, const std::vector<std::string>& options) {
    std::string msg = "Unknown argument: " + arg;
    std::string suggestion = closest_option(arg, options);
    if (!suggestion.empty()) msg += "\n  Did you mean '" + suggestion + "'?";
    return msg;
}

}  // namespace cli_utils
}  // namespace sf
