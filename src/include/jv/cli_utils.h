#pragma once

#include <algorithm>
#include <string>
#include <vector>

namespace jv {
namespace cli_utils {

// Number of single-character edits needed to turn one string into another
inline size_t levenshtein_distance(const std::string& a, const std::string& b) {
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

// Closest candidate within 3 edits (or 40% of the word), empty if none
inline std::string suggest_similar(const std::string& word, const std::vector<std::string>& candidates) {
    std::string best;
    size_t best_distance = 0;
    for (const auto& c : candidates) {
        size_t d = levenshtein_distance(word, c);
        if (best.empty() || d < best_distance) {
            best = c;
            best_distance = d;
        }
    }
    size_t threshold = std::max<size_t>(3, static_cast<size_t>(word.size() * 0.4));
    return (!best.empty() && best_distance <= threshold) ? best : std::string();
}

// "<what>: <word>" followed by a "Did you mean" hint when one is close enough
inline std::string unknown_word_error(const std::string& what, const std::string& word,
                                      const std::vector<std::string>& candidates) {
    std::string error = what + ": " + word;
    std::string suggestion = suggest_similar(word, candidates);
    if (!suggestion.empty()) error += "\n  Did you mean '" + suggestion + "'?";
    return error;
}

} // namespace cli_utils
} // namespace jv
