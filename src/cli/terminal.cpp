//! # Terminal Helpers

#include "cli/terminal.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <unistd.h>
#include <utility>

namespace maplint::cli {

bool terminal_supports_colors() {
    if (!isatty(fileno(stdout)))
        return false;
    if (std::getenv("NO_COLOR") != nullptr)
        return false;
    const char* term = std::getenv("TERM");
    return term != nullptr && std::strcmp(term, "dumb") != 0;
}

size_t levenshtein_distance(const std::string& s1, const std::string& s2) {
    const size_t m = s1.length();
    const size_t n = s2.length();

    if (m == 0)
        return n;
    if (n == 0)
        return m;

    std::vector<size_t> prev_row(n + 1);
    std::vector<size_t> curr_row(n + 1);
    for (size_t j = 0; j <= n; ++j) {
        prev_row[j] = j;
    }

    for (size_t i = 1; i <= m; ++i) {
        curr_row[0] = i;
        for (size_t j = 1; j <= n; ++j) {
            char c1 = static_cast<char>(std::tolower(static_cast<unsigned char>(s1[i - 1])));
            char c2 = static_cast<char>(std::tolower(static_cast<unsigned char>(s2[j - 1])));
            size_t cost = (c1 == c2) ? 0 : 1;

            curr_row[j] = std::min({prev_row[j] + 1,          // deletion
                                    curr_row[j - 1] + 1,      // insertion
                                    prev_row[j - 1] + cost}); // substitution
        }
        std::swap(prev_row, curr_row);
    }

    return prev_row[n];
}

std::vector<std::string> find_similar_candidates(const std::string& input,
                                                 const std::vector<std::string>& candidates,
                                                 size_t max_results, size_t max_distance) {
    if (input.empty() || candidates.empty()) {
        return {};
    }

    std::vector<std::pair<std::string, size_t>> scored;
    scored.reserve(candidates.size());

    for (const auto& candidate : candidates) {
        size_t len_diff = input.length() > candidate.length() ? input.length() - candidate.length()
                                                              : candidate.length() - input.length();
        if (len_diff > max_distance) {
            continue;
        }
        size_t dist = levenshtein_distance(input, candidate);
        if (dist <= max_distance) {
            scored.emplace_back(candidate, dist);
        }
    }

    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.second < b.second; });

    std::vector<std::string> result;
    result.reserve(std::min(max_results, scored.size()));
    for (size_t i = 0; i < max_results && i < scored.size(); ++i) {
        result.push_back(scored[i].first);
    }
    return result;
}

} // namespace maplint::cli
