//! # Terminal Helpers
//!
//! ANSI colors for CLI output and edit-distance suggestions for mistyped
//! rule codes and commands.

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace maplint::cli {

struct Colors {
    static constexpr const char* Reset = "\033[0m";
    static constexpr const char* Bold = "\033[1m";
    static constexpr const char* Dim = "\033[2m";

    static constexpr const char* Red = "\033[31m";
    static constexpr const char* Green = "\033[32m";
    static constexpr const char* Yellow = "\033[33m";
    static constexpr const char* Blue = "\033[34m";
    static constexpr const char* Cyan = "\033[36m";

    static constexpr const char* BrightRed = "\033[91m";
    static constexpr const char* BrightYellow = "\033[93m";
    static constexpr const char* BrightCyan = "\033[96m";
};

/// True when stdout is a terminal that understands ANSI escapes.
bool terminal_supports_colors();

/// Case-insensitive edit distance.
size_t levenshtein_distance(const std::string& s1, const std::string& s2);

/// Up to `max_results` candidates within `max_distance` of `input`, closest first.
std::vector<std::string> find_similar_candidates(const std::string& input,
                                                 const std::vector<std::string>& candidates,
                                                 size_t max_results = 3, size_t max_distance = 2);

} // namespace maplint::cli
