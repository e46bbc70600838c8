#pragma once

#include <string>
#include <vector>

// Outcome of classifying one piece of text.
// "Unknown" is represented by an empty std::optional<Verdict>, never by a clean verdict.
struct Verdict {
    bool is_violation = false;
    std::vector<std::string> matched_terms;
    std::string original_text;
    std::string masked_text;
};
