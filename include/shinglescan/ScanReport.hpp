#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "shinglescan/Config.hpp"
#include "shinglescan/algorithms/Similarity.hpp"

namespace shinglescan {

struct SkippedSource {
    std::string id;
    std::string reason;
};

// Outcome of one run: ranked pairs plus everything left out of the comparison.
struct ScanReport {
    Parameters params;
    std::vector<algo::ComparisonResult> results;
    std::vector<SkippedSource> skipped;   // unreadable or duplicate sources
    std::vector<std::string> degenerate;  // too short for n
    std::size_t documentCount = 0;        // documents that took part in comparison
    std::size_t comparisons = 0;          // pairs compared before filtering
};

} // namespace shinglescan
