#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "shinglescan/Config.hpp"
#include "shinglescan/Document.hpp"

namespace shinglescan::algo {

// Result for one unordered pair; first <= second lexically.
struct ComparisonResult {
    std::string first;
    std::string second;
    std::size_t overlap = 0;     // |A ∩ B|
    std::size_t denominator = 0; // min(|A|, |B|)
    double similarity = 0.0;     // overlap / denominator
};

std::size_t intersectionSize(const ShingleSet& a, const ShingleSet& b);

// Throws DegenerateDocumentError if either document has no shingles.
ComparisonResult compare(const Document& a, const Document& b);

// Number of unordered pairs of m documents.
std::size_t pairCount(std::size_t m);

// All m*(m-1)/2 comparisons, in enumeration order (i < j).
std::vector<ComparisonResult> compareAll(const std::vector<Document>& docs);

// Descending similarity, then descending overlap, then identifier pair.
bool ranksBefore(const ComparisonResult& a, const ComparisonResult& b);

bool passesThreshold(const ComparisonResult& result, double threshold);

// Filters on similarity > threshold, sorts with ranksBefore, then caps at maxResults.
std::vector<ComparisonResult> rank(const std::vector<Document>& docs, const Parameters& params);

} // namespace shinglescan::algo
