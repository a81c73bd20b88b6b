#include "shinglescan/algorithms/Similarity.hpp"

#include <algorithm>
#include <cstdint>
#include <tbb/parallel_for.h>
#include "shinglescan/Errors.hpp"

namespace shinglescan::algo {

namespace {
// Index of the first (i, j > i) pair of row i in enumeration order.
inline size_t rowOffset(size_t i, size_t m) {
    return i * m - i * (i + 1) / 2;
}
} // namespace

std::size_t intersectionSize(const ShingleSet& a, const ShingleSet& b) {
    const ShingleSet& smaller = a.size() <= b.size() ? a : b;
    const ShingleSet& larger = a.size() <= b.size() ? b : a;
    size_t count = 0;
    for (const auto& s : smaller) {
        if (larger.count(s)) ++count;
    }
    return count;
}

ComparisonResult compare(const Document& a, const Document& b) {
    if (a.degenerate()) throw DegenerateDocumentError(a.id());
    if (b.degenerate()) throw DegenerateDocumentError(b.id());

    ComparisonResult r;
    if (a.id() <= b.id()) {
        r.first = a.id();
        r.second = b.id();
    } else {
        r.first = b.id();
        r.second = a.id();
    }
    r.overlap = intersectionSize(a.shingles(), b.shingles());
    r.denominator = std::min(a.size(), b.size());
    r.similarity = static_cast<double>(r.overlap) / static_cast<double>(r.denominator);
    return r;
}

std::size_t pairCount(std::size_t m) {
    return m < 2 ? 0 : m * (m - 1) / 2;
}

std::vector<ComparisonResult> compareAll(const std::vector<Document>& docs) {
    const size_t m = docs.size();
    std::vector<ComparisonResult> out(pairCount(m));
    if (out.empty()) return out;

    // Each row writes only its own slots.
    tbb::parallel_for(size_t(0), m - 1, [&](size_t i) {
        size_t slot = rowOffset(i, m);
        for (size_t j = i + 1; j < m; ++j) {
            out[slot++] = compare(docs[i], docs[j]);
        }
    });
    return out;
}

bool ranksBefore(const ComparisonResult& a, const ComparisonResult& b) {
    // Exact comparison of a.overlap / a.denominator against b.overlap / b.denominator.
    const uint64_t lhs = static_cast<uint64_t>(a.overlap) * static_cast<uint64_t>(b.denominator);
    const uint64_t rhs = static_cast<uint64_t>(b.overlap) * static_cast<uint64_t>(a.denominator);
    if (lhs != rhs) return lhs > rhs;
    if (a.overlap != b.overlap) return a.overlap > b.overlap;
    if (a.first != b.first) return a.first < b.first;
    return a.second < b.second;
}

bool passesThreshold(const ComparisonResult& result, double threshold) {
    return result.similarity > threshold;
}

std::vector<ComparisonResult> rank(const std::vector<Document>& docs, const Parameters& params) {
    params.validate();

    auto all = compareAll(docs);

    std::vector<ComparisonResult> hits;
    for (auto& r : all) {
        if (passesThreshold(r, params.threshold)) {
            hits.push_back(std::move(r));
        }
    }

    std::sort(hits.begin(), hits.end(), ranksBefore);
    if (params.maxResults && hits.size() > static_cast<size_t>(*params.maxResults)) {
        hits.resize(static_cast<size_t>(*params.maxResults));
    }
    return hits;
}

} // namespace shinglescan::algo
