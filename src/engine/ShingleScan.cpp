//ShingleScan.cpp
#include "ShingleScan.hpp"

#include <exception>
#include <iostream>
#include <optional>
#include <unordered_set>
#include <tbb/global_control.h>
#include <tbb/parallel_for.h>
#include "shinglescan/Errors.hpp"
#include "shinglescan/SourceLoader.hpp"

namespace shinglescan {

ShingleScan::ShingleScan(Config config) : config_(std::move(config)) {
    if (config_.verbose) {
        std::cerr << "ShingleScan: n=" << config_.params.n
                  << " threshold=" << config_.params.threshold
                  << " maxResults=" << (config_.params.maxResults ? std::to_string(*config_.params.maxResults) : "none")
                  << " threads=" << (config_.threads ? std::to_string(config_.threads) : "auto") << "\n";
    }
}

ScanReport ShingleScan::scan(const std::vector<TextSource>& sources) const {
    // Fail fast, before any source is read.
    config_.params.validate();

    std::optional<tbb::global_control> limit;
    if (config_.threads > 0) {
        limit.emplace(tbb::global_control::max_allowed_parallelism, config_.threads);
    }

    ScanReport report;
    report.params = config_.params;

    auto built = buildDocuments(sources);
    report.skipped = std::move(built.skipped);
    report.degenerate = std::move(built.degenerate);
    report.documentCount = built.documents.size();
    report.comparisons = algo::pairCount(built.documents.size());

    if (config_.verbose) {
        std::cerr << "ShingleScan: comparing " << report.documentCount << " documents ("
                  << report.comparisons << " pairs)\n";
    }

    report.results = algo::rank(built.documents, config_.params);

    if (config_.verbose) {
        std::cerr << "ShingleScan: " << report.results.size() << " pairs above threshold\n";
    }
    return report;
}

ScanReport ShingleScan::scanDirectory(const std::string& directory, bool recursive) const {
    config_.params.validate();
    auto sources = SourceLoader::discover(directory, recursive, config_.verbose);
    return scan(sources);
}

ShingleScan::BuildOutcome ShingleScan::buildDocuments(const std::vector<TextSource>& sources) const {
    const int n = config_.params.n;

    std::vector<std::optional<Document>> slots(sources.size());
    std::vector<std::string> failures(sources.size());

    tbb::parallel_for(size_t(0), sources.size(), [&](size_t i) {
        try {
            slots[i].emplace(Document::build(sources[i], n));
        } catch (const SourceUnavailableError& e) {
            failures[i] = e.reason();
        } catch (const std::exception& e) {
            // One bad document must not abort the batch.
            failures[i] = e.what();
        }
    });

    // Sequential pass keeps the report in input order.
    BuildOutcome out;
    out.documents.reserve(sources.size());
    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < sources.size(); ++i) {
        const auto& id = sources[i].id;
        if (!slots[i]) {
            std::cerr << "ShingleScan: skipped " << id << ": " << failures[i] << "\n";
            out.skipped.push_back({id, failures[i]});
            continue;
        }
        if (!seen.insert(id).second) {
            std::cerr << "ShingleScan: skipped " << id << ": duplicate identifier\n";
            out.skipped.push_back({id, "duplicate identifier"});
            continue;
        }
        if (slots[i]->degenerate()) {
            if (config_.verbose) {
                std::cerr << "ShingleScan: " << id << " too short to compare ("
                          << slots[i]->tokenCount() << " tokens, n=" << n << ")\n";
            }
            out.degenerate.push_back(id);
            continue;
        }
        if (config_.verbose) {
            std::cerr << "ShingleScan: " << id << " tokens=" << slots[i]->tokenCount()
                      << " shingles=" << slots[i]->size() << "\n";
        }
        out.documents.push_back(std::move(*slots[i]));
    }
    return out;
}

} // namespace shinglescan
