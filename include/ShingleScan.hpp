//ShingleScan.hpp
#pragma once

#include <string>
#include <vector>
#include "shinglescan/Config.hpp"
#include "shinglescan/Document.hpp"
#include "shinglescan/ScanReport.hpp"
#include "shinglescan/algorithms/Similarity.hpp"

namespace shinglescan {

class ShingleScan {
public:
    using ComparisonResult = algo::ComparisonResult;

    explicit ShingleScan(Config config = Config{});

    // Builds a document per source, sets aside unreadable and too-short ones,
    // and ranks every remaining pair. Throws InvalidParameterError before any
    // source is read if the parameters are invalid.
    ScanReport scan(const std::vector<TextSource>& sources) const;

    // Same as scan() over the files SourceLoader discovers in directory.
    ScanReport scanDirectory(const std::string& directory, bool recursive) const;

    const Config& config() const { return config_; }

private:
    Config config_;

    // One slot per source, filled in parallel.
    struct BuildOutcome {
        std::vector<Document> documents;
        std::vector<SkippedSource> skipped;
        std::vector<std::string> degenerate;
    };

    BuildOutcome buildDocuments(const std::vector<TextSource>& sources) const;
};

} // namespace shinglescan
