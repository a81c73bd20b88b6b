#pragma once

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>
#include "shinglescan/ScanReport.hpp"

namespace shinglescan {

class ReportFormatter {
public:
    static constexpr std::size_t kPairWidth = 50;
    static constexpr std::size_t kOverlapWidth = 6;

    // Justified columns: pair, shared shingles, similarity. Exclusions follow.
    static std::string toText(const ScanReport& report);

    static nlohmann::json toJson(const ScanReport& report);
    static nlohmann::json toJson(const algo::ComparisonResult& result);

    // Serializes j, replacing invalid UTF-8 (e.g. raw file names) with U+FFFD.
    static std::string dump(const nlohmann::json& j, int indent = -1);
};

} // namespace shinglescan
