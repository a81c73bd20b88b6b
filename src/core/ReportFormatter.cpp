#include "shinglescan/ReportFormatter.hpp"

#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace shinglescan {

namespace {
// Left-justify like a text column; always leave at least one space.
std::string ljust(const std::string& s, std::size_t width) {
    if (s.size() >= width) return s + " ";
    return s + std::string(width - s.size(), ' ');
}
} // namespace

std::string ReportFormatter::toText(const ScanReport& report) {
    std::ostringstream out;

    if (report.results.empty()) {
        out << "No pairs above similarity " << report.params.threshold
            << " (n=" << report.params.n << ", " << report.documentCount << " documents)\n";
    } else {
        out << ljust("documents", kPairWidth) << ljust("shared", kOverlapWidth) << "similarity\n";
        for (const auto& r : report.results) {
            out << ljust(r.first + ", " + r.second, kPairWidth)
                << ljust(std::to_string(r.overlap), kOverlapWidth)
                << std::fixed << std::setprecision(6) << r.similarity << "\n";
        }
    }

    if (!report.skipped.empty()) {
        out << "\nSkipped (unreadable):\n";
        for (const auto& s : report.skipped) {
            out << "  " << s.id << ": " << s.reason << "\n";
        }
    }
    if (!report.degenerate.empty()) {
        out << "\nToo short to compare (fewer than " << report.params.n << " words):\n";
        for (const auto& id : report.degenerate) {
            out << "  " << id << "\n";
        }
    }
    return out.str();
}

std::string ReportFormatter::dump(const json& j, int indent) {
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

json ReportFormatter::toJson(const algo::ComparisonResult& result) {
    return json{
        {"documents", json::array({result.first, result.second})},
        {"overlap", result.overlap},
        {"denominator", result.denominator},
        {"similarity", result.similarity}
    };
}

json ReportFormatter::toJson(const ScanReport& report) {
    json results = json::array();
    for (const auto& r : report.results) {
        results.push_back(toJson(r));
    }

    json skipped = json::array();
    for (const auto& s : report.skipped) {
        skipped.push_back(json{{"id", s.id}, {"reason", s.reason}});
    }

    return json{
        {"params", report.params.toJson()},
        {"documents", report.documentCount},
        {"comparisons", report.comparisons},
        {"results", results},
        {"skipped", skipped},
        {"degenerate", report.degenerate}
    };
}

} // namespace shinglescan
