#include "ShingleScan.hpp"
#include "shinglescan/Errors.hpp"
#include "shinglescan/ReportFormatter.hpp"

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using shinglescan::Config;
using shinglescan::ReportFormatter;
using shinglescan::ShingleScan;
using shinglescan::TextSource;

static void expect(bool cond, const std::string& msg) {
    if (!cond) {
        std::cerr << "Test failed: " << msg << std::endl;
        std::exit(1);
    }
}

static TextSource textSource(const std::string& id, const std::string& text) {
    return TextSource{id, [text]() { return text; }};
}

static std::vector<TextSource> submissions() {
    return {
        textSource("alice.txt", "It was the best of times, it was the worst of times, it was the age of wisdom."),
        textSource("bob.txt", "It was the best of times; it was the worst of times! It was the age of foolishness."),
        textSource("carol.txt", "Call me Ishmael. Some years ago, never mind how long precisely, I went to sea."),
        textSource("dave.txt", "Too short."),
        TextSource{"erin.txt", []() -> std::string { throw std::runtime_error("permission denied"); }},
        textSource("alice.txt", "duplicate identifier with enough words to shingle"),
    };
}

static void testScan() {
    Config cfg;
    cfg.params.n = 4;
    cfg.params.threshold = 0.2;
    ShingleScan engine(cfg);

    auto report = engine.scan(submissions());
    expect(report.documentCount == 3, "alice, bob and carol are compared");
    expect(report.comparisons == 3, "three pairs compared");
    expect(report.results.size() == 1, "only alice and bob are similar");
    expect(report.results[0].first == "alice.txt" && report.results[0].second == "bob.txt", "pair identified");
    expect(report.results[0].similarity > 0.5, "high similarity between near-copies");

    expect(report.degenerate == std::vector<std::string>{"dave.txt"}, "short document excluded");
    expect(report.skipped.size() == 2, "unreadable and duplicate sources skipped");
    expect(report.skipped[0].id == "erin.txt" && report.skipped[0].reason == "permission denied", "read failure reported");
    expect(report.skipped[1].id == "alice.txt" && report.skipped[1].reason == "duplicate identifier", "duplicate reported");

    // Repeated runs give identical output
    auto again = engine.scan(submissions());
    expect(ReportFormatter::toJson(again) == ReportFormatter::toJson(report), "deterministic report");

    // Thread limit does not change results
    cfg.threads = 1;
    auto single = ShingleScan(cfg).scan(submissions());
    expect(ReportFormatter::toJson(single) == ReportFormatter::toJson(report), "single worker gives same report");
}

static void testFailFast() {
    std::atomic<int> reads{0};
    std::vector<TextSource> sources{
        TextSource{"a", [&reads]() { ++reads; return std::string("one two three four five"); }},
        TextSource{"b", [&reads]() { ++reads; return std::string("one two three four six"); }},
    };

    Config cfg;
    cfg.params.n = 0;
    bool threw = false;
    try {
        ShingleScan(cfg).scan(sources);
    } catch (const shinglescan::InvalidParameterError& e) {
        threw = e.parameter() == "n";
    }
    expect(threw, "n=0 rejected");
    expect(reads == 0, "no source read before parameter validation");

    cfg.params.n = 2;
    cfg.params.threshold = -0.1;
    threw = false;
    try {
        ShingleScan(cfg).scan(sources);
    } catch (const shinglescan::InvalidParameterError& e) {
        threw = e.parameter() == "threshold";
    }
    expect(threw, "negative threshold rejected");
    expect(reads == 0, "still no source read");
}

static void testOversizedDocumentSkipped() {
    std::vector<TextSource> sources{
        textSource("kept_a.txt", "one two three four five six"),
        TextSource{"huge.txt", []() -> std::string { throw std::length_error("Tokenizer: text exceeds 2 GiB"); }},
        textSource("kept_b.txt", "one two three four five seven"),
    };
    Config cfg;
    cfg.params.n = 2;
    cfg.params.threshold = 0.0;
    auto report = ShingleScan(cfg).scan(sources);
    expect(report.documentCount == 2, "remaining documents still compared");
    expect(report.results.size() == 1, "remaining pair ranked");
    expect(report.skipped.size() == 1 && report.skipped[0].id == "huge.txt", "oversized document skipped");
    expect(report.skipped[0].reason.find("2 GiB") != std::string::npos, "skip reason kept");
}

static void testRequestParameters() {
    using shinglescan::Parameters;
    using json = nlohmann::json;

    auto rejected = [](const std::string& body, const std::string& parameter) {
        try {
            Parameters::fromJson(json::parse(body), Parameters{});
        } catch (const shinglescan::InvalidParameterError& e) {
            return e.parameter() == parameter;
        }
        return false;
    };

    expect(rejected(R"({"n": 2.9})", "n"), "fractional n rejected");
    expect(rejected(R"({"n": 4294967297})", "n"), "n beyond int range rejected");
    expect(rejected(R"({"n": "4"})", "n"), "string n rejected");
    expect(rejected(R"({"n": 0})", "n"), "zero n rejected");
    expect(rejected(R"({"max_results": 1.7})", "max_results"), "fractional max_results rejected");
    expect(rejected(R"({"max_results": 18446744073709551615})", "max_results"), "huge max_results rejected");
    expect(rejected(R"({"max_results": -2})", "max_results"), "negative max_results rejected");
    expect(rejected(R"({"threshold": "high"})", "threshold"), "string threshold rejected");
    expect(rejected(R"({"threshold": 1.5})", "threshold"), "threshold above 1 rejected");

    Parameters base;
    base.maxResults = 5;
    auto p = Parameters::fromJson(json::parse(R"({"n": 3, "threshold": 0.5, "max_results": null})"), base);
    expect(p.n == 3 && p.threshold == 0.5 && !p.maxResults, "valid overrides applied");

    p = Parameters::fromJson(json::parse(R"({"max_results": 2})"), Parameters{});
    expect(p.n == 4 && p.maxResults && *p.maxResults == 2, "absent fields keep defaults");
}

static void testScanDirectory() {
    namespace fs = std::filesystem;
    const fs::path root = fs::temp_directory_path() / "shinglescan_engine_test";
    fs::remove_all(root);
    fs::create_directories(root / "late");
    std::ofstream(root / "one.txt") << "the rain in spain stays mainly in the plain";
    std::ofstream(root / "two.txt") << "in spain the rain stays mainly in the plain they say";
    std::ofstream(root / "late" / "three.txt") << "the rain in spain stays mainly in the plain";

    Config cfg;
    cfg.params.n = 3;
    cfg.params.threshold = 0.0;
    ShingleScan engine(cfg);

    auto flat = engine.scanDirectory(root.string(), false);
    expect(flat.documentCount == 2, "flat scan ignores sub-directory");

    auto deep = engine.scanDirectory(root.string(), true);
    expect(deep.documentCount == 3, "recursive scan");
    expect(!deep.results.empty(), "identical texts found");
    expect(deep.results[0].first == "late/three.txt" && deep.results[0].second == "one.txt", "identical pair ranked first");
    expect(deep.results[0].similarity == 1.0, "identical texts have similarity 1");

    fs::remove_all(root);
}

static void testConfig() {
    setenv("SHINGLESCAN_N", "7", 1);
    setenv("SHINGLESCAN_THRESHOLD", "0.35", 1);
    setenv("SHINGLESCAN_MAX_RESULTS", "not-a-number", 1);
    setenv("SHINGLESCAN_VERBOSE", "0", 1);
    auto cfg = Config::fromEnvironment();
    expect(cfg.params.n == 7, "n from environment");
    expect(cfg.params.threshold == 0.35, "threshold from environment");
    expect(!cfg.params.maxResults, "malformed max results ignored");
    expect(!cfg.verbose, "verbose off");

    auto j = cfg.toJson();
    expect(j["params"]["n"] == 7 && j["params"]["max_results"].is_null(), "config as json");

    unsetenv("SHINGLESCAN_N");
    unsetenv("SHINGLESCAN_THRESHOLD");
    unsetenv("SHINGLESCAN_MAX_RESULTS");
    unsetenv("SHINGLESCAN_VERBOSE");
    cfg = Config::fromEnvironment();
    expect(cfg.params.n == 4 && cfg.params.threshold == 0.1, "defaults");

    // Trailing garbage and negative thread counts are malformed
    setenv("SHINGLESCAN_N", "7abc", 1);
    setenv("SHINGLESCAN_THREADS", "-1", 1);
    setenv("SHINGLESCAN_THRESHOLD", "0.5x", 1);
    cfg = Config::fromEnvironment();
    expect(cfg.params.n == 4, "n with trailing characters ignored");
    expect(cfg.threads == 0, "negative thread count ignored");
    expect(cfg.params.threshold == 0.1, "threshold with trailing characters ignored");

    setenv("SHINGLESCAN_THREADS", "3", 1);
    cfg = Config::fromEnvironment();
    expect(cfg.threads == 3, "thread count from environment");
    unsetenv("SHINGLESCAN_N");
    unsetenv("SHINGLESCAN_THREADS");
    unsetenv("SHINGLESCAN_THRESHOLD");
}

static void testFormatter() {
    Config cfg;
    cfg.params.n = 4;
    cfg.params.threshold = 0.2;
    auto report = ShingleScan(cfg).scan(submissions());

    auto text = ReportFormatter::toText(report);
    auto row = std::string("alice.txt, bob.txt");
    row += std::string(ReportFormatter::kPairWidth - row.size(), ' ');
    expect(text.find(row) != std::string::npos, "pair column padded to width");
    expect(text.find("Too short to compare") != std::string::npos && text.find("dave.txt") != std::string::npos,
           "degenerate section listed");
    expect(text.find("erin.txt: permission denied") != std::string::npos, "skipped section listed");

    auto j = ReportFormatter::toJson(report);
    expect(j["results"].size() == 1, "json results");
    expect(j["results"][0]["documents"][0] == "alice.txt", "json pair");
    expect(j["degenerate"][0] == "dave.txt", "json degenerate");
    expect(j["params"]["threshold"] == 0.2, "json params");

    // File names are raw bytes and need not be valid UTF-8
    std::vector<TextSource> oddNames{
        textSource("caf\xE9.txt", "the same words appear in both of these files"),
        textSource("plain.txt", "the same words appear in both of these files"),
        textSource("shor\xFF", "tiny"),
    };
    auto oddReport = ShingleScan(cfg).scan(oddNames);
    std::string dumped;
    bool dumpThrew = false;
    try {
        dumped = ReportFormatter::dump(ReportFormatter::toJson(oddReport), 2);
    } catch (const nlohmann::json::exception&) {
        dumpThrew = true;
    }
    expect(!dumpThrew, "invalid UTF-8 identifiers do not abort json output");
    expect(dumped.find("caf\xEF\xBF\xBD.txt") != std::string::npos, "invalid byte replaced with U+FFFD");
    expect(dumped.find("plain.txt") != std::string::npos, "other identifiers intact");
    auto reparsed = nlohmann::json::parse(dumped);
    expect(reparsed["results"].size() == 1 && reparsed["degenerate"].size() == 1, "full report survives");

    shinglescan::ScanReport empty;
    expect(ReportFormatter::toText(empty).find("No pairs above similarity") == 0, "empty report message");
}

int main() {
    testScan();
    testFailFast();
    testOversizedDocumentSkipped();
    testRequestParameters();
    testScanDirectory();
    testConfig();
    testFormatter();
    std::cout << "All tests passed." << std::endl;
    return 0;
}
