#include <filesystem>
#include <iostream>
#include <argparse/argparse.hpp>
#include "ShingleScan.hpp"
#include "ShingleScanHttpServer.hpp"
#include "shinglescan/Errors.hpp"
#include "shinglescan/ReportFormatter.hpp"

int main(int argc, char* argv[]) {
    argparse::ArgumentParser program("shinglescan");
    program.add_description("Rank pairs of plaintext documents by the word sequences they share.");
    program.add_argument("directory")
        .help("directory to search through")
        .nargs(argparse::nargs_pattern::optional)
        .default_value(std::string(""));
    program.add_argument("-d", "--directory").metavar("DIR")
        .help("directory to search through")
        .default_value(std::string(""));
    program.add_argument("-r", "--recursive")
        .help("search the directory recursively")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-n", "--ngram").metavar("N")
        .help("number of words per shingle")
        .scan<'i', int>();
    program.add_argument("-t", "--threshold").metavar("THRESHOLD")
        .help("report pairs whose similarity is above this value (0 to 1)")
        .scan<'g', double>();
    program.add_argument("-m", "--max-results").metavar("K")
        .help("report at most K pairs")
        .scan<'i', long long>();
    program.add_argument("-f", "--format").metavar("FORMAT")
        .help("output format: text or json")
        .default_value(std::string("text"));
    program.add_argument("-j", "--threads").metavar("THREADS")
        .help("worker threads (0 = all cores)")
        .scan<'i', int>();
    program.add_argument("-v", "--verbose")
        .help("run in verbose mode")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--serve").metavar("PORT")
        .help("serve /v1/compare over HTTP instead of scanning a directory")
        .scan<'i', int>();
    program.add_argument("--host").metavar("HOST")
        .help("address to bind in --serve mode")
        .default_value(std::string("0.0.0.0"));

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    shinglescan::Config cfg = shinglescan::Config::fromEnvironment();
    cfg.directory = std::filesystem::current_path().string();
    if (auto dir = program.get<std::string>("directory"); !dir.empty()) cfg.directory = dir;
    if (auto dir = program.get<std::string>("--directory"); !dir.empty()) cfg.directory = dir;
    if (program.get<bool>("--recursive")) cfg.recursive = true;
    if (program.get<bool>("--verbose")) cfg.verbose = true;
    if (auto n = program.present<int>("--ngram")) cfg.params.n = *n;
    if (auto t = program.present<double>("--threshold")) cfg.params.threshold = *t;
    if (auto m = program.present<long long>("--max-results")) cfg.params.maxResults = *m;
    if (auto j = program.present<int>("--threads")) {
        if (*j < 0) {
            std::cerr << "ERROR: --threads must not be negative\n";
            return 1;
        }
        cfg.threads = static_cast<std::size_t>(*j);
    }
    cfg.format = program.get<std::string>("--format");
    cfg.host = program.get<std::string>("--host");
    if (cfg.format != "text" && cfg.format != "json") {
        std::cerr << "ERROR: unknown format '" << cfg.format << "'\n";
        return 1;
    }

    try {
        cfg.params.validate();
    } catch (const shinglescan::InvalidParameterError& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }

    try {
        if (auto port = program.present<int>("--serve")) {
            cfg.port = *port;
            ShingleScanHttpServer app(cfg.host, cfg.port, cfg);
            app.run();
            return 0;
        }

        if (!std::filesystem::is_directory(cfg.directory)) {
            std::cerr << "ERROR: invalid directory\n";
            return 1;
        }

        shinglescan::ShingleScan engine(cfg);
        auto report = engine.scanDirectory(cfg.directory, cfg.recursive);
        if (cfg.format == "json") {
            std::cout << shinglescan::ReportFormatter::dump(shinglescan::ReportFormatter::toJson(report), 2) << "\n";
        } else {
            std::cout << shinglescan::ReportFormatter::toText(report);
        }
    } catch (const shinglescan::SourceDiscoveryError& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
