#include "shinglescan/SourceLoader.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <set>
#include <stdexcept>
#include <system_error>
#include "shinglescan/Errors.hpp"

namespace fs = std::filesystem;

namespace shinglescan {

namespace {

void walk(const fs::path& root,
          const fs::path& dir,
          bool recursive,
          bool verbose,
          std::set<fs::path>& visited,
          std::vector<TextSource>& out) {
    std::error_code ec;
    fs::path canonical = fs::canonical(dir, ec);
    if (!ec && !visited.insert(canonical).second) {
        if (verbose) std::cerr << "SourceLoader: already visited " << dir.string() << "\n";
        return;
    }

    fs::directory_iterator it(dir, ec);
    if (ec) {
        throw SourceDiscoveryError(dir.string(), "cannot list directory (" + ec.message() + ")");
    }

    if (verbose) std::cerr << "SourceLoader: fetching documents from " << dir.string() << "\n";

    for (const auto& entry : it) {
        const fs::path& path = entry.path();
        // status() follows symlinks, so a dangling link reports not_found here.
        auto st = entry.status(ec);
        if (ec && ec != std::errc::no_such_file_or_directory) {
            throw SourceDiscoveryError(path.string(), "cannot stat entry (" + ec.message() + ")");
        }

        if (fs::is_directory(st)) {
            if (recursive) {
                walk(root, path, recursive, verbose, visited, out);
            } else if (verbose) {
                std::cerr << "SourceLoader: skipping directory " << path.string() << "\n";
            }
        } else if (fs::is_regular_file(st)) {
            auto id = path.lexically_relative(root).generic_string();
            if (verbose) std::cerr << "SourceLoader: adding " << id << "\n";
            out.push_back(SourceLoader::fileSource(path, std::move(id)));
        } else {
            throw SourceDiscoveryError(path.string(), "neither file nor directory");
        }
    }
}

} // namespace

std::vector<TextSource> SourceLoader::discover(const std::string& directory, bool recursive, bool verbose) {
    fs::path root(directory);
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw SourceDiscoveryError(directory, "not a directory");
    }

    std::vector<TextSource> sources;
    std::set<fs::path> visited;
    walk(root, root, recursive, verbose, visited, sources);

    std::sort(sources.begin(), sources.end(), [](const TextSource& a, const TextSource& b) {
        return a.id < b.id;
    });
    return sources;
}

TextSource SourceLoader::fileSource(const fs::path& path, std::string id) {
    return TextSource{std::move(id), [path]() { return SourceLoader::readFile(path); }};
}

std::string SourceLoader::readFile(const fs::path& path) {
    std::error_code ec;
    auto st = fs::status(path, ec);
    if (ec || !fs::exists(st)) {
        throw std::runtime_error("no such file");
    }
    if (!fs::is_regular_file(st)) {
        throw std::runtime_error("not a regular file");
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot open for reading");
    }
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw std::runtime_error("read failed");
    }
    return data;
}

} // namespace shinglescan
