#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "shinglescan/Document.hpp"

namespace shinglescan {

// Turns a directory tree into named text sources. Never changes the working directory.
class SourceLoader {
public:
    // Regular files under directory, identified by their path relative to it and sorted.
    // Throws SourceDiscoveryError if directory is not a directory or an entry is
    // neither a file nor a directory (broken symlink, socket, fifo).
    static std::vector<TextSource> discover(const std::string& directory, bool recursive, bool verbose = false);

    // A source whose reader opens path lazily.
    static TextSource fileSource(const std::filesystem::path& path, std::string id);

    // Whole file as bytes; throws std::runtime_error if it cannot be read.
    static std::string readFile(const std::filesystem::path& path);
};

} // namespace shinglescan
