#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include "shinglescan/Shingler.hpp"

namespace shinglescan {

// A named source of raw text. read() is called once per run and may throw.
struct TextSource {
    std::string id;
    std::function<std::string()> read;
};

class Document {
public:
    Document(std::string id, ShingleSet shingles, std::size_t tokenCount = 0);

    static Document build(const std::string& id, const std::string& rawText, int n);

    // Reads the source once; throws SourceUnavailableError when it cannot be read.
    static Document build(const TextSource& source, int n);

    const std::string& id() const { return id_; }
    const ShingleSet& shingles() const { return shingles_; }
    std::size_t size() const { return shingles_.size(); }
    std::size_t tokenCount() const { return tokenCount_; }
    bool degenerate() const { return shingles_.empty(); }

private:
    std::string id_;
    ShingleSet shingles_;
    std::size_t tokenCount_ = 0;
};

} // namespace shinglescan
