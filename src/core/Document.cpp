#include "shinglescan/Document.hpp"

#include <exception>
#include <stdexcept>
#include "shinglescan/Errors.hpp"
#include "shinglescan/Tokenizer.hpp"

namespace shinglescan {

Document::Document(std::string id, ShingleSet shingles, std::size_t tokenCount)
    : id_(std::move(id)), shingles_(std::move(shingles)), tokenCount_(tokenCount) {
}

Document Document::build(const std::string& id, const std::string& rawText, int n) {
    auto tokens = Tokenizer::tokenize(rawText);
    auto shingles = Shingler::shingle(tokens, n);
    return Document(id, std::move(shingles), tokens.size());
}

Document Document::build(const TextSource& source, int n) {
    if (!source.read) {
        throw SourceUnavailableError(source.id, "no reader attached");
    }

    std::string text;
    try {
        text = source.read();
    } catch (const SourceUnavailableError&) {
        throw;
    } catch (const std::exception& e) {
        throw SourceUnavailableError(source.id, e.what());
    }

    try {
        return build(source.id, text, n);
    } catch (const std::length_error& e) {
        throw SourceUnavailableError(source.id, e.what());
    }
}

} // namespace shinglescan
