#include "shinglescan/Shingler.hpp"

#include "shinglescan/Errors.hpp"

namespace shinglescan {

ShingleSet Shingler::shingle(const std::vector<std::string>& tokens, int n) {
    if (n < 1) {
        throw InvalidParameterError("n", "shingle length must be at least 1, got " + std::to_string(n));
    }

    ShingleSet shingles;
    const size_t width = static_cast<size_t>(n);
    if (tokens.size() < width) return shingles;

    shingles.reserve(tokens.size() - width + 1);
    for (size_t i = 0; i + width <= tokens.size(); ++i) {
        std::string shingle = tokens[i];
        for (size_t k = i + 1; k < i + width; ++k) {
            shingle.push_back(' ');
            shingle += tokens[k];
        }
        shingles.insert(std::move(shingle));
    }
    return shingles;
}

std::size_t Shingler::maxShingles(std::size_t tokenCount, int n) {
    if (n < 1) return 0;
    const size_t width = static_cast<size_t>(n);
    return tokenCount < width ? 0 : tokenCount - width + 1;
}

} // namespace shinglescan
