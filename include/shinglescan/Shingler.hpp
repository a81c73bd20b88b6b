#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

namespace shinglescan {

using ShingleSet = std::unordered_set<std::string>;

class Shingler {
public:
    // Every window [i, i + n) of the token sequence, joined with single spaces.
    // Fewer than n tokens gives an empty set. Throws InvalidParameterError for n < 1.
    static ShingleSet shingle(const std::vector<std::string>& tokens, int n);

    // Upper bound on the number of shingles for tokenCount tokens.
    static std::size_t maxShingles(std::size_t tokenCount, int n);
};

} // namespace shinglescan
