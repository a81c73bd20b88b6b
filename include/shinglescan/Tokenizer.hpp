#pragma once

#include <string>
#include <vector>

namespace shinglescan {

// Splits UTF-8 text into lowercase words with punctuation removed.
// Malformed byte sequences are replaced with U+FFFD instead of failing.
class Tokenizer {
public:
    static std::vector<std::string> tokenize(const std::string& text);
};

} // namespace shinglescan
