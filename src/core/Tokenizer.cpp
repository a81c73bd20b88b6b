#include "shinglescan/Tokenizer.hpp"

#include <cctype>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <unicode/uchar.h>
#include <unicode/utf8.h>

namespace shinglescan {

namespace {
constexpr UChar32 kReplacementChar = 0xFFFD;

// Unicode punctuation plus the ASCII symbols POSIX [[:punct:]] also covers ($+<=>^`|~).
bool isPunctuation(UChar32 c) {
    if (u_ispunct(c)) return true;
    return c < 0x80 && std::ispunct(static_cast<unsigned char>(c));
}

void appendUtf8(std::string& out, UChar32 c) {
    uint8_t buf[U8_MAX_LENGTH];
    int32_t len = 0;
    U8_APPEND_UNSAFE(buf, len, c);
    out.append(reinterpret_cast<const char*>(buf), static_cast<size_t>(len));
}
} // namespace

std::vector<std::string> Tokenizer::tokenize(const std::string& text) {
    if (text.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        throw std::length_error("Tokenizer: text exceeds 2 GiB");
    }

    std::vector<std::string> tokens;
    std::string current;

    const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
    const int32_t length = static_cast<int32_t>(text.size());
    int32_t i = 0;

    // Skip BOM
    if (length >= 3 && bytes[0] == 0xEF && bytes[1] == 0xBB && bytes[2] == 0xBF) {
        i = 3;
    }

    while (i < length) {
        UChar32 c = 0;
        U8_NEXT(bytes, i, length, c);
        if (c < 0) {
            c = kReplacementChar;
        }

        if (u_isUWhiteSpace(c)) {
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
            continue;
        }
        if (isPunctuation(c)) {
            continue;
        }
        appendUtf8(current, u_tolower(c));
    }
    if (!current.empty()) {
        tokens.push_back(current);
    }

    return tokens;
}

} // namespace shinglescan
