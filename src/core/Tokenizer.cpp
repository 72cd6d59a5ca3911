#include "rougel/Tokenizer.hpp"

#include <cctype>
#include <cstdint>

#include <unicode/locid.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>

namespace rougel {

namespace {

bool isAscii(const std::string& token) {
    for (unsigned char ch : token) {
        if (ch >= 0x80) return false;
    }
    return true;
}

bool isValidUtf8(const std::string& token) {
    const auto* s = reinterpret_cast<const uint8_t*>(token.data());
    const int32_t length = static_cast<int32_t>(token.size());
    int32_t i = 0;
    while (i < length) {
        UChar32 c;
        U8_NEXT(s, i, length, c);
        if (c < 0) return false;
    }
    return true;
}

// Full Unicode lowercase on code points; ill-formed UTF-8 keeps its bytes and
// only ASCII letters are lowered.
std::string lower(const std::string& token) {
    std::string out;
    if (isAscii(token) || !isValidUtf8(token)) {
        out.reserve(token.size());
        for (unsigned char ch : token) {
            out.push_back(static_cast<char>(ch < 0x80 ? std::tolower(ch) : ch));
        }
        return out;
    }
    icu::UnicodeString utoken = icu::UnicodeString::fromUTF8(icu::StringPiece(token.data(), static_cast<int32_t>(token.size())));
    utoken.toLower(icu::Locale::getRoot());
    utoken.toUTF8String(out);
    return out;
}

} // namespace

std::vector<std::string> Tokenizer::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;

    for (unsigned char ch : text) {
        if (std::isspace(ch)) {
            if (!current.empty()) {
                tokens.push_back(lower(current));
                current.clear();
            }
        } else {
            current.push_back(static_cast<char>(ch));
        }
    }
    if (!current.empty()) {
        tokens.push_back(lower(current));
    }

    return tokens;
}

std::vector<std::string> Tokenizer::tokenize(const char* text) {
    if (!text) return {};
    return tokenize(std::string(text));
}

} // namespace rougel
