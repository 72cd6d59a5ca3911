#pragma once

#include <string>
#include <vector>

namespace rougel {

// Whitespace tokenizer: trim, split on runs of ASCII whitespace, lowercase
// each token by Unicode code point.
// Punctuation and markup stay inside the token they touch.
class Tokenizer {
public:
    static std::vector<std::string> tokenize(const std::string& text);

    // nullptr is the empty string.
    static std::vector<std::string> tokenize(const char* text);
};

} // namespace rougel
