#pragma once

#include <string>
#include <vector>

namespace rougel::corpus {

struct Example {
    int level = 1;
    std::string levelName;
    std::string candidate;
    std::string reference;
};

// Sixteen fixture pairs in six levels, from plain sentences to mixed
// JSON/HTML text.
const std::vector<Example>& builtinExamples();

std::string levelName(int level);

// Accepts a JSON array of {"candidate","reference","level"?,"level_name"?}
// or an object holding that array under "examples".
// Throws std::runtime_error on I/O, parse or shape errors.
std::vector<Example> loadExamples(const std::string& path);

} // namespace rougel::corpus
