//RougeL.hpp
#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "rougel/Tokenizer.hpp"
#include "rougel/algorithms/Lcs.hpp"

namespace rougel {

struct ScoreResult {
    double fMeasure = 0.0;
    double precision = 0.0;
    double recall = 0.0;
};

inline bool operator==(const ScoreResult& a, const ScoreResult& b) {
    return a.fMeasure == b.fMeasure && a.precision == b.precision && a.recall == b.recall;
}

inline bool operator!=(const ScoreResult& a, const ScoreResult& b) {
    return !(a == b);
}

// Decimal digits only, whole string, fits in size_t. No sign, no whitespace.
bool parseCount(const std::string& text, std::size_t& out);

// Harmonic mean; 0 when both are 0.
double fMeasure(double precision, double recall);

void to_json(nlohmann::json& j, const ScoreResult& r);
void from_json(const nlohmann::json& j, ScoreResult& r);

struct Options {
    // Per-side token cap before the LCS step; 0 disables truncation.
    std::size_t maxTokens = 0;
    // Upper bound on pairs accepted by one batch request.
    std::size_t maxBatch = 1000;
    std::string host = "0.0.0.0";
    int port = 8080;

    // ROUGEL_MAX_TOKENS, ROUGEL_MAX_BATCH, ROUGEL_HOST, ROUGEL_PORT
    static Options fromEnvironment();
};

class RougeL {
public:
    using Pair = std::pair<std::string, std::string>;

    explicit RougeL(Options options = Options{});

    // ROUGE-L of candidate against reference. Never throws; an empty side
    // (after trimming) yields {0, 0, 0}.
    ScoreResult score(const std::string& candidate, const std::string& reference) const;

    // nullptr is the empty string.
    ScoreResult score(const char* candidate, const char* reference) const;

    std::vector<ScoreResult> scoreBatch(const std::vector<Pair>& pairs) const;

    const Options& options() const { return options_; }

private:
    Options options_;

    ScoreResult scoreTokens(std::vector<std::string> candidate, std::vector<std::string> reference) const;
    bool capTokens(std::vector<std::string>& tokens) const;
};

} // namespace rougel
