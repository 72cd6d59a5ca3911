//RougeL.cpp
#include "RougeL.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <iostream>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace rougel {

namespace {

void readSizeEnv(const char* name, std::size_t& target, std::size_t minValue) {
    const char* env = std::getenv(name);
    if (!env) return;
    std::size_t value = 0;
    if (!parseCount(env, value) || value < minValue) {
        std::cerr << "RougeL: ignoring malformed " << name << "=" << env
                  << ", keeping " << target << "\n";
        return;
    }
    target = value;
}

} // namespace

bool parseCount(const std::string& text, std::size_t& out) {
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) return false;
    try {
        std::size_t pos = 0;
        const unsigned long long v = std::stoull(text, &pos);
        if (pos != text.size() || v > std::numeric_limits<std::size_t>::max()) return false;
        out = static_cast<std::size_t>(v);
        return true;
    } catch (const std::out_of_range&) {
        return false;
    }
}

double fMeasure(double precision, double recall) {
    const double sum = precision + recall;
    if (sum <= 0.0) return 0.0;
    return 2.0 * precision * recall / sum;
}

void to_json(json& j, const ScoreResult& r) {
    j = json{
        {"f_measure", r.fMeasure},
        {"precision", r.precision},
        {"recall", r.recall}
    };
}

void from_json(const json& j, ScoreResult& r) {
    r.fMeasure = j.value("f_measure", 0.0);
    r.precision = j.value("precision", 0.0);
    r.recall = j.value("recall", 0.0);
}

Options Options::fromEnvironment() {
    Options opts;
    readSizeEnv("ROUGEL_MAX_TOKENS", opts.maxTokens, 0);
    readSizeEnv("ROUGEL_MAX_BATCH", opts.maxBatch, 1);
    if (const char* envHost = std::getenv("ROUGEL_HOST")) {
        if (*envHost) opts.host = envHost;
    }
    if (const char* envPort = std::getenv("ROUGEL_PORT")) {
        std::size_t p = 0;
        if (parseCount(envPort, p) && p > 0 && p < 65536) {
            opts.port = static_cast<int>(p);
        } else {
            std::cerr << "RougeL: ignoring malformed ROUGEL_PORT=" << envPort
                      << ", keeping " << opts.port << "\n";
        }
    }
    return opts;
}

RougeL::RougeL(Options options) : options_(std::move(options)) {}

ScoreResult RougeL::score(const std::string& candidate, const std::string& reference) const {
    return scoreTokens(Tokenizer::tokenize(candidate), Tokenizer::tokenize(reference));
}

ScoreResult RougeL::score(const char* candidate, const char* reference) const {
    return scoreTokens(Tokenizer::tokenize(candidate), Tokenizer::tokenize(reference));
}

std::vector<ScoreResult> RougeL::scoreBatch(const std::vector<Pair>& pairs) const {
    std::vector<ScoreResult> out;
    out.reserve(pairs.size());
    for (const auto& p : pairs) {
        out.push_back(score(p.first, p.second));
    }
    return out;
}

ScoreResult RougeL::scoreTokens(std::vector<std::string> candidate, std::vector<std::string> reference) const {
    if (candidate.empty() || reference.empty()) return ScoreResult{};

    const std::size_t candidateCount = candidate.size();
    const std::size_t referenceCount = reference.size();
    const bool cutCandidate = capTokens(candidate);
    const bool cutReference = capTokens(reference);
    if (cutCandidate || cutReference) {
        std::cerr << "RougeL: truncated to " << options_.maxTokens << " tokens per side (candidate "
                  << candidateCount << ", reference " << referenceCount << ")\n";
    }

    const std::size_t lcs = algo::lcsLength(candidate, reference);

    ScoreResult r;
    r.precision = static_cast<double>(lcs) / static_cast<double>(candidate.size());
    r.recall = static_cast<double>(lcs) / static_cast<double>(reference.size());
    r.fMeasure = fMeasure(r.precision, r.recall);
    return r;
}

bool RougeL::capTokens(std::vector<std::string>& tokens) const {
    if (options_.maxTokens == 0 || tokens.size() <= options_.maxTokens) return false;
    tokens.resize(options_.maxTokens);
    return true;
}

} // namespace rougel
