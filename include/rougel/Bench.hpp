#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "RougeL.hpp"
#include "rougel/Corpus.hpp"

namespace rougel::bench {

struct SampleStats {
    std::size_t runs = 0;
    double mean = 0.0;
    double median = 0.0;
    double min = 0.0;
    double max = 0.0;
    double stddev = 0.0;  // sample (n - 1); 0 for fewer than two samples
};

SampleStats summarize(std::vector<double> samples);

struct LevelSummary {
    int level = 0;
    std::string levelName;
    std::size_t count = 0;
    double meanFMeasure = 0.0;
};

struct CorpusSummary {
    std::vector<LevelSummary> levels;  // ascending by level
    SampleStats fMeasure;
};

// results[i] must belong to examples[i].
CorpusSummary summarizeCorpus(const std::vector<corpus::Example>& examples,
                              const std::vector<ScoreResult>& results);

struct CorpusRun {
    std::vector<ScoreResult> results;    // last pass
    std::vector<double> exampleMicros;   // per example, last pass
    std::vector<double> iterationMillis; // one entry per pass
    bool deterministic = true;           // every pass matched the first
};

CorpusRun timeCorpus(const RougeL& scorer,
                     const std::vector<corpus::Example>& examples,
                     std::size_t iterations);

} // namespace rougel::bench
