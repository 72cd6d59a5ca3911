#include "rougel/Bench.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <map>
#include <numeric>

namespace rougel::bench {

SampleStats summarize(std::vector<double> samples) {
    SampleStats s;
    if (samples.empty()) return s;

    std::sort(samples.begin(), samples.end());
    const size_t n = samples.size();
    s.runs = n;
    s.min = samples.front();
    s.max = samples.back();
    s.mean = std::accumulate(samples.begin(), samples.end(), 0.0) / static_cast<double>(n);
    s.median = (n % 2 == 1) ? samples[n / 2] : (samples[n / 2 - 1] + samples[n / 2]) / 2.0;
    if (n > 1) {
        double sq = 0.0;
        for (double v : samples) sq += (v - s.mean) * (v - s.mean);
        s.stddev = std::sqrt(sq / static_cast<double>(n - 1));
    }
    return s;
}

CorpusSummary summarizeCorpus(const std::vector<corpus::Example>& examples,
                              const std::vector<ScoreResult>& results) {
    CorpusSummary out;
    std::map<int, LevelSummary> byLevel;
    std::vector<double> fScores;
    const size_t n = std::min(examples.size(), results.size());
    fScores.reserve(n);

    for (size_t i = 0; i < n; ++i) {
        auto& lvl = byLevel[examples[i].level];
        if (lvl.count == 0) {
            lvl.level = examples[i].level;
            lvl.levelName = examples[i].levelName;
        }
        ++lvl.count;
        lvl.meanFMeasure += results[i].fMeasure;
        fScores.push_back(results[i].fMeasure);
    }
    for (auto& kv : byLevel) {
        kv.second.meanFMeasure /= static_cast<double>(kv.second.count);
        out.levels.push_back(kv.second);
    }
    out.fMeasure = summarize(std::move(fScores));
    return out;
}

CorpusRun timeCorpus(const RougeL& scorer,
                     const std::vector<corpus::Example>& examples,
                     std::size_t iterations) {
    using clock = std::chrono::steady_clock;
    CorpusRun run;
    iterations = std::max<size_t>(1, iterations);
    std::vector<ScoreResult> first;

    for (size_t it = 0; it < iterations; ++it) {
        std::vector<ScoreResult> pass;
        std::vector<double> micros;
        pass.reserve(examples.size());
        micros.reserve(examples.size());

        const auto passStart = clock::now();
        for (const auto& ex : examples) {
            const auto t0 = clock::now();
            pass.push_back(scorer.score(ex.candidate, ex.reference));
            const auto t1 = clock::now();
            micros.push_back(std::chrono::duration<double, std::micro>(t1 - t0).count());
        }
        const auto passEnd = clock::now();
        run.iterationMillis.push_back(std::chrono::duration<double, std::milli>(passEnd - passStart).count());

        if (it == 0) {
            first = pass;
        } else if (pass != first) {
            std::cerr << "Bench: results of pass " << (it + 1) << " differ from pass 1\n";
            run.deterministic = false;
        }
        run.results = std::move(pass);
        run.exampleMicros = std::move(micros);
    }
    return run;
}

} // namespace rougel::bench
