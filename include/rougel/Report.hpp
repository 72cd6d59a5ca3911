#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "RougeL.hpp"
#include "rougel/Bench.hpp"
#include "rougel/Corpus.hpp"

namespace rougel::report {

// "F-Measure: 0.7778, Precision: 0.7778, Recall: 0.7778"
std::string formatResult(const ScoreResult& r);

// Longer than limit bytes -> at most (limit - 3) bytes, ending on a UTF-8
// character boundary, + "...".
std::string truncateForDisplay(const std::string& text, std::size_t limit = 80);

// timingsMicros may be empty; otherwise one entry per example.
void renderCorpusReport(std::ostream& out,
                        const std::vector<corpus::Example>& examples,
                        const std::vector<ScoreResult>& results,
                        const std::vector<double>& timingsMicros);

void renderStats(std::ostream& out, const std::string& title,
                 const bench::SampleStats& stats, const std::string& unit);

void renderCorpusSummary(std::ostream& out, const bench::CorpusSummary& summary);

nlohmann::json toJson(const std::vector<corpus::Example>& examples,
                      const std::vector<ScoreResult>& results,
                      const std::vector<double>& timingsMicros);

} // namespace rougel::report
