#include "rougel/Report.hpp"

#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace rougel::report {

std::string formatResult(const ScoreResult& r) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(4)
       << "F-Measure: " << r.fMeasure
       << ", Precision: " << r.precision
       << ", Recall: " << r.recall;
    return ss.str();
}

std::string truncateForDisplay(const std::string& text, std::size_t limit) {
    if (text.size() <= limit) return text;
    std::size_t keep = limit > 3 ? limit - 3 : 0;
    // Do not cut inside a UTF-8 sequence.
    while (keep > 0 && (static_cast<unsigned char>(text[keep]) & 0xC0) == 0x80) --keep;
    return text.substr(0, keep) + "...";
}

void renderCorpusReport(std::ostream& out,
                        const std::vector<corpus::Example>& examples,
                        const std::vector<ScoreResult>& results,
                        const std::vector<double>& timingsMicros) {
    out << "=== ROUGE-L C++ Implementation ===\n\n";
    out << "Testing " << examples.size() << " examples (Basic to Advanced)\n\n";

    bool haveLevel = false;
    int currentLevel = 0;
    for (size_t i = 0; i < examples.size() && i < results.size(); ++i) {
        const auto& ex = examples[i];
        if (!haveLevel || ex.level != currentLevel) {
            haveLevel = true;
            currentLevel = ex.level;
            out << "--- Level " << ex.level << ": " << ex.levelName << " ---\n";
        }
        out << "Example " << (i + 1) << ":\n";
        out << "  Candidate: " << truncateForDisplay(ex.candidate) << "\n";
        out << "  Reference: " << truncateForDisplay(ex.reference) << "\n";
        out << "  Result:    " << formatResult(results[i]) << "\n";
        if (i < timingsMicros.size()) {
            std::ostringstream t;
            t << std::fixed << std::setprecision(2) << timingsMicros[i];
            out << "  Time:      " << t.str() << " us\n";
        }
        out << "\n";
    }
}

void renderStats(std::ostream& out, const std::string& title,
                 const bench::SampleStats& stats, const std::string& unit) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(unit.empty() ? 4 : 2);
    const std::string suffix = unit.empty() ? "" : " " + unit;
    ss << title << ":\n";
    ss << "  Runs: " << stats.runs << "\n";
    ss << "  Average: " << stats.mean << suffix << "\n";
    ss << "  Median: " << stats.median << suffix << "\n";
    ss << "  Min: " << stats.min << suffix << "\n";
    ss << "  Max: " << stats.max << suffix << "\n";
    if (stats.runs > 1) {
        ss << "  Standard deviation: " << stats.stddev << suffix << "\n";
    }
    out << ss.str();
}

void renderCorpusSummary(std::ostream& out, const bench::CorpusSummary& summary) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(4);
    ss << "Summary by level:\n";
    for (const auto& lvl : summary.levels) {
        ss << "  Level " << lvl.level << ": " << lvl.levelName << "\n";
        ss << "    Examples: " << lvl.count << "\n";
        ss << "    Average F-Measure: " << lvl.meanFMeasure << "\n";
    }
    out << ss.str() << "\n";
    renderStats(out, "F-Measure statistics", summary.fMeasure, "");
}

json toJson(const std::vector<corpus::Example>& examples,
            const std::vector<ScoreResult>& results,
            const std::vector<double>& timingsMicros) {
    json arr = json::array();
    for (size_t i = 0; i < examples.size() && i < results.size(); ++i) {
        const auto& ex = examples[i];
        json item = {
            {"example", i + 1},
            {"level", ex.level},
            {"level_name", ex.levelName},
            {"candidate", ex.candidate},
            {"reference", ex.reference},
            {"result", results[i]}
        };
        if (i < timingsMicros.size()) item["time_us"] = timingsMicros[i];
        arr.push_back(std::move(item));
    }
    return arr;
}

} // namespace rougel::report
