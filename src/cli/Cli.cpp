#include "rougel/Cli.hpp"

#include "RougeLHttpServer.hpp"
#include "rougel/Bench.hpp"
#include "rougel/Corpus.hpp"
#include "rougel/Report.hpp"

namespace rougel::cli {

namespace {

void usage(std::ostream& out) {
    out << "Usage:\n"
        << "  rougel [demo] [--corpus FILE] [--iterations N] [--json]\n"
        << "  rougel score CANDIDATE REFERENCE [--json]\n"
        << "  rougel serve [--host HOST] [--port PORT]\n";
}

int runDemo(const std::vector<std::string>& args, const Options& opts,
            std::ostream& out, std::ostream& err) {
    std::string corpusPath;
    size_t iterations = 1;
    bool asJson = false;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--corpus" && i + 1 < args.size()) {
            corpusPath = args[++i];
        } else if (args[i] == "--iterations" && i + 1 < args.size()) {
            if (!parseCount(args[++i], iterations) || iterations == 0) {
                err << "--iterations must be a positive integer\n";
                usage(err);
                return 2;
            }
        } else if (args[i] == "--json") {
            asJson = true;
        } else {
            usage(err);
            return 2;
        }
    }

    auto examples = corpusPath.empty() ? corpus::builtinExamples()
                                       : corpus::loadExamples(corpusPath);
    RougeL scorer(opts);
    auto result = bench::timeCorpus(scorer, examples, iterations);

    if (asJson) {
        out << report::toJson(examples, result.results, result.exampleMicros).dump(2) << std::endl;
        return result.deterministic ? 0 : 1;
    }

    report::renderCorpusReport(out, examples, result.results, result.exampleMicros);
    if (iterations > 1) {
        report::renderStats(out, "Corpus pass time", bench::summarize(result.iterationMillis), "ms");
        out << "\n";
    }
    report::renderCorpusSummary(out, bench::summarizeCorpus(examples, result.results));
    return result.deterministic ? 0 : 1;
}

int runScore(const std::vector<std::string>& args, const Options& opts,
             std::ostream& out, std::ostream& err) {
    std::vector<std::string> texts;
    bool asJson = false;
    for (const auto& a : args) {
        if (a == "--json") asJson = true;
        else texts.push_back(a);
    }
    if (texts.size() != 2) { usage(err); return 2; }

    RougeL scorer(opts);
    auto result = scorer.score(texts[0], texts[1]);
    if (asJson) out << nlohmann::json(result).dump() << std::endl;
    else out << report::formatResult(result) << std::endl;
    return 0;
}

int runServe(const std::vector<std::string>& args, Options opts,
             std::ostream& out, std::ostream& err) {
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--host" && i + 1 < args.size()) {
            opts.host = args[++i];
        } else if (args[i] == "--port" && i + 1 < args.size()) {
            size_t port = 0;
            if (!parseCount(args[++i], port) || port == 0 || port > 65535) {
                err << "--port must be in 1..65535\n";
                usage(err);
                return 2;
            }
            opts.port = static_cast<int>(port);
        } else {
            usage(err);
            return 2;
        }
    }
    RougeLHttpServer app(opts);
    out << "Starting server...\n";
    app.run();
    return 0;
}

} // namespace

int run(const std::vector<std::string>& argv, const Options& opts,
        std::ostream& out, std::ostream& err) {
    std::vector<std::string> args = argv;
    std::string command = "demo";
    if (!args.empty() && (args[0] == "--help" || args[0].rfind("--", 0) != 0)) {
        command = args[0];
        args.erase(args.begin());
    }

    if (command == "demo") return runDemo(args, opts, out, err);
    if (command == "score") return runScore(args, opts, out, err);
    if (command == "serve") return runServe(args, opts, out, err);
    if (command == "help" || command == "--help") { usage(out); return 0; }
    usage(err);
    return 2;
}

} // namespace rougel::cli
