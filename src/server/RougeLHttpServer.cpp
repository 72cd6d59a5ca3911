#include "RougeLHttpServer.hpp"

#include <iostream>
#include <stdexcept>
#include "rougel/Bench.hpp"
#include "rougel/Corpus.hpp"
#include "rougel/Report.hpp"

using json = nlohmann::json;

namespace {

// Missing and null fields are the empty string; anything else non-string is rejected.
std::string textField(const json& body, const char* key) {
    if (!body.contains(key) || body[key].is_null()) return {};
    if (!body[key].is_string()) {
        throw std::invalid_argument(std::string("'") + key + "' must be a string or null");
    }
    return body[key].get<std::string>();
}

} // namespace

RougeLHttpServer::RougeLHttpServer(rougel::Options options)
    : options_(std::move(options)), scorer_(options_), startTime_(std::chrono::steady_clock::now()) {
    setupRoutes();
}

void RougeLHttpServer::run() {
    std::cout << "RougeL HTTP server listening on "
              << options_.host << ":" << options_.port << std::endl;
    if (!server_.listen(options_.host.c_str(), options_.port)) {
        throw std::runtime_error("failed to listen on " + options_.host + ":" + std::to_string(options_.port));
    }
}

void RougeLHttpServer::stop() {
    server_.stop();
}

void RougeLHttpServer::setupRoutes() {

    // JSON helpers
    auto ok = [](const json& data) {
        return json{
            {"status", "ok"},
            {"data", data}
        };
    };

    auto err = [](int code, const std::string& message) {
        return json{
            {"status", "error"},
            {"error", {
                {"code", code},
                {"message", message}
            }}
        };
    };

    auto isJsonContent = [](const httplib::Request& req) {
        auto ct = req.get_header_value("Content-Type");
        return ct.find("application/json") != std::string::npos;
    };

    auto addCors = [](httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
    };

    auto fail = [err, addCors](httplib::Response& res, int code, const std::string& message) {
        res.status = code;
        res.set_content(err(code, message).dump(), "application/json");
        addCors(res);
    };

    server_.Options(R"(.*)", [addCors](const httplib::Request&, httplib::Response& res) {
        addCors(res);
        res.status = 200;
        res.set_content("", "text/plain");
    });

    // --- HEALTH ---
    server_.Get("/v1/health", [this, ok, addCors](const httplib::Request&, httplib::Response& res) {
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - startTime_).count();
        res.set_content(ok(json{{"uptime_seconds", uptime}}).dump(), "application/json");
        addCors(res);
    });

    // --- SCORE ONE PAIR ---
    server_.Post("/v1/score", [this, ok, fail, isJsonContent, addCors](const httplib::Request& req, httplib::Response& res) {
        if (!isJsonContent(req)) {
            fail(res, 415, "Content-Type must be application/json");
            return;
        }
        json body;
        try {
            body = json::parse(req.body);
        } catch (const json::parse_error& e) {
            fail(res, 400, std::string("Invalid JSON: ") + e.what());
            return;
        }
        if (!body.is_object()) {
            fail(res, 400, "Body must be a JSON object");
            return;
        }
        try {
            auto result = scorer_.score(textField(body, "candidate"), textField(body, "reference"));
            res.set_content(ok(json(result)).dump(), "application/json");
            addCors(res);
        } catch (const std::invalid_argument& e) {
            fail(res, 400, e.what());
        } catch (const std::exception& e) {
            std::cerr << "RougeLHttpServer: score failed: " << e.what() << "\n";
            fail(res, 500, std::string("score failed: ") + e.what());
        }
    });

    // --- SCORE MANY PAIRS ---
    server_.Post("/v1/score/batch", [this, ok, fail, isJsonContent, addCors](const httplib::Request& req, httplib::Response& res) {
        if (!isJsonContent(req)) {
            fail(res, 415, "Content-Type must be application/json");
            return;
        }
        json body;
        try {
            body = json::parse(req.body);
        } catch (const json::parse_error& e) {
            fail(res, 400, std::string("Invalid JSON: ") + e.what());
            return;
        }
        if (!body.is_object() || !body.contains("pairs") || !body["pairs"].is_array()) {
            fail(res, 400, "Missing 'pairs' array");
            return;
        }
        const auto& pairs = body["pairs"];
        if (pairs.size() > options_.maxBatch) {
            fail(res, 413, "Too many pairs: " + std::to_string(pairs.size()) +
                           " > " + std::to_string(options_.maxBatch));
            return;
        }
        try {
            std::vector<rougel::RougeL::Pair> input;
            input.reserve(pairs.size());
            for (const auto& p : pairs) {
                if (!p.is_object()) throw std::invalid_argument("each pair must be a JSON object");
                input.emplace_back(textField(p, "candidate"), textField(p, "reference"));
            }
            auto results = scorer_.scoreBatch(input);

            json out = json::array();
            double sumF = 0.0;
            for (const auto& r : results) {
                out.push_back(json(r));
                sumF += r.fMeasure;
            }
            json data = {
                {"results", out},
                {"count", results.size()},
                {"mean_f_measure", results.empty() ? 0.0 : sumF / static_cast<double>(results.size())}
            };
            res.set_content(ok(data).dump(), "application/json");
            addCors(res);
        } catch (const std::invalid_argument& e) {
            fail(res, 400, e.what());
        } catch (const std::exception& e) {
            std::cerr << "RougeLHttpServer: batch failed: " << e.what() << "\n";
            fail(res, 500, std::string("batch failed: ") + e.what());
        }
    });

    // --- BUILT-IN CORPUS ---
    server_.Get("/v1/corpus", [this, ok, addCors](const httplib::Request&, httplib::Response& res) {
        const auto& examples = rougel::corpus::builtinExamples();
        auto run = rougel::bench::timeCorpus(scorer_, examples, 1);
        res.set_content(ok(rougel::report::toJson(examples, run.results, run.exampleMicros)).dump(), "application/json");
        addCors(res);
    });
}
