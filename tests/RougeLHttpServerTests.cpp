#include "RougeLHttpServer.hpp"

#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

using json = nlohmann::json;

static void expect(bool cond, const std::string& msg) {
    if (!cond) {
        std::cerr << "Test failed: " << msg << std::endl;
        std::exit(1);
    }
}

int main() {
    rougel::Options opts;
    opts.host = "127.0.0.1";
    opts.maxBatch = 2;
    RougeLHttpServer app(opts);

    const int port = app.server().bind_to_any_port(opts.host.c_str());
    expect(port > 0, "bind to an ephemeral port");
    std::thread serverThread([&app]() { app.server().listen_after_bind(); });

    httplib::Client cli(opts.host, port);
    bool up = false;
    for (int i = 0; i < 100 && !up; ++i) {
        auto res = cli.Get("/v1/health");
        if (res && res->status == 200) up = true;
        else std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    expect(up, "health endpoint answers");

    // Single pair
    auto res = cli.Post("/v1/score",
                        R"({"candidate": "The quick brown fox jumps over the lazy dog", "reference": "A quick brown fox jumps over a lazy dog"})",
                        "application/json");
    expect(res && res->status == 200, "score returns 200");
    auto body = json::parse(res->body);
    expect(body["status"] == "ok", "ok envelope");
    expect(std::fabs(body["data"]["f_measure"].get<double>() - 0.7778) < 1e-4, "score f-measure");
    expect(res->get_header_value("Access-Control-Allow-Origin") == "*", "cors header");

    // Null side is the empty string
    res = cli.Post("/v1/score", R"({"candidate": null, "reference": "text"})", "application/json");
    expect(res && res->status == 200, "null candidate accepted");
    body = json::parse(res->body);
    expect(body["data"]["precision"].get<double>() == 0.0, "null candidate scores zero");

    // Bad inputs
    res = cli.Post("/v1/score", "{oops", "application/json");
    expect(res && res->status == 400, "invalid json is 400");
    res = cli.Post("/v1/score", R"({"candidate": 1, "reference": "x"})", "application/json");
    expect(res && res->status == 400, "non-string field is 400");
    res = cli.Post("/v1/score", "candidate=a", "text/plain");
    expect(res && res->status == 415, "wrong content type is 415");
    body = json::parse(res->body);
    expect(body["status"] == "error" && body["error"]["code"] == 415, "error envelope");

    // Batch
    res = cli.Post("/v1/score/batch",
                   R"({"pairs": [{"candidate": "a b c d", "reference": "d c b a"}, {"candidate": "x", "reference": "x"}]})",
                   "application/json");
    expect(res && res->status == 200, "batch returns 200");
    body = json::parse(res->body);
    expect(body["data"]["count"] == 2, "batch count");
    expect(std::fabs(body["data"]["results"][0]["recall"].get<double>() - 0.25) < 1e-9, "batch first result");
    expect(std::fabs(body["data"]["mean_f_measure"].get<double>() - 0.625) < 1e-9, "batch mean f-measure");

    res = cli.Post("/v1/score/batch",
                   R"({"pairs": [{"candidate": "a"}, {"candidate": "b"}, {"candidate": "c"}]})",
                   "application/json");
    expect(res && res->status == 413, "oversized batch is 413");
    res = cli.Post("/v1/score/batch", R"({"items": []})", "application/json");
    expect(res && res->status == 400, "missing pairs is 400");

    // Corpus
    res = cli.Get("/v1/corpus");
    expect(res && res->status == 200, "corpus returns 200");
    body = json::parse(res->body);
    expect(body["data"].is_array() && body["data"].size() == 16, "corpus has sixteen examples");

    app.stop();
    serverThread.join();

    std::cout << "All tests passed." << std::endl;
    return 0;
}
