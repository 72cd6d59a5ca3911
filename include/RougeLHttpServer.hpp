#pragma once

#include <string>
#include <chrono>
#include "httplib.h"
#include "RougeL.hpp"
#include <nlohmann/json.hpp>

class RougeLHttpServer {
public:
    explicit RougeLHttpServer(rougel::Options options);
    void run();
    void stop();

    // Exposed for tests: bind to an ephemeral port and serve on the caller's thread.
    httplib::Server& server() { return server_; }

private:
    void setupRoutes();

    rougel::Options options_;
    httplib::Server server_;
    rougel::RougeL scorer_;
    std::chrono::steady_clock::time_point startTime_;
};
