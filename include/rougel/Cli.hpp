#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "RougeL.hpp"

namespace rougel::cli {

// Dispatches argv[1..] to demo, score, serve or help. Returns the process
// exit code: 0 success, 1 nondeterministic corpus run, 2 usage error.
// Exceptions from corpus loading or the server propagate.
int run(const std::vector<std::string>& args, const Options& opts,
        std::ostream& out, std::ostream& err);

} // namespace rougel::cli
