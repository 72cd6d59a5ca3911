#include "rougel/Cli.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);
        return rougel::cli::run(args, rougel::Options::fromEnvironment(), std::cout, std::cerr);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
