#include <iostream>
#include <string>
#include <vector>
#include "cli/fanout_cli.hpp"
#include "cli/theme.hpp"

int main(int argc, char** argv) {
    try {
        FanoutCLI cli;
        std::vector<std::string> args(argv + 1, argv + argc);
        return cli.run(args);
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return EXIT_USAGE;
    }
}
