#include <iostream>
#include <vector>
#include <string>
#include <core/constants.hpp>
#include "cli/nimbus_cli.hpp"
#include "cli/theme.hpp"

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    if (args.size() == 1) {
        if (args[0] == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "nimbus"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << NIMBUS_VERSION << theme::color::RESET << "\n";
            return 0;
        }
        if (args[0] == "--help" || args[0] == "-h") {
            print_usage();
            return 0;
        }
    }
    if (args.empty()) {
        print_usage();
        return 2;
    }

    NimbusCLI cli;
    return cli.run_transfer(args);
}
