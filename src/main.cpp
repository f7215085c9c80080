#include <iostream>
#include <vector>
#include <string>
#include "cli/slate_cli.hpp"
#include "cli/theme.hpp"

int main(int argc, char** argv) {
    try {
        return run_slate(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
