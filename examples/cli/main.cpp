#include <iostream>
#include <string>
#include <vector>

#include "utcnow_cli.hpp"

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    return utcnow::cli::run(args, std::cout, std::cerr);
}
