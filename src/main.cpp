#include "cli.h"
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv, argv + argc);
    return cli::run(args, std::cout, std::cerr);
}
