#include "app/cli.h"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char **argv) {
    const std::vector<std::string> args(argv, argv + argc);
    return app::run_cli(args, std::cout);
}
