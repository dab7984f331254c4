#include <iostream>

#include "democonv/cli.hpp"

int main(int argc, char** argv) {
    return democonv::run_cli(argc, argv, std::cout, std::cerr);
}
