#include <iostream>
#include "runtime.hpp"

int main(int argc, char* argv[]) {
    return notehook::run_cli(argc, argv, std::cin, std::cout);
}
