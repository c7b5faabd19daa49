#include "palincheck/runner.h"

#include <iostream>

int main(int argc, char** argv) {
    return palincheck::run_main(argc, argv, std::cout, std::cerr);
}
