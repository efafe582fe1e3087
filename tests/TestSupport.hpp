#pragma once

#include <cstdlib>
#include <iostream>

// Always-on check: a failure prints the location and ends the test binary.
#define REQUIRE(cond, msg)                                                      \
    do {                                                                        \
        if (!(cond)) {                                                          \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ << " " << msg \
                      << "\n";                                                  \
            std::exit(1);                                                       \
        }                                                                       \
    } while (0)

// Runs one named case and reports it.
#define RUN_TEST(fn)                              \
    do {                                          \
        std::cout << "[ RUN  ] " #fn << std::endl; \
        fn();                                     \
        std::cout << "[  OK  ] " #fn << std::endl; \
    } while (0)
