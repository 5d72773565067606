// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test_framework.h"

#include <iostream>

int main(int argc, char* argv[]) {
    std::cout << "txcombine Unit Test Suite" << std::endl;
    std::cout << "========================================" << std::endl;
    // Optional suite prefix, e.g. "txcombine_tests Merge".
    return test::run_all_tests(argc > 1 ? argv[1] : "");
}
