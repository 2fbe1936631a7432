// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test_framework.h"

#include <iostream>

int main() {
    std::cout << "N3TX Unit Test Suite" << std::endl;
    std::cout << "========================================" << std::endl;
    return test::run_all_tests();
}
