/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "string.hpp"

#include <random>
#include <algorithm>
#include <iterator>

#include <boost/algorithm/string/classification.hpp>

namespace libhoist {
namespace string {

std::string generateRandom(size_t size) {
    static const auto alphabet = std::string{"abcdefghijklmnopqrstuvwxyz"};
    thread_local auto generator = std::mt19937{std::random_device{}()};
    auto dist = std::uniform_int_distribution<size_t>(0, alphabet.size() - 1);

    auto result = std::string{};
    result.reserve(size);
    std::generate_n(std::back_inserter(result), size, [&]() { return alphabet[dist(generator)]; });
    return result;
}

bool isHexadecimal(const std::string& s) {
    return !s.empty() && std::all_of(s.cbegin(), s.cend(), boost::algorithm::is_any_of("0123456789abcdef"));
}

}}
