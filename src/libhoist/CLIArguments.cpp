/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "CLIArguments.hpp"

#include <algorithm>


namespace libhoist {

CLIArguments::CLIArguments(int argc, char* argv[])
    : args(argv, argv + argc)
{}

CLIArguments::CLIArguments(std::initializer_list<std::string> args)
    : args(args)
{}

void CLIArguments::push_back(const std::string& arg) {
    args.push_back(arg);
}

int CLIArguments::argc() const {
    return static_cast<int>(args.size());
}

char** CLIArguments::argv() const {
    pointers.clear();
    for(const auto& arg : args) {
        pointers.push_back(const_cast<char*>(arg.c_str()));
    }
    pointers.push_back(nullptr);
    return pointers.data();
}

CLIArguments& CLIArguments::operator+=(const CLIArguments& rhs) {
    args.insert(args.end(), rhs.args.cbegin(), rhs.args.cend());
    return *this;
}

void CLIArguments::clear() {
    args.clear();
    pointers.clear();
}

/**
 * Renders the arguments the way they would be typed in a shell,
 * single-quoting the ones that contain blanks or quotes.
 */
std::string CLIArguments::string() const {
    auto output = std::string{};
    for(const auto& arg : args) {
        if(!output.empty()) {
            output += " ";
        }
        bool needsQuotes = arg.empty() || arg.find_first_of(" \t\n'\"") != std::string::npos;
        if(!needsQuotes) {
            output += arg;
            continue;
        }
        output += "'";
        for(auto c : arg) {
            if(c == '\'') {
                output += "'\\''";
            }
            else {
                output += c;
            }
        }
        output += "'";
    }
    return output;
}

bool operator==(const CLIArguments& lhs, const CLIArguments& rhs) {
    return lhs.argc() == rhs.argc()
        && std::equal(lhs.begin(), lhs.end(), rhs.begin());
}

bool operator!=(const CLIArguments& lhs, const CLIArguments& rhs) {
    return !(lhs == rhs);
}

CLIArguments operator+(const CLIArguments& lhs, const CLIArguments& rhs) {
    auto result = lhs;
    result += rhs;
    return result;
}

std::ostream& operator<<(std::ostream& os, const CLIArguments& args) {
    os << "[" << args.string() << "]";
    return os;
}

}
