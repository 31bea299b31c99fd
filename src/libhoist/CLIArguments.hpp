/*
 * Hoist
 *
 * Copyright (c) 2026, The Hoist contributors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libhoist_CLIArguments_hpp
#define libhoist_CLIArguments_hpp

#include <string>
#include <vector>
#include <initializer_list>
#include <ostream>


namespace libhoist {

/**
 * Command line of a program: the arguments of hoist itself or of a
 * subprocess (e.g. Skopeo) about to be executed.
 */
class CLIArguments {
public:
    using const_iterator = std::vector<std::string>::const_iterator;

public:
    CLIArguments() = default;
    CLIArguments(int argc, char* argv[]);
    CLIArguments(std::initializer_list<std::string> args);
    template<class InputIter>
    CLIArguments(InputIter begin, InputIter end)
        : args(begin, end)
    {}

    void push_back(const std::string& arg);

    int argc() const;
    // Null-terminated, as expected by execvp and boost::program_options.
    // Valid until the arguments are modified.
    char** argv() const;

    const_iterator begin() const { return args.cbegin(); }
    const_iterator end() const { return args.cend(); }
    const std::string& operator[](size_t i) const { return args[i]; }

    CLIArguments& operator+=(const CLIArguments& rhs);

    bool empty() const { return args.empty(); }
    void clear();
    std::string string() const;

private:
    std::vector<std::string> args;
    mutable std::vector<char*> pointers;
};

bool operator==(const CLIArguments&, const CLIArguments&);
bool operator!=(const CLIArguments&, const CLIArguments&);
CLIArguments operator+(const CLIArguments&, const CLIArguments&);
std::ostream& operator<<(std::ostream&, const CLIArguments&);

}

#endif
