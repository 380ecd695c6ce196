/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef COMMAND_H
#define COMMAND_H

#include <cxxopts.hpp>
#include <iostream>
#include <string>

// Same as timeout(1)
#define EXIT_TIMEOUT 124

namespace cmd {

enum class OutputFormat { Text, Json };

// Exits once background analysis threads are done, or without running
// static destructors if they are still running after SHUTDOWN_GRACE_MS
[[ noreturn ]] void exitWhenIdle(int exitCode);

class Command{
private:
    cxxopts::Options genOptions(const char *programName = "sqc");
protected:
    virtual void run(cxxopts::ParseResult &opts) = 0;
    virtual void setOptions(cxxopts::Options &opts) = 0;

    // Adds -f,--format (text|json) to opts
    void addFormatOption(cxxopts::Options &opts);
    OutputFormat outputFormat(cxxopts::ParseResult &opts);
public:
    Command();
    virtual ~Command() = default;
    void run(int argc, char* argv[]);
    virtual std::string description(){ return ""; }
    virtual std::string extendedDescription(){ return ""; }
    void printHelp(std::ostream &out = std::cout, int exitCode = 0);
};

}

#endif // COMMAND_H
