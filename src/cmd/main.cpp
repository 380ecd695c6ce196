/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include <cstring>
#include <iostream>

#include "cmd/cmdlist.h"
#include "cmd/command.h"
#include "logger.h"
#include "exceptions.h"
#include "sqc.h"
#include <curl/curl.h>
#include <exiv2/exiv2.hpp>

[[ noreturn ]] void printHelp(char *argv[], int exitCode = 0) {
    std::ostream &out = exitCode == 0 ? std::cout : std::cerr;

    out << "SiteQC v" << SQCGetVersion() << " - Geotag quality control for remote inspection sites" << std::endl <<
              "Usage:" << std::endl <<
              "	" << argv[0] << " <command> [args]" << std::endl << std::endl <<
              "Commands:" << std::endl;
    for (auto &cmd : cmd::commands){
        out << "	" << cmd.first << " - " << cmd.second->description();

        std::string names;
        for (auto &alias : cmd::aliases){
            if (alias.second == cmd.first) names += (names.empty() ? "" : ", ") + alias.first;
        }
        if (!names.empty()) out << " (" << names << ")";
        out << std::endl;
    }
    out << std::endl <<
              "	-h, --help		Print help" << std::endl <<
              "	--version		Print version" << std::endl << std::endl <<
              "For detailed command help use: " << argv[0] << " <command> --help " << std::endl;
    exit(exitCode);
}

bool hasParam(int argc, char *argv[], const char* param) {
    for (int i = 0; i < argc; i++) {
        if (strcmp(argv[i], param) == 0) return true;
    }
    return false;
}

int main(int argc, char* argv[]) {
    SQCRegisterProcess(hasParam(argc, argv, "--debug"));

    LOGV << "SiteQC v" << SQCGetVersion();
    LOGV << "CURL version: " << curl_version();
    LOGV << "Exiv2 version: " << Exiv2::versionString();

    if (argc <= 1) printHelp(argv);

    const std::string cmdKey = std::string(argv[1]);
    if (cmdKey == "--help" || cmdKey == "-h") printHelp(argv);

    if (cmdKey == "--version") {
        std::cout << SQCGetVersion() << std::endl;
        return 0;
    }

    cmd::Command *command = cmd::findCommand(cmdKey);
    if (command == nullptr) {
        std::cerr << "Unknown command: " << cmdKey << std::endl << std::endl;
        printHelp(argv, 1);
    }

    try {
        // Commands parse their own arguments
        argv[1] = argv[0];
        command->run(argc - 1, argv + 1);
    } catch (const sqc::AppException &exception) {
        std::cerr << exception.what() << std::endl;
        cmd::exitWhenIdle(EXIT_FAILURE);
    }

    // Abandoned extractions may still be running
    cmd::exitWhenIdle(EXIT_SUCCESS);
}
