/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "command.h"

#include <cstdlib>

#include "constants.h"
#include "logger.h"
#include "exceptions.h"
#include "review.h"

namespace cmd {

void exitWhenIdle(int exitCode) {
    if (!sqc::waitForBackgroundWork(SHUTDOWN_GRACE_MS)) {
        LOGW << "Background work still running, exiting";
        std::cout.flush();
        std::cerr.flush();
        std::_Exit(exitCode);
    }
    exit(exitCode);
}

Command::Command() {
}

cxxopts::Options Command::genOptions(const char *programName){
    cxxopts::Options opts(programName, description() + extendedDescription());
    opts
    .show_positional_help();

    setOptions(opts);
    opts.add_options()
    ("h,help", "Print help")
    ("debug", "Show debug output");

    return opts;
}

void Command::addFormatOption(cxxopts::Options &opts){
    opts.add_options()
    ("f,format", "Output format (text|json)", cxxopts::value<std::string>()->default_value("text"));
}

OutputFormat Command::outputFormat(cxxopts::ParseResult &opts){
    const auto format = opts["format"].as<std::string>();
    if (format == "text") return OutputFormat::Text;
    if (format == "json") return OutputFormat::Json;

    throw sqc::InvalidArgsException("Invalid format " + format + " (must be text or json)");
}

void Command::run(int argc, char *argv[]) {
    cxxopts::Options opts = genOptions(argv[0]);

    try{
        auto result = opts.parse(argc, argv);

        if (result.count("help")) {
            printHelp();
        }

        if (result.count("debug")) {
            set_logger_verbose();
        }

        run(result);
    }catch(const cxxopts::OptionException &e){
        std::cerr << e.what() << std::endl << std::endl;
        printHelp(std::cerr, EXIT_FAILURE);
    }catch(const sqc::AnalysisTimeoutException &e){
        LOGD << "Analysis timed out";
        std::cerr << e.what() << std::endl;
        exitWhenIdle(EXIT_TIMEOUT);
    }catch(const sqc::AppException &e){
        std::cerr << e.what() << std::endl;
        exitWhenIdle(EXIT_FAILURE);
    }
}

void Command::printHelp(std::ostream &out, int exitCode) {
    out << genOptions().help({""});
    exit(exitCode);
}

}
