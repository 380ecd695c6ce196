/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include <iostream>
#include "showconfig.h"

#include "config.h"
#include "exceptions.h"

namespace cmd {

void ShowConfig::setOptions(cxxopts::Options &opts) {
    // clang-format off
    opts
    .positional_help("[args]")
    .custom_help("config [-c settings.json]")
    .add_options()
    ("c,config", "Configuration file (JSON)", cxxopts::value<std::string>());
    // clang-format on
}

std::string ShowConfig::description() {
    return "Print the effective configuration";
}

void ShowConfig::run(cxxopts::ParseResult &opts) {
    sqc::AnalysisConfig config;
    if (opts.count("config")) config = sqc::AnalysisConfig::load(opts["config"].as<std::string>());

    std::cout << config.toJson().dump(4) << std::endl;
}

}
