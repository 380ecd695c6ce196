/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include <iostream>
#include "geotag.h"
#include "../include/geotag.h"

#include "config.h"
#include "exceptions.h"
#include "logger.h"
#include "utils.h"

namespace cmd {

void Geotag::setOptions(cxxopts::Options &opts) {
    // clang-format off
    opts
    .positional_help("[args]")
    .custom_help("geotag *.JPG")
    .add_options()
    ("i,input", "File(s) to examine", cxxopts::value<std::vector<std::string>>())
    ("prefix-bytes", "Number of bytes to read from each file", cxxopts::value<size_t>())
    ("c,config", "Configuration file (JSON)", cxxopts::value<std::string>());
    // clang-format on

    addFormatOption(opts);
    opts.parse_positional({"input"});
}

std::string Geotag::description() {
    return "Extract geotags from local images the same way remote ones are read";
}

void Geotag::run(cxxopts::ParseResult &opts) {
    if (!opts.count("input")) {
        printHelp();
    }

    const auto input = opts["input"].as<std::vector<std::string>>();
    const OutputFormat format = outputFormat(opts);

    sqc::AnalysisConfig config;
    if (opts.count("config")) config = sqc::AnalysisConfig::load(opts["config"].as<std::string>());
    if (opts.count("prefix-bytes")) config.extractor.prefixBytes = opts["prefix-bytes"].as<size_t>();
    config.validate();

    const sqc::GeotagExtractor extractor(config.extractor);

    sqc::json results = sqc::json::array();
    for (const auto &filename : input) {
        std::optional<sqc::GeoTag> tag;
        std::string error;
        try {
            tag = extractor.extractFile(filename);
        } catch (const sqc::FSException &e) {
            error = e.what();
            LOGD << error;
        }

        if (format == OutputFormat::Json) {
            sqc::json j;
            if (tag) {
                j = tag->toJSON();
            } else {
                j["path"] = filename;
                j["latitude"] = nullptr;
                j["longitude"] = nullptr;
            }
            if (!error.empty()) j["error"] = error;
            results.push_back(j);
        } else {
            std::cout << filename << ": ";
            if (!error.empty())
                std::cout << error;
            else if (!tag)
                std::cout << "no geotag";
            else {
                std::cout << sqc::utils::toStr(tag->latitude, 8) << ", " << sqc::utils::toStr(tag->longitude, 8)
                          << ", " << sqc::utils::toStr(tag->altitudeFt, 1) << " ft";
                if (!tag->altitudeSource.empty()) std::cout << " (" << tag->altitudeSource << ")";
            }
            std::cout << std::endl;
        }
    }

    if (format == OutputFormat::Json) std::cout << results.dump(4) << std::endl;
}

}
