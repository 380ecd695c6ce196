/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include <cstdlib>
#include <fstream>
#include <iostream>
#include "analyze.h"

#include "config.h"
#include "connectionpool.h"
#include "curlsession.h"
#include "exceptions.h"
#include "logger.h"
#include "review.h"
#include "sqc.h"
#include "utils.h"

namespace cmd {

namespace {

void printText(const sqc::SiteReview &review, std::ostream &out) {
    const sqc::SiteAnalysis &a = review.analysis;

    out << "Site: " << a.site.siteId << std::endl;
    out << "Pilot: " << a.site.pilot << std::endl;
    out << "Path: " << a.site.path << std::endl << std::endl;

    out << "Folders:" << std::endl;
    for (const auto &f : a.folders) {
        const sqc::FolderReport &r = f.second;
        out << "  " << r.name << " [" << r.category << "] ";
        if (r.failed()) {
            out << "ERROR: " << r.error << std::endl;
            continue;
        }
        out << r.imageCount << " images, " << sqc::utils::bytesToHuman(r.totalSize) << ", "
            << r.results.size() << " GPS points";
        if (!r.batch.failedItems.empty()) out << " (" << r.batch.failedItems.size() << " unreadable)";
        if (r.batch.batchTimedOut) out << " (timed out)";
        out << std::endl;
    }

    out << std::endl
        << "Total: " << a.totalImages << " images, " << sqc::utils::bytesToHuman(a.totalSize) << ", "
        << a.gpsCount() << " GPS points, " << review.outlierCount() << " outliers" << std::endl;

    if (!a.failedFolders.empty())
        out << "Failed folders: " << sqc::utils::join(a.failedFolders, ',') << std::endl;
    if (a.cancelled) out << "Analysis was cancelled before completion" << std::endl;
}

}  // namespace

void Analyze::setOptions(cxxopts::Options &opts) {
    // clang-format off
    opts
    .positional_help("[args]")
    .custom_help("analyze /homes/pilot/10001291-08-20-2025-client --host ftp.example.com --user pilot")
    .add_options()
    ("p,path", "Remote site path", cxxopts::value<std::string>())
    ("host", "Remote host", cxxopts::value<std::string>())
    ("port", "Remote port", cxxopts::value<int>()->default_value("22"))
    ("u,user", "Username", cxxopts::value<std::string>())
    ("protocol", "Protocol (sftp|ftp|ftps)", cxxopts::value<std::string>()->default_value("sftp"))
    ("password", "Password (or set " SQC_PASSWORD_ENV ")", cxxopts::value<std::string>())
    ("c,config", "Configuration file (JSON)", cxxopts::value<std::string>())
    ("o,output", "Output file to write results to", cxxopts::value<std::string>()->default_value("stdout"))
    ("scene", "Write the 3D scene (Plotly figure JSON) to this file", cxxopts::value<std::string>())
    ("t,timeout", "Whole analysis timeout in seconds", cxxopts::value<int>())
    ("item-timeout", "Per image timeout in seconds", cxxopts::value<int>())
    ("batch-timeout", "Per folder timeout in seconds", cxxopts::value<int>())
    ("multiplier", "IQR multiplier for outlier detection", cxxopts::value<double>());
    // clang-format on

    addFormatOption(opts);
    opts.parse_positional({"path"});
}

std::string Analyze::description() {
    return "Extract the geotags of a remote site and detect outliers";
}

std::string Analyze::extendedDescription() {
    return "\r\n\r\nEvery subfolder of the site is scanned for images. Only a prefix of each image is downloaded.";
}

void Analyze::run(cxxopts::ParseResult &opts) {
    if (!opts.count("path") || !opts.count("host")) {
        printHelp();
    }

    sqc::AnalysisConfig config;
    if (opts.count("config")) config = sqc::AnalysisConfig::load(opts["config"].as<std::string>());

    if (opts.count("timeout")) config.analysisTimeoutMs = opts["timeout"].as<int>() * 1000;
    if (opts.count("item-timeout")) config.scheduler.itemTimeoutMs = opts["item-timeout"].as<int>() * 1000;
    if (opts.count("batch-timeout")) config.scheduler.batchTimeoutMs = opts["batch-timeout"].as<int>() * 1000;
    if (opts.count("multiplier")) config.classifier.iqrMultiplier = opts["multiplier"].as<double>();
    config.validate();

    const OutputFormat format = outputFormat(opts);

    sqc::ConnectionParams params;
    params.protocol = sqc::protocolFromString(opts["protocol"].as<std::string>());
    params.host = opts["host"].as<std::string>();
    params.port = opts["port"].as<int>();
    params.user = opts.count("user") ? opts["user"].as<std::string>() : sqc::utils::getPrompt("Username: ");

    if (opts.count("password")) {
        params.secret = opts["password"].as<std::string>();
    } else if (const char *envPassword = std::getenv(SQC_PASSWORD_ENV)) {
        params.secret = envPassword;
    } else {
        params.secret = sqc::utils::getPass("Password: ");
    }
    params.validate();

    const auto factory = sqc::CurlSession::factory(params);

    LOGI << "Connecting to " << params.identity();
    sqc::ReviewRequest request;
    request.sitePath = opts["path"].as<std::string>();
    request.config = config;
    request.primary = std::shared_ptr<sqc::Session>(factory(config.pool.connectTimeoutMs));
    request.factory = factory;
    request.cache = std::make_shared<sqc::ConnectionPoolCache>();
    request.cacheKey = params.identity();

    const sqc::SiteReview review = sqc::runSiteReview(request);

    if (opts.count("scene")) {
        const std::string filename = opts["scene"].as<std::string>();
        std::ofstream file(filename, std::ios::out | std::ios::trunc);
        if (!file.is_open()) throw sqc::FSException("Cannot open " + filename);
        file << review.scene.toJson().dump();
        LOGI << "Wrote scene to " << filename;
    }

    const std::string output = opts["output"].as<std::string>();
    std::ofstream file;
    if (output != "stdout") {
        file.open(output, std::ios::out | std::ios::trunc);
        if (!file.is_open()) throw sqc::FSException("Cannot open " + output);
    }
    std::ostream &out = output != "stdout" ? file : std::cout;

    if (format == OutputFormat::Json)
        out << review.toJSON().dump(4) << std::endl;
    else
        printText(review, out);
}

}
