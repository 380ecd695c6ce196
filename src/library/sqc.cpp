/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "sqc.h"

#include <curl/curl.h>
#include <exiv2/exiv2.hpp>

#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

#include "constants.h"
#include "exceptions.h"
#include "logger.h"
#include "version.h"

namespace {

std::once_flag initializationFlag;

// Serializes the XMP toolkit, which extraction workers share
std::recursive_mutex xmpMutex;

void xmpLock(void *data, bool lockUnlock) {
    auto *m = static_cast<std::recursive_mutex *>(data);
    if (lockUnlock)
        m->lock();
    else
        m->unlock();
}

void setupLogging(bool verbose) {
    try {
        // SQC_LOG=1 logs to the default file, any other value is a file path
        const char *logEnv = std::getenv(SQC_LOG_ENV);
        const bool logToFile = logEnv != nullptr;
        std::string logFile;
        if (logToFile)
            logFile = std::string(logEnv).empty() || std::string(logEnv) == "1" ? LOG_FILE_NAME : logEnv;

        // Enable verbose logging if the environment variable is set
        bool enableVerbose = verbose || std::getenv(SQC_DEBUG_ENV) != nullptr;

        init_logger(logFile);
        if (enableVerbose || logToFile) {
            set_logger_verbose();
        }

    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    }
}

void setupExiv2() {
    if (!Exiv2::XmpParser::initialize(xmpLock, &xmpMutex))
        LOGW << "Cannot initialize the XMP toolkit";

    // DJI tags are not known to Exiv2 out of the box
    try {
        Exiv2::XmpProperties::registerNs(DJI_XMP_NAMESPACE, DJI_XMP_PREFIX);
    } catch (Exiv2::Error& e) {
        LOGD << "Cannot register " << DJI_XMP_PREFIX << " namespace: " << e.what();
    }

    Exiv2::LogMsg::setLevel(is_logger_verbose() ? Exiv2::LogMsg::warn : Exiv2::LogMsg::mute);
}

void setupCurl() {
    const CURLcode res = curl_global_init(CURL_GLOBAL_ALL);
    if (res != CURLE_OK)
        throw sqc::NetException(std::string("Cannot initialize CURL: ") + curl_easy_strerror(res));

    LOGD << "Using " << curl_version();
}

}  // namespace

void SQCRegisterProcess(bool verbose) {
    std::call_once(initializationFlag, [verbose]() {
        setupLogging(verbose);
        LOGD << "Initializing SiteQC " << APP_VERSION;

        setupCurl();
        setupExiv2();
        LOGD << "Using Exiv2 " << Exiv2::versionString();
    });
}

const char* SQCGetVersion() {
    return APP_VERSION;
}
