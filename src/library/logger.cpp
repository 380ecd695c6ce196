/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "logger.h"

void init_logger(const std::string &logFile) {
    static plog::ConsoleAppender<plog::TxtFormatter> consoleAppender;
    plog::Logger<PLOG_DEFAULT_INSTANCE_ID> &logger = plog::init(plog::info, &consoleAppender);

    if (!logFile.empty()) {
        static plog::RollingFileAppender<plog::CsvFormatter> fileAppender(logFile.c_str(), LOG_FILE_MAX_SIZE, LOG_FILE_MAX_FILES);
        logger.addAppender(&fileAppender);
    }
}

void set_logger_verbose() {
    if (plog::get() != nullptr) plog::get()->setMaxSeverity(plog::verbose);
}

bool is_logger_verbose(){
    return plog::get() != nullptr && plog::get()->getMaxSeverity() == plog::verbose;
}
