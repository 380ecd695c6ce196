/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#ifndef LOGGER_H
#define LOGGER_H

#include <string>
#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Formatters/CsvFormatter.h>
#include "sqc_export.h"

#define LOG_FILE_NAME "sqc-log.csv"
#define LOG_FILE_MAX_SIZE 1048576
#define LOG_FILE_MAX_FILES 5

// Console output, plus a rolling CSV file when logFile is not empty
SQC_DLL void init_logger(const std::string &logFile = "");
SQC_DLL void set_logger_verbose();
SQC_DLL bool is_logger_verbose();

#endif // LOGGER_H
