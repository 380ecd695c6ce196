/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef SQC_H
#define SQC_H

#include "sqc_export.h"

#define SQC_LOG_ENV "SQC_LOG"
#define SQC_DEBUG_ENV "SQC_DEBUG"
#define SQC_PASSWORD_ENV "SQC_PASSWORD"

/** This must be called as the very first function
 * of every SiteQC process/program
 * @param verbose whether the program should output debug messages to stdout */
SQC_DLL void SQCRegisterProcess(bool verbose = false);

/** Get library version */
SQC_DLL const char* SQCGetVersion();

#endif // SQC_H
