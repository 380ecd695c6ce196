/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef SQC_EXPORT_H
#define SQC_EXPORT_H

#ifdef _WIN32
    #define SQC_DLL   __declspec(dllexport)
#else
    #define SQC_DLL
#endif // _WIN32

#endif // SQC_EXPORT_H
