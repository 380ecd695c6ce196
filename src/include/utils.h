/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#ifndef UTILS_H
#define UTILS_H

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "sqc_export.h"
#include "exceptions.h"

#ifndef WIN32
#include <termios.h>
#include <unistd.h>
#endif

namespace sqc {
namespace utils {

static inline void toLower(std::string& s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
}

static inline void toUpper(std::string& s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
}

static inline void ltrim(std::string& s) {
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

static inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(),
            s.end());
}

static inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

static inline std::vector<std::string> split(const std::string& s, const std::string& delimiter) {
    size_t posStart = 0, posEnd, delimLen = delimiter.length();
    std::string token;
    std::vector<std::string> res;

    while ((posEnd = s.find(delimiter, posStart)) != std::string::npos) {
        token = s.substr(posStart, posEnd - posStart);
        posStart = posEnd + delimLen;
        res.push_back(token);
    }

    res.push_back(s.substr(posStart));
    return res;
}

// https://stackoverflow.com/questions/16605967/set-precision-of-stdto-string-when-converting-floating-point-values
template <typename T>
std::string toStr(const T value, const int n = 6) {
    std::ostringstream out;
    out.precision(n);
    out << std::fixed << value;
    return out.str();
}

SQC_DLL std::string getPrompt(const std::string& prompt = "");

// Cross-platform getpass
SQC_DLL std::string getPass(const std::string& prompt = "Password: ");

SQC_DLL std::string join(const std::vector<std::string>& vec, char separator = ',');

// 1536 --> "1.50 KB"
SQC_DLL std::string bytesToHuman(std::uintmax_t bytes);

// Joins two remote (POSIX) paths, collapsing duplicate separators
SQC_DLL std::string joinRemotePath(const std::string& parent, const std::string& child);

// Case insensitive match of the extension of filename against a list of
// extensions (with leading dot)
SQC_DLL bool hasExtension(const std::string& filename, const std::vector<std::string>& extensions);

SQC_DLL int64_t elapsedMs(const std::chrono::steady_clock::time_point& since);

}  // namespace utils
}  // namespace sqc

#endif  // UTILS_H
