/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "utils.h"

#include <cstring>
#include <iomanip>

namespace sqc::utils {

std::string getPass(const std::string& prompt) {
#ifdef _WIN32
    std::cout << prompt;
    std::cout.flush();
    std::string password;
    std::getline(std::cin, password);
    return password;
#else
    struct termios oflags, nflags;
    char password[1024];

    /* disabling echo */
    bool tty = tcgetattr(fileno(stdin), &oflags) == 0;
    if (tty) {
        nflags = oflags;
        nflags.c_lflag &= ~ECHO;
        nflags.c_lflag |= ECHONL;

        if (tcsetattr(fileno(stdin), TCSANOW, &nflags) != 0) {
            throw AppException("Cannot disable terminal echo");
        }
    }

    std::cout << prompt;
    std::cout.flush();
    std::string result;
    if (fgets(password, sizeof(password), stdin) != nullptr) {
        size_t len = strlen(password);
        if (len > 0 && password[len - 1] == '\n') password[len - 1] = 0;
        result = password;
    }

    /* restore terminal */
    if (tty && tcsetattr(fileno(stdin), TCSANOW, &oflags) != 0) {
        throw AppException("Cannot restore terminal settings");
    }

    return result;
#endif
}

std::string getPrompt(const std::string& prompt) {
    char input[1024];

    std::cout << prompt;
    std::cout.flush();

    if (fgets(input, sizeof(input), stdin) == nullptr)
        return "";
    size_t len = strlen(input);
    if (len > 0 && input[len - 1] == '\n') input[len - 1] = 0;

    return std::string(input);
}

std::string join(const std::vector<std::string>& vec, char separator) {
    std::stringstream ss;
    for (size_t i = 0; i < vec.size(); i++) {
        if (i > 0) ss << separator;
        ss << vec[i];
    }
    return ss.str();
}

std::string bytesToHuman(std::uintmax_t bytes) {
    std::ostringstream os;

    const char* suffixes[] = {"B", "KB", "MB", "GB", "TB", "PB", "EB"};
    size_t s = 0;

    double count = static_cast<double>(bytes);

    while (count >= 1024 && s < 6) {
        s++;
        count /= 1024;
    }
    if (count - floor(count) == 0.0) {
        os << static_cast<uintmax_t>(count) << " " << suffixes[s];
    } else {
        os << std::fixed << std::setprecision(2) << count << " " << suffixes[s];
    }

    return os.str();
}

std::string joinRemotePath(const std::string& parent, const std::string& child) {
    std::string res = parent + "/" + child;

    size_t pos;
    while ((pos = res.find("//")) != std::string::npos) {
        res.erase(pos, 1);
    }

    return res;
}

bool hasExtension(const std::string& filename, const std::vector<std::string>& extensions) {
    const size_t dot = filename.rfind('.');
    if (dot == std::string::npos || dot == 0) return false;

    std::string ext = filename.substr(dot);
    toLower(ext);

    for (auto e : extensions) {
        toLower(e);
        if (e == ext) return true;
    }

    return false;
}

int64_t elapsedMs(const std::chrono::steady_clock::time_point& since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - since)
        .count();
}

}  // namespace sqc::utils
