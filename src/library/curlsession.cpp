/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "curlsession.h"

#include <cctz/civil_time.h>
#include <cctz/time_zone.h>

#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstring>

#include "exceptions.h"
#include "logger.h"
#include "utils.h"

namespace sqc {

namespace {

struct PrefixBuffer {
    std::vector<uint8_t> *data;
    size_t maxBytes;
};

// Stops the transfer (by consuming less than offered) as soon as the
// buffer is full
size_t prefixWriteCallback(char *ptr, size_t size, size_t nmemb, void *userdata) {
    auto *buf = static_cast<PrefixBuffer *>(userdata);
    const size_t n = size * nmemb;
    const size_t room = buf->maxBytes - buf->data->size();
    const size_t take = n < room ? n : room;
    buf->data->insert(buf->data->end(), ptr, ptr + take);
    return take;
}

size_t stringWriteCallback(char *ptr, size_t size, size_t nmemb, void *userdata) {
    auto *s = static_cast<std::string *>(userdata);
    s->append(ptr, size * nmemb);
    return size * nmemb;
}

size_t abortWriteCallback(char *, size_t, size_t, void *) {
    return 0;
}

int monthFromName(const std::string &name) {
    static const char *months[] = {"jan", "feb", "mar", "apr", "may", "jun",
                                   "jul", "aug", "sep", "oct", "nov", "dec"};
    std::string n = name;
    utils::toLower(n);
    for (int i = 0; i < 12; i++) {
        if (n == months[i]) return i + 1;
    }
    return 0;
}

std::string baseName(const std::string &path) {
    std::string p = path;
    while (p.length() > 1 && p.back() == '/') p.pop_back();
    const size_t slash = p.rfind('/');
    if (slash == std::string::npos) return p;
    return p.substr(slash + 1);
}

}  // namespace

CurlSession::CurlSession(const ConnectionParams &params, int connectTimeoutMs)
    : params(params), connectTimeoutMs(connectTimeoutMs), curl(nullptr), open(false) {
    errorMsg[0] = '\0';
    params.validate();

    curl = curl_easy_init();
    if (!curl) throw ConnectionException("Cannot initialize CURL");

    // libcurl connects lazily: touch the root so that a session that
    // cannot be established fails here, within connectTimeoutMs
    try {
        reset(url("/", true), connectTimeoutMs);
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
        open = true;
        perform("connect to " + params.identity());
    } catch (const NetException &e) {
        open = false;
        curl_easy_cleanup(curl);
        curl = nullptr;
        throw ConnectionException(std::string("Cannot open session: ") + e.what());
    }

    LOGD << "Opened session to " << params.identity();
}

CurlSession::~CurlSession() {
    if (curl) curl_easy_cleanup(curl);
    curl = nullptr;
}

std::string CurlSession::url(const std::string &path, bool directory) const {
    std::string p = path.empty() ? "/" : path;
    if (p[0] != '/') p = "/" + p;

    // Escape the path component by component, keeping separators
    std::string escaped;
    for (const auto &part : utils::split(p, "/")) {
        if (!escaped.empty() || part.length() > 0) escaped += "/";
        if (part.empty()) continue;
        char *e = curl_easy_escape(curl, part.c_str(), static_cast<int>(part.length()));
        if (!e) throw NetException("Cannot url encode " + part);
        escaped += e;
        curl_free(e);
    }
    if (escaped.empty()) escaped = "/";
    if (directory && escaped.back() != '/') escaped += "/";

    return protocolToString(params.protocol == Protocol::FTPS ? Protocol::FTP : params.protocol) +
           "://" + params.host + ":" + std::to_string(params.port) + escaped;
}

void CurlSession::reset(const std::string &url, int timeoutMs) {
    if (!curl) throw ConnectionException("Session is closed");

    curl_easy_reset(curl);
    errorMsg[0] = '\0';

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errorMsg);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connectTimeoutMs));
    if (timeoutMs > 0) curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeoutMs));
    curl_easy_setopt(curl, CURLOPT_USERNAME, params.user.c_str());
    curl_easy_setopt(curl, CURLOPT_PASSWORD, params.secret.c_str());

    if (params.protocol == Protocol::SFTP) {
        curl_easy_setopt(curl, CURLOPT_SSH_AUTH_TYPES,
                         static_cast<long>(CURLSSH_AUTH_PASSWORD | CURLSSH_AUTH_KEYBOARD));
        curl_easy_setopt(curl, CURLOPT_SSH_COMPRESSION, 1L);
    } else if (params.protocol == Protocol::FTPS) {
        curl_easy_setopt(curl, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
    }

    if (is_logger_verbose()) {
        curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
    }
}

void CurlSession::perform(const std::string &what) {
    const CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) raise(res, what);
}

void CurlSession::raise(CURLcode code, const std::string &what) {
    std::string msg = what + ": " + curl_easy_strerror(code);
    if (errorMsg[0] != '\0') msg += " (" + std::string(errorMsg) + ")";

    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            throw RemoteTimeoutException(msg);
        case CURLE_REMOTE_FILE_NOT_FOUND:
        case CURLE_REMOTE_ACCESS_DENIED:
        case CURLE_FTP_COULDNT_RETR_FILE:
        case CURLE_QUOTE_ERROR:
            throw RemoteFileException(msg);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_SSH:
        case CURLE_LOGIN_DENIED:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_USE_SSL_FAILED:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_WEIRD_SERVER_REPLY:
        case CURLE_FTP_WEIRD_PASV_REPLY:
        case CURLE_FTP_CANT_GET_HOST:
            open = false;
            throw ConnectionException(msg);
        default:
            throw NetException(msg);
    }
}

RemoteEntry CurlSession::stat(const std::string &path, int timeoutMs) {
    RemoteEntry entry;
    entry.name = baseName(path);

    try {
        reset(url(path), timeoutMs);
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl, CURLOPT_FILETIME, 1L);
        perform("stat " + path);

        curl_off_t size = -1;
        curl_off_t filetime = -1;
        curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &size);
        curl_easy_getinfo(curl, CURLINFO_FILETIME_T, &filetime);

        entry.type = RemoteEntryType::File;
        entry.size = size > 0 ? static_cast<std::uintmax_t>(size) : 0;
        entry.modifiedTime = filetime > 0 ? static_cast<time_t>(filetime) : 0;
        return entry;
    } catch (const RemoteFileException &) {
        // Directories cannot be stat'ed as files over FTP nor fetched over SFTP
        if (!directoryExists(path, timeoutMs)) throw;
    }

    entry.type = RemoteEntryType::Directory;
    return entry;
}

bool CurlSession::directoryExists(const std::string &path, int timeoutMs) {
    reset(url(path, true), timeoutMs);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, abortWriteCallback);

    const CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK || res == CURLE_WRITE_ERROR) return true;
    if (res == CURLE_REMOTE_FILE_NOT_FOUND || res == CURLE_REMOTE_ACCESS_DENIED ||
        res == CURLE_FTP_COULDNT_RETR_FILE)
        return false;

    raise(res, "stat " + path);
}

std::vector<uint8_t> CurlSession::readPrefix(const std::string &path, size_t maxBytes,
                                             int timeoutMs) {
    std::vector<uint8_t> data;
    if (maxBytes == 0) return data;
    data.reserve(maxBytes);

    PrefixBuffer buf{&data, maxBytes};

    reset(url(path), timeoutMs);
    const std::string range = "0-" + std::to_string(maxBytes - 1);
    curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, prefixWriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, static_cast<void *>(&buf));

    const CURLcode res = curl_easy_perform(curl);

    // Servers that ignore the range keep sending: we stopped them ourselves
    if (res == CURLE_WRITE_ERROR && data.size() == maxBytes) return data;
    if (res != CURLE_OK) raise(res, "read " + path);

    return data;
}

std::vector<RemoteEntry> CurlSession::list(const std::string &path, int timeoutMs) {
    std::string listing;

    reset(url(path, true), timeoutMs);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, stringWriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, static_cast<void *>(&listing));
    perform("list " + path);

    std::vector<RemoteEntry> entries;
    const time_t now = time(nullptr);
    for (auto &line : utils::split(listing, "\n")) {
        utils::rtrim(line);
        RemoteEntry e;
        if (parseListingLine(line, e, now)) entries.push_back(e);
    }

    LOGD << "Listed " << entries.size() << " entries in " << path;
    return entries;
}

void CurlSession::close() {
    if (curl) curl_easy_cleanup(curl);
    curl = nullptr;
    open = false;
}

bool CurlSession::isOpen() const {
    return open && curl != nullptr;
}

SessionFactory CurlSession::factory(const ConnectionParams &params) {
    return [params](int timeoutMs) {
        return std::unique_ptr<Session>(new CurlSession(params, timeoutMs));
    };
}

// -rw-r--r--    1 user     group        2048 Mar 14 09:26 DJI_0001.JPG
// drwxr-xr-x    2 user     group        4096 Mar 14  2023 Orbit Photos
bool parseListingLine(const std::string &line, RemoteEntry &entry, time_t now) {
    if (line.empty()) return false;
    if (line.rfind("total", 0) == 0) return false;

    // First 8 whitespace separated fields, then the name (which can contain spaces)
    std::vector<std::string> fields;
    size_t pos = 0;
    while (fields.size() < 8) {
        while (pos < line.length() && std::isspace(static_cast<unsigned char>(line[pos]))) pos++;
        if (pos >= line.length()) return false;
        const size_t start = pos;
        while (pos < line.length() && !std::isspace(static_cast<unsigned char>(line[pos]))) pos++;
        fields.push_back(line.substr(start, pos - start));
    }
    while (pos < line.length() && line[pos] == ' ') pos++;
    if (pos >= line.length()) return false;

    std::string name = line.substr(pos);

    const char kind = fields[0][0];
    if (kind == 'd') {
        entry.type = RemoteEntryType::Directory;
    } else if (kind == '-') {
        entry.type = RemoteEntryType::File;
    } else if (kind == 'l') {
        entry.type = RemoteEntryType::Other;
        const size_t arrow = name.find(" -> ");
        if (arrow != std::string::npos) name = name.substr(0, arrow);
    } else {
        entry.type = RemoteEntryType::Other;
    }

    if (name == "." || name == "..") return false;
    entry.name = name;

    try {
        entry.size = static_cast<std::uintmax_t>(std::stoull(fields[4]));
    } catch (const std::exception &) {
        LOGD << "Cannot parse size in listing line: " << line;
        entry.size = 0;
    }

    entry.modifiedTime = 0;
    const int month = monthFromName(fields[5]);
    int day = 0;
    try {
        day = std::stoi(fields[6]);
    } catch (const std::exception &) {
        day = 0;
    }

    if (month > 0 && day > 0) {
        const cctz::time_zone utc = cctz::utc_time_zone();
        if (now == 0) now = time(nullptr);
        const auto nowPoint = std::chrono::system_clock::from_time_t(now);

        int hour = 0, minute = 0;
        int year = 0;
        if (sscanf(fields[7].c_str(), "%d:%d", &hour, &minute) == 2) {
            // Recent entries omit the year: it is the current one,
            // unless that places the entry in the future
            year = static_cast<int>(cctz::convert(nowPoint, utc).year());
            auto tp = cctz::convert(cctz::civil_second(year, month, day, hour, minute, 0), utc);
            if (tp > nowPoint + std::chrono::hours(24)) year--;
        } else {
            try {
                year = std::stoi(fields[7]);
            } catch (const std::exception &) {
                year = 0;
            }
        }

        if (year > 0) {
            auto tp = cctz::convert(cctz::civil_second(year, month, day, hour, minute, 0), utc);
            entry.modifiedTime = std::chrono::system_clock::to_time_t(tp);
        }
    }

    return true;
}

}  // namespace sqc
