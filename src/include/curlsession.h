/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef CURLSESSION_H
#define CURLSESSION_H

#include <curl/curl.h>
#include "session.h"
#include "sqc_export.h"

namespace sqc
{

    /**
     * Session over libcurl (sftp://, ftp://, ftps://).
     * A single easy handle is kept for the lifetime of the session so that
     * libcurl reuses its live connection across calls.
     */
    class CurlSession : public Session
    {
        ConnectionParams params;
        int connectTimeoutMs;
        CURL *curl;
        char errorMsg[CURL_ERROR_SIZE];
        bool open;

        std::string url(const std::string &path, bool directory = false) const;
        void reset(const std::string &url, int timeoutMs);
        void perform(const std::string &what);
        [[noreturn]] void raise(CURLcode code, const std::string &what);
        bool directoryExists(const std::string &path, int timeoutMs);

    public:
        SQC_DLL CurlSession(const ConnectionParams &params, int connectTimeoutMs);
        SQC_DLL ~CurlSession() override;

        CurlSession(const CurlSession &) = delete;
        CurlSession &operator=(const CurlSession &) = delete;

        SQC_DLL RemoteEntry stat(const std::string &path, int timeoutMs) override;
        SQC_DLL std::vector<uint8_t> readPrefix(const std::string &path, size_t maxBytes, int timeoutMs) override;
        SQC_DLL std::vector<RemoteEntry> list(const std::string &path, int timeoutMs) override;
        SQC_DLL void close() override;
        SQC_DLL bool isOpen() const override;

        SQC_DLL static SessionFactory factory(const ConnectionParams &params);
    };

    // Parses one line of a "ls -l" style listing (as returned by SFTP and
    // by most FTP servers). Returns false for lines that are not entries
    // (totals, "." and "..").
    SQC_DLL bool parseListingLine(const std::string &line, RemoteEntry &entry, time_t now = 0);

}

#endif // CURLSESSION_H
