/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef SESSION_H
#define SESSION_H

#include <cstdint>
#include <ctime>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "json.h"
#include "sqc_export.h"

namespace sqc
{

    enum class RemoteEntryType
    {
        File,
        Directory,
        Other
    };

    struct RemoteEntry
    {
        std::string name;
        RemoteEntryType type = RemoteEntryType::Other;
        std::uintmax_t size = 0;
        time_t modifiedTime = 0; // 0 when unknown

        bool isDirectory() const { return type == RemoteEntryType::Directory; }
        bool isFile() const { return type == RemoteEntryType::File; }

        SQC_DLL json toJSON() const;
    };

    enum class Protocol
    {
        SFTP,
        FTP,
        FTPS
    };

    SQC_DLL Protocol protocolFromString(const std::string &protocol);
    SQC_DLL std::string protocolToString(Protocol protocol);

    struct ConnectionParams
    {
        Protocol protocol = Protocol::SFTP;
        std::string host;
        int port = 22;
        std::string user;
        std::string secret;

        // Identity of the owning session, used to key pooled connections
        SQC_DLL std::string identity() const;
        SQC_DLL void validate() const;
    };

    /**
     * A remote file-transfer session. Every call takes its own timeout.
     * A session is not thread safe: it is used by one thread at a time
     * (the holder of its lease).
     *
     * All I/O failures are reported as NetException subclasses:
     * ConnectionException when the session is no longer usable,
     * RemoteTimeoutException when the call exceeded its timeout and
     * RemoteFileException when the path cannot be accessed.
     */
    class Session
    {
    public:
        virtual ~Session() = default;

        virtual RemoteEntry stat(const std::string &path, int timeoutMs) = 0;

        // Reads at most maxBytes from the beginning of path
        virtual std::vector<uint8_t> readPrefix(const std::string &path, size_t maxBytes, int timeoutMs) = 0;

        virtual std::vector<RemoteEntry> list(const std::string &path, int timeoutMs) = 0;

        virtual void close() = 0;
        virtual bool isOpen() const = 0;
    };

    // Opens a new, independent session within timeoutMs or throws
    typedef std::function<std::unique_ptr<Session>(int timeoutMs)> SessionFactory;

}

#endif // SESSION_H
