/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "session.h"

#include "exceptions.h"
#include "utils.h"

namespace sqc
{

    json RemoteEntry::toJSON() const
    {
        json j;
        j["name"] = name;
        j["type"] = type == RemoteEntryType::Directory ? "directory" : (type == RemoteEntryType::File ? "file" : "other");
        j["size"] = size;
        if (modifiedTime > 0)
            j["modified"] = static_cast<int64_t>(modifiedTime);
        else
            j["modified"] = nullptr;
        return j;
    }

    Protocol protocolFromString(const std::string &protocol)
    {
        std::string p = protocol;
        utils::toLower(p);

        if (p == "sftp")
            return Protocol::SFTP;
        if (p == "ftp")
            return Protocol::FTP;
        if (p == "ftps")
            return Protocol::FTPS;

        throw InvalidArgsException("Invalid protocol: " + protocol + ". Must be sftp, ftp, or ftps");
    }

    std::string protocolToString(Protocol protocol)
    {
        switch (protocol)
        {
        case Protocol::SFTP:
            return "sftp";
        case Protocol::FTP:
            return "ftp";
        case Protocol::FTPS:
            return "ftps";
        }
        return "sftp";
    }

    std::string ConnectionParams::identity() const
    {
        return protocolToString(protocol) + "://" + user + "@" + host + ":" + std::to_string(port);
    }

    void ConnectionParams::validate() const
    {
        if (host.empty() || user.empty())
            throw InvalidArgsException("Host and username are required");
        if (port < 1 || port > 65535)
            throw InvalidArgsException("Port must be between 1 and 65535");
    }

}
