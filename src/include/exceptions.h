/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef EXCEPTIONS_H
#define EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace sqc
{

    class AppException : public std::runtime_error
    {
        using std::runtime_error::runtime_error;
    };
    class InvalidArgsException : public AppException
    {
        using AppException::AppException;
    };
    class ConfigException : public AppException
    {
        using AppException::AppException;
    };
    class FSException : public AppException
    {
        using AppException::AppException;
    };

    // Remote I/O. Every Session call throws one of these.
    class NetException : public AppException
    {
        using AppException::AppException;
    };
    // The connection itself is broken (reset, refused, auth lost).
    // Fatal to one lease only.
    class ConnectionException : public NetException
    {
        using NetException::NetException;
    };
    class RemoteTimeoutException : public NetException
    {
        using NetException::NetException;
    };
    // Missing file, permission denied. The connection is still usable.
    class RemoteFileException : public NetException
    {
        using NetException::NetException;
    };

    class PoolExhaustedException : public AppException
    {
        using AppException::AppException;
    };
    class FolderProbeException : public AppException
    {
    public:
        FolderProbeException(const std::string &folder, const std::string &message) :
            AppException(message), folder(folder) {}

        const std::string &getFolder() const {
            return folder;
        }

    private:
        std::string folder;
    };
    class AnalysisTimeoutException : public AppException
    {
        using AppException::AppException;
    };

}
#endif // EXCEPTIONS_H
