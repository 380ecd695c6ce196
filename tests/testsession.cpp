/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "testsession.h"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "exceptions.h"

namespace
{
    std::string normalize(const std::string &path)
    {
        std::string p = path;
        while (p.length() > 1 && p.back() == '/')
            p.pop_back();
        return p.empty() ? "/" : p;
    }

    std::string parentOf(const std::string &path)
    {
        const auto pos = path.rfind('/');
        if (pos == std::string::npos || pos == 0)
            return "/";
        return path.substr(0, pos);
    }

    std::string nameOf(const std::string &path)
    {
        return path.substr(path.rfind('/') + 1);
    }
}

TestRemote::TestRemote() : opened(0), reads(0), bytesServed(0), largestRead(0)
{
    dirs.insert("/");
}

void TestRemote::addDirectory(const std::string &path)
{
    std::lock_guard<std::mutex> lock(mtx);
    std::string p = normalize(path);
    while (p != "/")
    {
        dirs.insert(p);
        p = parentOf(p);
    }
}

void TestRemote::addFile(const std::string &path, const std::vector<uint8_t> &data)
{
    addDirectory(parentOf(normalize(path)));
    std::lock_guard<std::mutex> lock(mtx);
    files[normalize(path)] = data;
}

void TestRemote::addFile(const std::string &path, size_t size)
{
    addFile(path, std::vector<uint8_t>(size, 0));
}

void TestRemote::setUnreachable(const std::string &path)
{
    std::lock_guard<std::mutex> lock(mtx);
    unreachable.insert(normalize(path));
}

void TestRemote::dropConnectionOn(const std::string &path, int times)
{
    std::lock_guard<std::mutex> lock(mtx);
    connectionDrops[normalize(path)] = times;
}

void TestRemote::failReadOn(const std::string &path)
{
    std::lock_guard<std::mutex> lock(mtx);
    readErrors.insert(normalize(path));
}

void TestRemote::setReadDelay(int ms, bool honorTimeout)
{
    std::lock_guard<std::mutex> lock(mtx);
    readDelay = Delay{ms, honorTimeout};
}

void TestRemote::setReadDelay(const std::string &path, int ms, bool honorTimeout)
{
    std::lock_guard<std::mutex> lock(mtx);
    delays[normalize(path)] = Delay{ms, honorTimeout};
}

void TestRemote::failNextOpens(int count)
{
    std::lock_guard<std::mutex> lock(mtx);
    failingOpens = count;
}

TestSession::TestSession(const std::shared_ptr<TestRemote> &remote, int failAfter) : remote(remote), open(true), opsLeft(failAfter)
{
    std::lock_guard<std::mutex> lock(remote->mtx);
    if (remote->failingOpens > 0)
    {
        remote->failingOpens--;
        throw sqc::ConnectionException("Connection refused");
    }
    remote->opened++;
}

void TestSession::use()
{
    if (!open)
        throw sqc::ConnectionException("Session is closed");
    if (opsLeft == 0)
    {
        open = false;
        throw sqc::ConnectionException("Connection reset by peer");
    }
    if (opsLeft > 0)
        opsLeft--;
}

void TestSession::sleepFor(const std::string &path, int timeoutMs)
{
    TestRemote::Delay d;
    {
        std::lock_guard<std::mutex> lock(remote->mtx);
        auto it = remote->delays.find(path);
        d = it != remote->delays.end() ? it->second : remote->readDelay;
    }
    if (d.ms <= 0)
        return;

    if (d.honorTimeout && d.ms > timeoutMs)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(timeoutMs));
        throw sqc::RemoteTimeoutException("Operation timed out after " + std::to_string(timeoutMs) + "ms");
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(d.ms));
}

sqc::RemoteEntry TestSession::stat(const std::string &path, int timeoutMs)
{
    use();
    const std::string p = normalize(path);

    std::lock_guard<std::mutex> lock(remote->mtx);
    if (remote->unreachable.count(p))
        throw sqc::RemoteFileException("Permission denied: " + p);

    sqc::RemoteEntry e;
    e.name = p == "/" ? p : nameOf(p);
    if (remote->dirs.count(p))
    {
        e.type = sqc::RemoteEntryType::Directory;
        return e;
    }

    auto it = remote->files.find(p);
    if (it == remote->files.end())
        throw sqc::RemoteFileException("No such file: " + p);
    e.type = sqc::RemoteEntryType::File;
    e.size = it->second.size();
    return e;
}

std::vector<uint8_t> TestSession::readPrefix(const std::string &path, size_t maxBytes, int timeoutMs)
{
    use();
    const std::string p = normalize(path);
    remote->reads++;

    {
        std::lock_guard<std::mutex> lock(remote->mtx);
        auto drop = remote->connectionDrops.find(p);
        if (drop != remote->connectionDrops.end() && drop->second > 0)
        {
            drop->second--;
            open = false;
            throw sqc::ConnectionException("Connection reset reading " + p);
        }
        if (remote->readErrors.count(p))
            throw std::runtime_error("Corrupted transfer buffer reading " + p);
    }

    sleepFor(p, timeoutMs);

    std::lock_guard<std::mutex> lock(remote->mtx);
    auto it = remote->files.find(p);
    if (it == remote->files.end())
        throw sqc::RemoteFileException("No such file: " + p);

    const size_t n = std::min(maxBytes, it->second.size());
    remote->bytesServed += n;
    if (n > remote->largestRead)
        remote->largestRead = n;
    return std::vector<uint8_t>(it->second.begin(), it->second.begin() + n);
}

std::vector<sqc::RemoteEntry> TestSession::list(const std::string &path, int timeoutMs)
{
    use();
    const std::string p = normalize(path);

    std::lock_guard<std::mutex> lock(remote->mtx);
    if (remote->unreachable.count(p))
        throw sqc::RemoteFileException("Permission denied: " + p);
    if (!remote->dirs.count(p))
        throw sqc::RemoteFileException("No such directory: " + p);

    std::vector<sqc::RemoteEntry> entries;
    for (const auto &d : remote->dirs)
    {
        if (d == "/" || parentOf(d) != p)
            continue;
        sqc::RemoteEntry e;
        e.name = nameOf(d);
        e.type = sqc::RemoteEntryType::Directory;
        entries.push_back(e);
    }
    for (const auto &f : remote->files)
    {
        if (parentOf(f.first) != p)
            continue;
        sqc::RemoteEntry e;
        e.name = nameOf(f.first);
        e.type = sqc::RemoteEntryType::File;
        e.size = f.second.size();
        entries.push_back(e);
    }
    return entries;
}

void TestSession::close()
{
    open = false;
}

bool TestSession::isOpen() const
{
    return open;
}

void TestSession::breakConnection()
{
    open = false;
}

sqc::SessionFactory testFactory(const std::shared_ptr<TestRemote> &remote, int failAfter)
{
    return [remote, failAfter](int) {
        return std::unique_ptr<sqc::Session>(new TestSession(remote, failAfter));
    };
}
