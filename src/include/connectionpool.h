/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef CONNECTIONPOOL_H
#define CONNECTIONPOOL_H

#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "config.h"
#include "json.h"
#include "session.h"
#include "sqc_export.h"

namespace sqc
{

    struct PoolStats
    {
        size_t leases = 0;
        size_t releases = 0;
        size_t discards = 0;
        size_t created = 0;
        size_t failedOpens = 0;

        SQC_DLL json toJSON() const;
    };

    /**
     * Bounded set of independent sessions lent out to one worker at a time.
     * Connections that fail a health check or that the borrower reports as
     * broken are dropped: capacity shrinks, it is never silently refilled
     * except by prepare().
     */
    class ConnectionPool
    {
        SessionFactory factory;
        PoolConfig config;

        mutable std::mutex mtx;
        std::condition_variable cv;

        std::vector<std::unique_ptr<Session>> connections;
        std::deque<Session *> idle;
        std::set<Session *> leased;
        bool closed;
        PoolStats st;

        int grow(int count);
        std::unique_ptr<Session> drop(Session *s);

    public:
        SQC_DLL ConnectionPool(const SessionFactory &factory, const PoolConfig &config);
        SQC_DLL ~ConnectionPool();

        ConnectionPool(const ConnectionPool &) = delete;
        ConnectionPool &operator=(const ConnectionPool &) = delete;

        // Opens up to size sessions concurrently. Failures are logged and skipped.
        SQC_DLL static std::shared_ptr<ConnectionPool> create(int size, const SessionFactory &factory, const PoolConfig &config);

        // Probes idle connections (dropping dead ones), then opens new
        // sessions until the pool holds target connections
        SQC_DLL void prepare(int target);

        // Whether enough live connections exist to run a parallel batch
        SQC_DLL bool sufficient() const;

        SQC_DLL size_t size() const;
        SQC_DLL size_t available() const;
        SQC_DLL size_t leasedCount() const;

        // Waits up to timeoutMs for an idle connection.
        // Throws PoolExhaustedException on timeout, or right away when the
        // pool has no live connections left.
        SQC_DLL Session *lease(int timeoutMs);

        SQC_DLL void release(Session *s);
        SQC_DLL void discard(Session *s);

        SQC_DLL bool healthCheck(Session *s);

        // Closes idle connections; leased ones are closed when returned
        SQC_DLL void close();
        SQC_DLL bool isClosed() const;

        SQC_DLL PoolStats stats() const;
    };

    // Exclusive use of one pooled connection for the lifetime of the object.
    // Returned to the pool on destruction, or dropped if marked dead.
    class ConnectionLease
    {
        ConnectionPool &pool;
        Session *session;
        bool dead;

    public:
        SQC_DLL ConnectionLease(ConnectionPool &pool, int timeoutMs);
        SQC_DLL ~ConnectionLease();

        ConnectionLease(const ConnectionLease &) = delete;
        ConnectionLease &operator=(const ConnectionLease &) = delete;

        Session *operator->() const { return session; }
        Session &get() const { return *session; }

        void markDead() { dead = true; }
    };

    /**
     * Pools kept alive across the folders of one analysis, keyed by the
     * identity of the owning session. Owned by the caller.
     */
    class ConnectionPoolCache
    {
        mutable std::mutex mtx;
        std::map<std::string, std::shared_ptr<ConnectionPool>> pools;

    public:
        // Returns the cached pool for key (prepared to hold size connections)
        // or creates a new one
        SQC_DLL std::shared_ptr<ConnectionPool> get(const std::string &key, int size, const SessionFactory &factory, const PoolConfig &config);

        SQC_DLL bool contains(const std::string &key) const;
        SQC_DLL size_t size() const;

        // Closes and forgets the pool for key
        SQC_DLL void invalidate(const std::string &key);
        SQC_DLL void clear();
    };

}

#endif // CONNECTIONPOOL_H
