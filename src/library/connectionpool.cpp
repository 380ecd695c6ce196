/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "connectionpool.h"

#include <chrono>
#include <future>

#include "exceptions.h"
#include "logger.h"

namespace sqc
{

    json PoolStats::toJSON() const
    {
        json j;
        j["leases"] = leases;
        j["releases"] = releases;
        j["discards"] = discards;
        j["created"] = created;
        j["failedOpens"] = failedOpens;
        return j;
    }

    ConnectionPool::ConnectionPool(const SessionFactory &factory, const PoolConfig &config) : factory(factory), config(config), closed(false)
    {
        if (!factory)
            throw InvalidArgsException("A session factory is required");
    }

    ConnectionPool::~ConnectionPool()
    {
        std::lock_guard<std::mutex> lock(mtx);
        for (auto &c : connections)
            c->close();
        connections.clear();
    }

    std::shared_ptr<ConnectionPool> ConnectionPool::create(int size, const SessionFactory &factory, const PoolConfig &config)
    {
        auto pool = std::make_shared<ConnectionPool>(factory, config);
        const int opened = size > 0 ? pool->grow(size) : 0;

        LOGD << "Connection pool created with " << opened << "/" << size << " connections";
        if (!pool->sufficient())
        {
            LOGW << "Connection pool has only " << opened << " connections (need " << config.floor << ")";
        }

        return pool;
    }

    int ConnectionPool::grow(int count)
    {
        std::vector<std::future<std::unique_ptr<Session>>> pending;
        pending.reserve(count);

        for (int i = 0; i < count; i++)
            pending.push_back(std::async(std::launch::async, factory, config.connectTimeoutMs));

        int opened = 0;
        for (auto &f : pending)
        {
            std::unique_ptr<Session> s;
            try
            {
                s = f.get();
                if (!s)
                    throw ConnectionException("Session factory returned no session");
            }
            catch (const AppException &e)
            {
                LOGW << "Cannot open pooled connection: " << e.what();
                std::lock_guard<std::mutex> lock(mtx);
                st.failedOpens++;
                continue;
            }

            std::unique_lock<std::mutex> lock(mtx);
            if (closed)
            {
                lock.unlock();
                s->close();
                continue;
            }

            idle.push_back(s.get());
            connections.push_back(std::move(s));
            st.created++;
            opened++;
            cv.notify_one();
        }

        return opened;
    }

    void ConnectionPool::prepare(int target)
    {
        std::vector<Session *> probing;
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (closed)
                throw PoolExhaustedException("Connection pool is closed");

            // Keep them out of reach of lease() while probing
            while (!idle.empty())
            {
                probing.push_back(idle.front());
                leased.insert(idle.front());
                idle.pop_front();
            }
        }

        int dead = 0;
        for (Session *s : probing)
        {
            const bool alive = healthCheck(s);

            std::unique_ptr<Session> dropped;
            {
                std::lock_guard<std::mutex> lock(mtx);
                leased.erase(s);
                if (alive && !closed)
                {
                    idle.push_back(s);
                    cv.notify_one();
                }
                else
                {
                    dropped = drop(s);
                    if (!alive)
                        dead++;
                }
            }
            if (dropped)
                dropped->close();
        }

        int missing;
        {
            std::lock_guard<std::mutex> lock(mtx);
            missing = target - static_cast<int>(connections.size());
        }

        if (dead > 0)
            LOGD << "Dropped " << dead << " dead connections from the pool";

        if (missing > 0)
        {
            const int opened = grow(missing);
            LOGD << "Opened " << opened << "/" << missing << " new pooled connections";
        }
    }

    bool ConnectionPool::sufficient() const
    {
        std::lock_guard<std::mutex> lock(mtx);
        return !closed && static_cast<int>(connections.size()) >= config.floor;
    }

    size_t ConnectionPool::size() const
    {
        std::lock_guard<std::mutex> lock(mtx);
        return connections.size();
    }

    size_t ConnectionPool::available() const
    {
        std::lock_guard<std::mutex> lock(mtx);
        return idle.size();
    }

    size_t ConnectionPool::leasedCount() const
    {
        std::lock_guard<std::mutex> lock(mtx);
        return leased.size();
    }

    Session *ConnectionPool::lease(int timeoutMs)
    {
        std::unique_lock<std::mutex> lock(mtx);
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);

        while (idle.empty())
        {
            if (closed)
                throw PoolExhaustedException("Connection pool is closed");
            if (connections.empty())
                throw PoolExhaustedException("No live connections left in the pool");

            if (cv.wait_until(lock, deadline) == std::cv_status::timeout && idle.empty())
                throw PoolExhaustedException("Timed out after " + std::to_string(timeoutMs) + "ms waiting for a pooled connection");
        }

        Session *s = idle.front();
        idle.pop_front();
        leased.insert(s);
        st.leases++;

        return s;
    }

    void ConnectionPool::release(Session *s)
    {
        std::unique_ptr<Session> dropped;
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (s == nullptr || leased.find(s) == leased.end())
            {
                LOGW << "Ignoring release of a connection that is not leased";
                return;
            }

            leased.erase(s);
            st.releases++;

            if (closed || !s->isOpen())
            {
                dropped = drop(s);
                cv.notify_all();
            }
            else
            {
                idle.push_back(s);
                cv.notify_one();
            }
        }

        if (dropped)
            dropped->close();
    }

    void ConnectionPool::discard(Session *s)
    {
        std::unique_ptr<Session> dropped;
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (s == nullptr || leased.find(s) == leased.end())
            {
                LOGW << "Ignoring discard of a connection that is not leased";
                return;
            }

            leased.erase(s);
            st.discards++;
            dropped = drop(s);

            // Waiters must notice when the last connection goes away
            cv.notify_all();
        }

        if (dropped)
        {
            dropped->close();
            LOGD << "Discarded pooled connection, " << size() << " left";
        }
    }

    std::unique_ptr<Session> ConnectionPool::drop(Session *s)
    {
        for (auto it = connections.begin(); it != connections.end(); it++)
        {
            if (it->get() == s)
            {
                std::unique_ptr<Session> res = std::move(*it);
                connections.erase(it);
                return res;
            }
        }
        return nullptr;
    }

    bool ConnectionPool::healthCheck(Session *s)
    {
        if (s == nullptr || !s->isOpen())
            return false;

        try
        {
            s->stat(config.probePath, config.probeTimeoutMs);
            return true;
        }
        catch (const NetException &e)
        {
            LOGD << "Pooled connection failed health check: " << e.what();
            return false;
        }
    }

    void ConnectionPool::close()
    {
        std::vector<std::unique_ptr<Session>> dropped;
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (closed)
                return;
            closed = true;

            for (Session *s : idle)
                dropped.push_back(drop(s));
            idle.clear();
            cv.notify_all();
        }

        for (auto &s : dropped)
        {
            if (s)
                s->close();
        }

        LOGD << "Connection pool closed";
    }

    bool ConnectionPool::isClosed() const
    {
        std::lock_guard<std::mutex> lock(mtx);
        return closed;
    }

    PoolStats ConnectionPool::stats() const
    {
        std::lock_guard<std::mutex> lock(mtx);
        return st;
    }

    ConnectionLease::ConnectionLease(ConnectionPool &pool, int timeoutMs) : pool(pool), session(pool.lease(timeoutMs)), dead(false)
    {
    }

    ConnectionLease::~ConnectionLease()
    {
        if (dead)
            pool.discard(session);
        else
            pool.release(session);
    }

    std::shared_ptr<ConnectionPool> ConnectionPoolCache::get(const std::string &key, int size, const SessionFactory &factory, const PoolConfig &config)
    {
        std::shared_ptr<ConnectionPool> pool;
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto it = pools.find(key);
            if (it != pools.end() && !it->second->isClosed())
                pool = it->second;
        }

        if (pool)
        {
            LOGD << "Reusing cached connection pool for " << key;
            pool->prepare(size);
            return pool;
        }

        pool = ConnectionPool::create(size, factory, config);

        std::lock_guard<std::mutex> lock(mtx);
        pools[key] = pool;
        return pool;
    }

    bool ConnectionPoolCache::contains(const std::string &key) const
    {
        std::lock_guard<std::mutex> lock(mtx);
        return pools.find(key) != pools.end();
    }

    size_t ConnectionPoolCache::size() const
    {
        std::lock_guard<std::mutex> lock(mtx);
        return pools.size();
    }

    void ConnectionPoolCache::invalidate(const std::string &key)
    {
        std::shared_ptr<ConnectionPool> pool;
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto it = pools.find(key);
            if (it == pools.end())
                return;
            pool = it->second;
            pools.erase(it);
        }

        pool->close();
        LOGD << "Invalidated connection pool for " << key;
    }

    void ConnectionPoolCache::clear()
    {
        std::map<std::string, std::shared_ptr<ConnectionPool>> all;
        {
            std::lock_guard<std::mutex> lock(mtx);
            all.swap(pools);
        }

        for (auto &p : all)
            p.second->close();
    }

}
