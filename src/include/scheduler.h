/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef SCHEDULER_H
#define SCHEDULER_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "config.h"
#include "connectionpool.h"
#include "geotag.h"
#include "json.h"
#include "session.h"
#include "sqc_export.h"

namespace sqc
{

    // Outcome of one batch. Every item is accounted for exactly once:
    // results + noData + timedOut + failed + abandoned == batch size
    struct BatchReport
    {
        std::vector<GeoTag> results;

        size_t noData = 0;   // read, but no geotag
        size_t timedOut = 0; // a remote call exceeded the item timeout
        size_t failed = 0;   // unreadable, or connection lost on every attempt
        size_t abandoned = 0;

        // Paths of timed out, failed and abandoned items
        std::vector<std::string> failedItems;

        bool batchTimedOut = false;
        bool sequential = false;
        int workers = 0;
        int64_t elapsedMs = 0;

        size_t processed() const { return results.size() + noData + timedOut + failed; }

        SQC_DLL json toJSON() const;
    };

    /**
     * Runs the extraction of a batch of work items, in parallel over a
     * connection pool or sequentially over the primary session.
     * Never blocks longer than the batch timeout (plus one in-flight call
     * on the primary session during the sequential pass).
     */
    class ExtractionScheduler
    {
        SchedulerConfig config;
        GeotagExtractor extractor;

        BatchReport runParallel(const std::vector<WorkItem> &items, Session &primary, const std::shared_ptr<ConnectionPool> &pool, int leaseTimeoutMs, const std::atomic<bool> *cancelled) const;
        void runSequential(const std::vector<WorkItem> &items, Session &primary, BatchReport &report,
                           const std::chrono::steady_clock::time_point &deadline, const std::atomic<bool> *cancelled) const;

    protected:
        // Throws std::system_error when the thread cannot be started
        SQC_DLL virtual std::thread startWorker(std::function<void()> work) const;

    public:
        SQC_DLL ExtractionScheduler(const SchedulerConfig &config, const GeotagExtractor &extractor);
        virtual ~ExtractionScheduler() = default;

        // clamp(batchSize / itemsPerWorker, minWorkers, maxWorkers)
        SQC_DLL static int computeWorkerCount(size_t batchSize, const SchedulerConfig &config);
        SQC_DLL int workerCount(size_t batchSize) const;

        // Extraction threads of every scheduler still running, including
        // those detached after a timeout
        SQC_DLL static int runningWorkers();

        SQC_DLL bool runsSequentially(size_t batchSize, const ConnectionPool *pool) const;

        SQC_DLL BatchReport run(const std::vector<WorkItem> &items, Session &primary,
                                const std::shared_ptr<ConnectionPool> &pool,
                                int leaseTimeoutMs,
                                const std::atomic<bool> *cancelled = nullptr) const;

        const SchedulerConfig &getConfig() const { return config; }
    };

}

#endif // SCHEDULER_H
