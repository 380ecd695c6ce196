/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "scheduler.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>

#include "exceptions.h"
#include "logger.h"
#include "utils.h"

namespace sqc {

namespace {

typedef std::chrono::steady_clock Clock;

// Worker threads started and not yet finished, detached ones included
std::atomic<int> liveWorkers(0);

enum class ItemState { Pending, Waiting, Running, Extracted, NoData, TimedOut, Failed, Deferred, Abandoned };

bool isSettled(ItemState s) {
    return s >= ItemState::Extracted;
}

int remainingMs(const Clock::time_point &deadline) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return ms > 0 ? static_cast<int>(ms) : 0;
}

struct ItemSlot {
    WorkItem item;
    ItemState state = ItemState::Pending;
    Clock::time_point started;
    std::optional<GeoTag> result;
};

// Shared between the gatherer and the workers. Workers that outlive the
// batch (stuck in a remote call) keep it, and the pool, alive.
struct BatchState {
    const SchedulerConfig config;
    const GeotagExtractor extractor;
    const std::shared_ptr<ConnectionPool> pool;
    const int leaseTimeoutMs;
    Clock::time_point deadline;

    std::mutex mtx;
    std::condition_variable cv;
    std::vector<ItemSlot> slots;
    size_t next = 0;
    size_t settled = 0;
    bool stop = false;
    std::vector<char> workerDone;

    BatchState(const SchedulerConfig &config, const GeotagExtractor &extractor,
               const std::shared_ptr<ConnectionPool> &pool, int leaseTimeoutMs)
        : config(config), extractor(extractor), pool(pool), leaseTimeoutMs(leaseTimeoutMs) {}

    void settle(size_t idx, ItemState state, std::optional<GeoTag> result = std::nullopt) {
        std::lock_guard<std::mutex> lock(mtx);
        ItemSlot &s = slots[idx];
        if (isSettled(s.state)) {
            LOGD << "Dropping late result for " << s.item.path;
            return;
        }
        s.state = state;
        s.result = std::move(result);
        settled++;
        cv.notify_all();
    }

    // False if the gatherer already gave up on the item
    bool mark(size_t idx, ItemState state) {
        std::lock_guard<std::mutex> lock(mtx);
        ItemSlot &s = slots[idx];
        if (isSettled(s.state)) return false;
        s.state = state;
        if (state == ItemState::Running) s.started = Clock::now();
        return true;
    }
};

void processItem(BatchState &b, size_t idx) {
    // Slots are not resized once workers start
    const WorkItem &item = b.slots[idx].item;

    for (int attempt = 1; attempt <= b.config.itemAttempts; attempt++) {
        const int remaining = remainingMs(b.deadline);
        if (remaining <= 0) return;

        // Waiting means retry. The item settles only once its lease is back.
        ItemState outcome = ItemState::Waiting;
        std::optional<GeoTag> tag;

        try {
            ConnectionLease lease(*b.pool, std::min(b.leaseTimeoutMs, remaining));
            if (!b.mark(idx, ItemState::Running)) return;

            try {
                tag = b.extractor.extract(lease.get(), item, b.config.itemTimeoutMs);
                outcome = tag ? ItemState::Extracted : ItemState::NoData;
            } catch (const ConnectionException &e) {
                lease.markDead();
                LOGW << "Connection lost reading " << item.path << " (attempt " << attempt << "/"
                     << b.config.itemAttempts << "): " << e.what();
            } catch (const RemoteTimeoutException &e) {
                LOGW << "Timed out reading " << item.path << ": " << e.what();
                outcome = ItemState::TimedOut;
            } catch (const NetException &e) {
                LOGW << "Cannot read " << item.path << ": " << e.what();
                outcome = ItemState::Failed;
            }
        } catch (const PoolExhaustedException &e) {
            LOGD << "Deferring " << item.path << " to the primary session: " << e.what();
            outcome = ItemState::Deferred;
        }

        if (outcome != ItemState::Waiting) {
            b.settle(idx, outcome, std::move(tag));
            return;
        }

        if (!b.mark(idx, ItemState::Waiting)) return;
    }

    b.settle(idx, ItemState::Failed);
}

void extractWorker(std::shared_ptr<BatchState> b, size_t worker) {
    while (true) {
        size_t idx;
        {
            std::lock_guard<std::mutex> lock(b->mtx);
            if (b->stop || b->next >= b->slots.size()) break;
            idx = b->next++;
            b->slots[idx].state = ItemState::Waiting;
        }

        try {
            processItem(*b, idx);
        } catch (const std::exception &e) {
            LOGE << "Unexpected error extracting " << b->slots[idx].item.path << ": " << e.what();
            b->settle(idx, ItemState::Failed);
        }
    }

    {
        std::lock_guard<std::mutex> lock(b->mtx);
        if (worker < b->workerDone.size()) b->workerDone[worker] = 1;
        b->cv.notify_all();
    }
}

void logProgress(size_t done, size_t total, size_t &lastLogged, int interval) {
    if (interval <= 0) return;
    if (done / interval > lastLogged / interval || (done == total && lastLogged != total)) {
        LOGI << "Processed " << done << "/" << total << " images";
        lastLogged = done;
    }
}

}  // namespace

json BatchReport::toJSON() const {
    json j;
    j["extracted"] = results.size();
    j["noData"] = noData;
    j["timedOut"] = timedOut;
    j["failed"] = failed;
    j["abandoned"] = abandoned;
    j["failedItems"] = failedItems;
    j["batchTimedOut"] = batchTimedOut;
    j["sequential"] = sequential;
    j["workers"] = workers;
    j["elapsedMs"] = elapsedMs;
    return j;
}

ExtractionScheduler::ExtractionScheduler(const SchedulerConfig &config,
                                         const GeotagExtractor &extractor)
    : config(config), extractor(extractor) {}

int ExtractionScheduler::computeWorkerCount(size_t batchSize, const SchedulerConfig &config) {
    const int perWorker = std::max(1, config.itemsPerWorker);
    const int n = static_cast<int>(batchSize / static_cast<size_t>(perWorker));
    return std::max(config.minWorkers, std::min(config.maxWorkers, n));
}

int ExtractionScheduler::runningWorkers() {
    return liveWorkers.load();
}

std::thread ExtractionScheduler::startWorker(std::function<void()> work) const {
    return std::thread(std::move(work));
}

int ExtractionScheduler::workerCount(size_t batchSize) const {
    return computeWorkerCount(batchSize, config);
}

bool ExtractionScheduler::runsSequentially(size_t batchSize, const ConnectionPool *pool) const {
    return batchSize < static_cast<size_t>(config.sequentialThreshold) || pool == nullptr ||
           !pool->sufficient();
}

BatchReport ExtractionScheduler::run(const std::vector<WorkItem> &items, Session &primary,
                                     const std::shared_ptr<ConnectionPool> &pool,
                                     int leaseTimeoutMs,
                                     const std::atomic<bool> *cancelled) const {
    const auto start = Clock::now();
    BatchReport report;
    if (items.empty()) return report;

    if (runsSequentially(items.size(), pool.get())) {
        if (items.size() >= static_cast<size_t>(config.sequentialThreshold)) {
            LOGW << "Connection pool unavailable, processing " << items.size()
                 << " images sequentially";
        }
        report.sequential = true;
        report.workers = 1;
        runSequential(items, primary, report, start + std::chrono::milliseconds(config.batchTimeoutMs),
                      cancelled);
    } else {
        report = runParallel(items, primary, pool, leaseTimeoutMs, cancelled);
    }

    report.elapsedMs = utils::elapsedMs(start);

    LOGI << "Batch done: " << report.results.size() << "/" << items.size() << " geotagged, "
         << report.noData << " without geotag, " << report.timedOut << " timed out, "
         << report.failed << " failed, " << report.abandoned << " abandoned in "
         << report.elapsedMs << "ms";

    return report;
}

BatchReport ExtractionScheduler::runParallel(const std::vector<WorkItem> &items, Session &primary,
                                             const std::shared_ptr<ConnectionPool> &pool,
                                             int leaseTimeoutMs,
                                             const std::atomic<bool> *cancelled) const {
    BatchReport report;
    const size_t n = items.size();

    auto state = std::make_shared<BatchState>(config, extractor, pool, leaseTimeoutMs);
    state->deadline = Clock::now() + std::chrono::milliseconds(config.batchTimeoutMs);
    state->slots.resize(n);
    for (size_t i = 0; i < n; i++) state->slots[i].item = items[i];

    const size_t workers = std::min(static_cast<size_t>(workerCount(n)), n);
    report.workers = static_cast<int>(workers);
    state->workerDone.assign(workers, 0);

    LOGI << "Processing " << n << " images with " << workers << " workers ("
         << pool->size() << " pooled connections)";

    std::vector<std::thread> threads;
    threads.reserve(workers);
    try {
        for (size_t i = 0; i < workers; i++) {
            liveWorkers++;
            threads.push_back(startWorker([state, i]() mutable {
                extractWorker(state, i);

                // The last owner of the batch may close the pool
                state.reset();
                liveWorkers--;
            }));
        }
    } catch (const std::system_error &e) {
        liveWorkers--;
        LOGW << "Cannot start worker " << (threads.size() + 1) << "/" << workers << ": " << e.what();
    }

    if (threads.empty()) {
        report.sequential = true;
        report.workers = 1;
        runSequential(items, primary, report, state->deadline, cancelled);
        return report;
    }
    if (threads.size() < workers) {
        std::lock_guard<std::mutex> lock(state->mtx);
        state->workerDone.resize(threads.size());
        report.workers = static_cast<int>(threads.size());
    }

    // Leave the session's own timeout a chance to fire first
    const auto grace = std::chrono::milliseconds(std::max(100, config.itemTimeoutMs / 10));
    const auto itemTimeout = std::chrono::milliseconds(config.itemTimeoutMs);
    size_t lastLogged = 0;

    std::unique_lock<std::mutex> lock(state->mtx);
    while (state->settled < n) {
        const auto now = Clock::now();

        if (cancelled != nullptr && cancelled->load()) {
            LOGW << "Batch cancelled with " << (n - state->settled) << " images outstanding";
            break;
        }
        if (now >= state->deadline) {
            report.batchTimedOut = true;
            LOGW << "Batch timed out after " << config.batchTimeoutMs << "ms with "
                 << (n - state->settled) << " images outstanding";
            break;
        }

        auto wake = state->deadline;
        for (auto &s : state->slots) {
            if (s.state != ItemState::Running) continue;
            const auto expires = s.started + itemTimeout + grace;
            if (now >= expires) {
                LOGW << "Abandoning " << s.item.path << " after " << config.itemTimeoutMs << "ms";
                s.state = ItemState::Abandoned;
                state->settled++;
            } else if (expires < wake) {
                wake = expires;
            }
        }

        logProgress(state->settled, n, lastLogged, config.progressInterval);
        if (state->settled >= n) break;

        if (std::all_of(state->workerDone.begin(), state->workerDone.end(),
                        [](char d) { return d != 0; }))
            break;

        if (cancelled != nullptr) wake = std::min(wake, now + std::chrono::milliseconds(100));
        state->cv.wait_until(lock, wake);
    }

    state->stop = true;

    std::vector<WorkItem> deferred;
    for (auto &s : state->slots) {
        if (!isSettled(s.state)) {
            s.state = ItemState::Abandoned;
            state->settled++;
        }

        switch (s.state) {
            case ItemState::Extracted:
                report.results.push_back(*s.result);
                break;
            case ItemState::NoData:
                report.noData++;
                break;
            case ItemState::TimedOut:
                report.timedOut++;
                report.failedItems.push_back(s.item.path);
                break;
            case ItemState::Failed:
                report.failed++;
                report.failedItems.push_back(s.item.path);
                break;
            case ItemState::Deferred:
                deferred.push_back(s.item);
                break;
            default:
                report.abandoned++;
                report.failedItems.push_back(s.item.path);
                break;
        }
    }

    const std::vector<char> done = state->workerDone;
    lock.unlock();

    size_t detached = 0;
    for (size_t i = 0; i < threads.size(); i++) {
        if (done[i]) {
            threads[i].join();
        } else {
            threads[i].detach();
            detached++;
        }
    }
    if (detached > 0) LOGW << detached << " workers still blocked, detached";

    if (!deferred.empty()) {
        LOGI << deferred.size() << " images deferred to the primary session";
        runSequential(deferred, primary, report, state->deadline, cancelled);
    }

    return report;
}

void ExtractionScheduler::runSequential(const std::vector<WorkItem> &items, Session &primary,
                                        BatchReport &report, const Clock::time_point &deadline,
                                        const std::atomic<bool> *cancelled) const {
    size_t lastLogged = 0;

    for (size_t i = 0; i < items.size(); i++) {
        const WorkItem &item = items[i];
        const int remaining = remainingMs(deadline);

        if (remaining <= 0 || (cancelled != nullptr && cancelled->load())) {
            if (remaining <= 0) {
                report.batchTimedOut = true;
                LOGW << "Batch timed out with " << (items.size() - i) << " images outstanding";
            }
            for (size_t j = i; j < items.size(); j++) {
                report.abandoned++;
                report.failedItems.push_back(items[j].path);
            }
            break;
        }

        try {
            auto tag = extractor.extract(primary, item, std::min(config.itemTimeoutMs, remaining));
            if (tag)
                report.results.push_back(*tag);
            else
                report.noData++;
        } catch (const RemoteTimeoutException &e) {
            LOGW << "Timed out reading " << item.path << ": " << e.what();
            report.timedOut++;
            report.failedItems.push_back(item.path);
        } catch (const NetException &e) {
            LOGW << "Cannot read " << item.path << ": " << e.what();
            report.failed++;
            report.failedItems.push_back(item.path);
        } catch (const std::exception &e) {
            LOGE << "Unexpected error extracting " << item.path << ": " << e.what();
            report.failed++;
            report.failedItems.push_back(item.path);
        }

        logProgress(i + 1, items.size(), lastLogged, config.progressInterval);
    }
}

}  // namespace sqc
