/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "review.h"

#include <atomic>
#include <chrono>
#include <future>
#include <system_error>
#include <thread>

#include "exceptions.h"
#include "logger.h"
#include "scheduler.h"

namespace sqc
{

    namespace
    {
        // Analysis threads started by runSiteReview and not yet finished
        std::atomic<int> liveAnalyses(0);
    }

    size_t SiteReview::outlierCount() const
    {
        size_t count = 0;
        for (const auto &p : points)
        {
            if (p.outlier)
                count++;
        }
        return count;
    }

    json SiteReview::toJSON() const
    {
        json j = analysis.toJSON();

        json pts = json::array();
        for (const auto &p : points)
            pts.push_back(p.toJSON());
        j["points"] = pts;
        j["outliers"] = outlierCount();
        j["bounds"] = bounds.toJSON();

        return j;
    }

    SiteReview reviewSite(SiteAnalysis analysis, const AnalysisConfig &config)
    {
        SiteReview review;
        review.analysis = std::move(analysis);

        OutlierClassifier classifier(config.classifier);
        review.points = OutlierClassifier::collectPoints(review.analysis, config);
        review.bounds = classifier.classify(review.points);

        SceneBuilder builder(config);
        review.scene = builder.build(review.analysis, review.points);

        return review;
    }

    bool waitForBackgroundWork(int timeoutMs)
    {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
        while (liveAnalyses.load() > 0 || ExtractionScheduler::runningWorkers() > 0)
        {
            if (std::chrono::steady_clock::now() >= deadline)
                return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return true;
    }

    SiteReview runSiteReview(const ReviewRequest &request)
    {
        if (request.sitePath.empty())
            throw InvalidArgsException("Site path is required");

        request.config.validate();

        auto analyzer = std::make_shared<SiteAnalyzer>(request.config, request.primary, request.factory,
                                                       request.cache, request.cacheKey);

        // The worker owns everything it touches: it may outlive this call
        auto result = std::make_shared<std::promise<SiteAnalysis>>();
        std::future<SiteAnalysis> future = result->get_future();
        const std::string sitePath = request.sitePath;

        liveAnalyses++;
        try
        {
            std::thread([analyzer, result, sitePath]() mutable {
                try
                {
                    result->set_value(analyzer->analyze(sitePath));
                }
                catch (...)
                {
                    result->set_exception(std::current_exception());
                }

                // Sessions and pools go away before the thread counts as done
                analyzer.reset();
                result.reset();
                liveAnalyses--;
            }).detach();
        }
        catch (const std::system_error &e)
        {
            liveAnalyses--;
            throw AppException(std::string("Cannot start site analysis: ") + e.what());
        }

        const int timeoutMs = request.config.analysisTimeoutMs;
        if (future.wait_for(std::chrono::milliseconds(timeoutMs)) == std::future_status::timeout)
        {
            analyzer->cancel();
            LOGE << "Site analysis of " << sitePath << " timed out after " << timeoutMs << "ms";
            throw AnalysisTimeoutException("Site analysis timed out after " + std::to_string(timeoutMs / 1000) + " seconds");
        }

        return reviewSite(future.get(), request.config);
    }

}
