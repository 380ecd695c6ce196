/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef REVIEW_H
#define REVIEW_H

#include <memory>
#include <string>
#include <vector>
#include "config.h"
#include "connectionpool.h"
#include "json.h"
#include "outliers.h"
#include "scene.h"
#include "session.h"
#include "siteanalysis.h"
#include "sqc_export.h"

namespace sqc
{

    struct ReviewRequest
    {
        std::string sitePath;
        AnalysisConfig config;

        // Already open. Failing to open it is the caller's hard failure.
        std::shared_ptr<Session> primary;

        // Opens pooled connections; may be empty (sequential only)
        SessionFactory factory;
        std::shared_ptr<ConnectionPoolCache> cache;
        std::string cacheKey;
    };

    struct SiteReview
    {
        SiteAnalysis analysis;
        std::vector<ClassifiedPoint> points;
        OutlierBounds bounds;
        Scene scene;

        SQC_DLL size_t outlierCount() const;
        SQC_DLL json toJSON() const;
    };

    // Classifies the points of a finished analysis and builds its scene
    SQC_DLL SiteReview reviewSite(SiteAnalysis analysis, const AnalysisConfig &config);

    // Analyzes, classifies and draws a site within config.analysisTimeoutMs.
    // Throws AnalysisTimeoutException when the deadline expires; the
    // analysis is cancelled and finishes in the background.
    SQC_DLL SiteReview runSiteReview(const ReviewRequest &request);

    // Waits up to timeoutMs for analyses and extraction workers left running
    // by a timeout to finish. False if some are still running.
    SQC_DLL bool waitForBackgroundWork(int timeoutMs);

}

#endif // REVIEW_H
