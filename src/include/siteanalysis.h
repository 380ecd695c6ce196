/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef SITEANALYSIS_H
#define SITEANALYSIS_H

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "config.h"
#include "connectionpool.h"
#include "geotag.h"
#include "json.h"
#include "scheduler.h"
#include "session.h"
#include "sqc_export.h"

namespace sqc
{

    struct SiteInfo
    {
        std::string siteId;
        std::string pilot;
        std::string path;
    };

    // /homes/<pilot>/<site id>-<date>-<client>
    // Either part defaults to "Unknown"
    SQC_DLL SiteInfo parseSitePath(const std::string &path);

    struct FolderReport
    {
        std::string name;
        std::string path;
        std::string category;
        std::string color;

        size_t imageCount = 0;
        std::uintmax_t totalSize = 0; // every file in the folder, not only images

        std::vector<GeoTag> results;

        // Set only when the folder could not be probed or listed
        std::string error;

        BatchReport batch;

        bool failed() const { return !error.empty(); }

        SQC_DLL json toJSON() const;
    };

    struct SiteAnalysis
    {
        SiteInfo site;
        std::map<std::string, FolderReport> folders;
        size_t totalImages = 0;
        std::uintmax_t totalSize = 0;
        std::vector<std::string> failedFolders;
        bool cancelled = false;

        SQC_DLL size_t gpsCount() const;
        SQC_DLL json toJSON() const;
    };

    /**
     * Walks the immediate subfolders of a site, extracting the geotags of
     * their images. A folder that cannot be probed or listed is recorded
     * with its error and skipped: it never stops the other folders.
     */
    class SiteAnalyzer
    {
        AnalysisConfig config;
        std::shared_ptr<Session> primary;
        SessionFactory factory;
        std::shared_ptr<ConnectionPoolCache> cache;
        std::string cacheKey;
        ExtractionScheduler scheduler;
        std::shared_ptr<std::atomic<bool>> cancelled;

    public:
        // cache may be null: every batch then runs on the primary session
        SQC_DLL SiteAnalyzer(const AnalysisConfig &config, const std::shared_ptr<Session> &primary,
                             const SessionFactory &factory, const std::shared_ptr<ConnectionPoolCache> &cache,
                             const std::string &cacheKey);

        SQC_DLL SiteAnalysis analyze(const std::string &sitePath);
        SQC_DLL FolderReport analyzeFolder(const std::string &name, const std::string &path);

        // Stops between folders and batches
        SQC_DLL void cancel();
        SQC_DLL bool isCancelled() const;
    };

}

#endif // SITEANALYSIS_H
