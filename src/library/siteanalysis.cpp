/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "siteanalysis.h"

#include <algorithm>
#include <regex>

#include "exceptions.h"
#include "logger.h"
#include "utils.h"

namespace sqc
{

    namespace
    {
        // Pools are per analysis: dropped on the way out, whatever happens
        class PoolCacheGuard
        {
            std::shared_ptr<ConnectionPoolCache> cache;
            std::string key;

        public:
            PoolCacheGuard(const std::shared_ptr<ConnectionPoolCache> &cache, const std::string &key) : cache(cache), key(key) {}
            ~PoolCacheGuard()
            {
                if (cache)
                    cache->invalidate(key);
            }
        };
    }

    SiteInfo parseSitePath(const std::string &path)
    {
        SiteInfo info;
        info.path = path;

        std::vector<std::string> parts;
        for (const auto &p : utils::split(path, "/"))
        {
            if (!p.empty())
                parts.push_back(p);
        }

        for (size_t i = 0; i + 1 < parts.size(); i++)
        {
            if (parts[i] == "homes")
            {
                info.pilot = parts[i + 1];
                break;
            }
        }

        const std::regex siteIdRe("(\\d{8,10})");
        for (const auto &p : parts)
        {
            std::smatch m;
            if (std::regex_search(p, m, siteIdRe))
            {
                info.siteId = m[1];
                break;
            }
        }

        if (info.pilot.empty())
            info.pilot = "Unknown";
        if (info.siteId.empty())
            info.siteId = "Unknown";

        return info;
    }

    json FolderReport::toJSON() const
    {
        json j;
        j["name"] = name;
        j["path"] = path;
        j["category"] = category;
        j["color"] = color;
        j["images"] = imageCount;
        j["size"] = totalSize;
        j["sizeHuman"] = utils::bytesToHuman(totalSize);

        json points = json::array();
        for (const auto &r : results)
            points.push_back(r.toJSON());
        j["gpsData"] = points;

        if (failed())
            j["error"] = error;
        else
            j["error"] = nullptr;

        j["batch"] = batch.toJSON();
        j["batch"]["extracted"] = results.size();
        return j;
    }

    size_t SiteAnalysis::gpsCount() const
    {
        size_t count = 0;
        for (const auto &f : folders)
            count += f.second.results.size();
        return count;
    }

    json SiteAnalysis::toJSON() const
    {
        json j;
        j["siteId"] = site.siteId;
        j["pilot"] = site.pilot;
        j["path"] = site.path;

        j["folders"] = json::object();
        for (const auto &f : folders)
            j["folders"][f.first] = f.second.toJSON();

        j["totalImages"] = totalImages;
        j["totalSize"] = totalSize;
        j["totalSizeHuman"] = utils::bytesToHuman(totalSize);
        j["gpsCount"] = gpsCount();
        j["failedFolders"] = failedFolders;
        j["cancelled"] = cancelled;
        return j;
    }

    SiteAnalyzer::SiteAnalyzer(const AnalysisConfig &config, const std::shared_ptr<Session> &primary,
                               const SessionFactory &factory, const std::shared_ptr<ConnectionPoolCache> &cache,
                               const std::string &cacheKey) : config(config), primary(primary), factory(factory), cache(cache), cacheKey(cacheKey),
                                                              scheduler(config.scheduler, GeotagExtractor(config.extractor)),
                                                              cancelled(std::make_shared<std::atomic<bool>>(false))
    {
        if (!primary)
            throw InvalidArgsException("A primary session is required");
        config.validate();
    }

    SiteAnalysis SiteAnalyzer::analyze(const std::string &sitePath)
    {
        SiteAnalysis analysis;
        analysis.site = parseSitePath(sitePath);

        LOGI << "Analyzing site " << analysis.site.siteId << " (pilot: " << analysis.site.pilot << ") at " << sitePath;

        PoolCacheGuard guard(factory ? cache : nullptr, cacheKey);

        const auto entries = primary->list(sitePath, config.listTimeoutMs);

        std::vector<std::string> folderNames;
        for (const auto &e : entries)
        {
            if (e.isDirectory())
                folderNames.push_back(e.name);
        }
        std::sort(folderNames.begin(), folderNames.end());

        LOGD << "Found " << folderNames.size() << " folders";

        for (const auto &name : folderNames)
        {
            if (isCancelled())
            {
                LOGW << "Analysis cancelled, skipping remaining folders";
                analysis.cancelled = true;
                break;
            }

            FolderReport report = analyzeFolder(name, utils::joinRemotePath(sitePath, name));

            analysis.totalImages += report.imageCount;
            analysis.totalSize += report.totalSize;
            if (report.failed())
                analysis.failedFolders.push_back(name);

            analysis.folders[name] = std::move(report);
        }

        if (isCancelled())
            analysis.cancelled = true;

        LOGI << "Site analysis complete: " << analysis.totalImages << " images, "
             << analysis.gpsCount() << " GPS points, " << analysis.failedFolders.size() << " failed folders";

        return analysis;
    }

    FolderReport SiteAnalyzer::analyzeFolder(const std::string &name, const std::string &path)
    {
        FolderReport report;
        report.name = name;
        report.path = path;
        report.category = config.categoryFor(name);
        report.color = config.colorFor(report.category);

        LOGI << "Analyzing folder " << name;

        std::vector<WorkItem> items;
        try
        {
            try
            {
                primary->stat(path, config.folderProbeTimeoutMs);
            }
            catch (const NetException &e)
            {
                throw FolderProbeException(name, std::string("Cannot access folder: ") + e.what());
            }

            std::vector<RemoteEntry> entries;
            try
            {
                entries = primary->list(path, config.listTimeoutMs);
            }
            catch (const NetException &e)
            {
                throw FolderProbeException(name, std::string("Cannot list folder: ") + e.what());
            }

            for (const auto &e : entries)
            {
                if (!e.isFile())
                    continue;

                report.totalSize += e.size;
                if (utils::hasExtension(e.name, config.imageExtensions))
                    items.emplace_back(name, utils::joinRemotePath(path, e.name), e.name);
            }
        }
        catch (const FolderProbeException &e)
        {
            LOGW << "Skipping folder " << e.getFolder() << ": " << e.what();
            report.error = e.what();
            return report;
        }

        std::sort(items.begin(), items.end(), [](const WorkItem &a, const WorkItem &b) { return a.filename < b.filename; });
        report.imageCount = items.size();

        LOGD << name << ": " << items.size() << " images, " << utils::bytesToHuman(report.totalSize);

        if (items.empty())
            return report;

        std::shared_ptr<ConnectionPool> pool;
        if (cache && factory && items.size() >= static_cast<size_t>(config.scheduler.sequentialThreshold))
        {
            try
            {
                pool = cache->get(cacheKey, scheduler.workerCount(items.size()), factory, config.pool);
            }
            catch (const AppException &e)
            {
                LOGW << "Cannot prepare connection pool: " << e.what();
            }
        }

        report.batch = scheduler.run(items, *primary, pool, config.pool.leaseTimeoutMs, cancelled.get());
        report.results = std::move(report.batch.results);
        report.batch.results.clear();

        return report;
    }

    void SiteAnalyzer::cancel()
    {
        cancelled->store(true);
    }

    bool SiteAnalyzer::isCancelled() const
    {
        return cancelled->load();
    }

}
