/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "config.h"

#include <fstream>

#include "constants.h"
#include "exceptions.h"
#include "logger.h"
#include "utils.h"

namespace sqc
{

    PoolConfig::PoolConfig() : floor(DEFAULT_POOL_FLOOR),
                               connectTimeoutMs(DEFAULT_CONNECT_TIMEOUT_MS),
                               probeTimeoutMs(DEFAULT_PROBE_TIMEOUT_MS),
                               leaseTimeoutMs(DEFAULT_LEASE_TIMEOUT_MS),
                               probePath(DEFAULT_PROBE_PATH) {}

    SchedulerConfig::SchedulerConfig() : itemsPerWorker(DEFAULT_ITEMS_PER_WORKER),
                                         minWorkers(DEFAULT_MIN_WORKERS),
                                         maxWorkers(DEFAULT_MAX_WORKERS),
                                         sequentialThreshold(DEFAULT_SEQUENTIAL_THRESHOLD),
                                         itemTimeoutMs(DEFAULT_ITEM_TIMEOUT_MS),
                                         batchTimeoutMs(DEFAULT_BATCH_TIMEOUT_MS),
                                         itemAttempts(DEFAULT_ITEM_ATTEMPTS),
                                         progressInterval(DEFAULT_PROGRESS_INTERVAL) {}

    ExtractorConfig::ExtractorConfig() : prefixBytes(DEFAULT_PREFIX_BYTES),
                                         altitudeTags({"Xmp.drone-dji.RelativeAltitude",
                                                       "Xmp.Camera.AboveGroundAltitude",
                                                       "Exif.GPSInfo.GPSAltitude"}) {}

    ClassifierConfig::ClassifierConfig() : iqrMultiplier(DEFAULT_IQR_MULTIPLIER) {}

    SceneConfig::SceneConfig() : groundOffsetFt(DEFAULT_GROUND_OFFSET_FT),
                                 minZMaxFt(DEFAULT_MIN_Z_MAX_FT),
                                 groundMeshSize(DEFAULT_GROUND_MESH_SIZE),
                                 groundColor(DEFAULT_GROUND_COLOR),
                                 outlierColor(DEFAULT_OUTLIER_COLOR) {}

    AnalysisConfig::AnalysisConfig() : defaultCategoryColor(DEFAULT_CATEGORY_COLOR),
                                       imageExtensions({".jpg", ".jpeg", ".png", ".tif", ".tiff", ".dng"}),
                                       folderProbeTimeoutMs(DEFAULT_FOLDER_PROBE_TIMEOUT_MS),
                                       listTimeoutMs(DEFAULT_LIST_TIMEOUT_MS),
                                       analysisTimeoutMs(DEFAULT_ANALYSIS_TIMEOUT_MS)
    {
        categories = {
            Category("orbit", "#ff4136"),
            Category("scan", "#2ecc40"),
            Category("center", "#0074d9"),
            Category("downlook", "#ffdc00"),
            Category("uplook", "#b10dc9"),
            Category("civil", "#ff851b", true),
            Category("road", "#39cccc", true)};
    }

    std::string AnalysisConfig::categoryFor(const std::string &folderName) const
    {
        std::string name = folderName;
        utils::toLower(name);

        for (const auto &c : categories)
        {
            if (name.find(c.key) != std::string::npos)
                return c.key;
        }

        return DEFAULT_CATEGORY;
    }

    std::string AnalysisConfig::colorFor(const std::string &category) const
    {
        for (const auto &c : categories)
        {
            if (c.key == category)
                return c.color;
        }
        return defaultCategoryColor;
    }

    bool AnalysisConfig::isGroundReference(const std::string &category) const
    {
        for (const auto &c : categories)
        {
            if (c.key == category)
                return c.groundReference;
        }
        return false;
    }

    void AnalysisConfig::validate() const
    {
        if (pool.floor < 1)
            throw ConfigException("pool.floor must be at least 1");
        if (pool.connectTimeoutMs <= 0 || pool.probeTimeoutMs <= 0 || pool.leaseTimeoutMs <= 0)
            throw ConfigException("pool timeouts must be positive");

        if (scheduler.itemsPerWorker < 1)
            throw ConfigException("scheduler.itemsPerWorker must be at least 1");
        if (scheduler.minWorkers < 1 || scheduler.maxWorkers < scheduler.minWorkers)
            throw ConfigException("scheduler.minWorkers must be at least 1 and not greater than scheduler.maxWorkers");
        if (scheduler.sequentialThreshold < 0)
            throw ConfigException("scheduler.sequentialThreshold cannot be negative");
        if (scheduler.itemTimeoutMs <= 0 || scheduler.batchTimeoutMs <= 0)
            throw ConfigException("scheduler timeouts must be positive");
        if (scheduler.itemAttempts < 1)
            throw ConfigException("scheduler.itemAttempts must be at least 1");

        if (extractor.prefixBytes < 1024)
            throw ConfigException("extractor.prefixBytes must be at least 1024");
        if (extractor.altitudeTags.empty())
            throw ConfigException("extractor.altitudeTags cannot be empty");

        if (classifier.iqrMultiplier <= 0)
            throw ConfigException("classifier.iqrMultiplier must be positive");

        if (scene.groundMeshSize < 2)
            throw ConfigException("scene.groundMeshSize must be at least 2");

        for (const auto &c : categories)
        {
            if (c.key.empty())
                throw ConfigException("Category keys cannot be empty");
        }

        if (folderProbeTimeoutMs <= 0 || listTimeoutMs <= 0 || analysisTimeoutMs <= 0)
            throw ConfigException("timeouts must be positive");
    }

    json AnalysisConfig::toJson() const
    {
        json j;

        j["pool"] = {{"floor", pool.floor},
                     {"connectTimeoutMs", pool.connectTimeoutMs},
                     {"probeTimeoutMs", pool.probeTimeoutMs},
                     {"leaseTimeoutMs", pool.leaseTimeoutMs},
                     {"probePath", pool.probePath}};

        j["scheduler"] = {{"itemsPerWorker", scheduler.itemsPerWorker},
                          {"minWorkers", scheduler.minWorkers},
                          {"maxWorkers", scheduler.maxWorkers},
                          {"sequentialThreshold", scheduler.sequentialThreshold},
                          {"itemTimeoutMs", scheduler.itemTimeoutMs},
                          {"batchTimeoutMs", scheduler.batchTimeoutMs},
                          {"itemAttempts", scheduler.itemAttempts},
                          {"progressInterval", scheduler.progressInterval}};

        j["extractor"] = {{"prefixBytes", extractor.prefixBytes},
                          {"altitudeTags", extractor.altitudeTags}};

        j["classifier"] = {{"iqrMultiplier", classifier.iqrMultiplier}};

        j["scene"] = {{"groundOffsetFt", scene.groundOffsetFt},
                      {"minZMaxFt", scene.minZMaxFt},
                      {"groundMeshSize", scene.groundMeshSize},
                      {"groundColor", scene.groundColor},
                      {"outlierColor", scene.outlierColor}};

        json cats = json::array();
        for (const auto &c : categories)
        {
            cats.push_back({{"key", c.key}, {"color", c.color}, {"groundReference", c.groundReference}});
        }
        j["categories"] = cats;
        j["defaultCategoryColor"] = defaultCategoryColor;
        j["imageExtensions"] = imageExtensions;
        j["folderProbeTimeoutMs"] = folderProbeTimeoutMs;
        j["listTimeoutMs"] = listTimeoutMs;
        j["analysisTimeoutMs"] = analysisTimeoutMs;

        return j;
    }

    AnalysisConfig AnalysisConfig::fromJson(const json &j)
    {
        AnalysisConfig c;

        if (!j.is_object())
            throw ConfigException("Configuration must be a JSON object");

        try
        {
            if (j.contains("pool"))
            {
                const auto &p = j["pool"];
                c.pool.floor = p.value("floor", c.pool.floor);
                c.pool.connectTimeoutMs = p.value("connectTimeoutMs", c.pool.connectTimeoutMs);
                c.pool.probeTimeoutMs = p.value("probeTimeoutMs", c.pool.probeTimeoutMs);
                c.pool.leaseTimeoutMs = p.value("leaseTimeoutMs", c.pool.leaseTimeoutMs);
                c.pool.probePath = p.value("probePath", c.pool.probePath);
            }

            if (j.contains("scheduler"))
            {
                const auto &s = j["scheduler"];
                c.scheduler.itemsPerWorker = s.value("itemsPerWorker", c.scheduler.itemsPerWorker);
                c.scheduler.minWorkers = s.value("minWorkers", c.scheduler.minWorkers);
                c.scheduler.maxWorkers = s.value("maxWorkers", c.scheduler.maxWorkers);
                c.scheduler.sequentialThreshold = s.value("sequentialThreshold", c.scheduler.sequentialThreshold);
                c.scheduler.itemTimeoutMs = s.value("itemTimeoutMs", c.scheduler.itemTimeoutMs);
                c.scheduler.batchTimeoutMs = s.value("batchTimeoutMs", c.scheduler.batchTimeoutMs);
                c.scheduler.itemAttempts = s.value("itemAttempts", c.scheduler.itemAttempts);
                c.scheduler.progressInterval = s.value("progressInterval", c.scheduler.progressInterval);
            }

            if (j.contains("extractor"))
            {
                const auto &e = j["extractor"];
                c.extractor.prefixBytes = e.value("prefixBytes", c.extractor.prefixBytes);
                if (e.contains("altitudeTags"))
                    c.extractor.altitudeTags = e["altitudeTags"].get<std::vector<std::string>>();
            }

            if (j.contains("classifier"))
            {
                c.classifier.iqrMultiplier = j["classifier"].value("iqrMultiplier", c.classifier.iqrMultiplier);
            }

            if (j.contains("scene"))
            {
                const auto &s = j["scene"];
                c.scene.groundOffsetFt = s.value("groundOffsetFt", c.scene.groundOffsetFt);
                c.scene.minZMaxFt = s.value("minZMaxFt", c.scene.minZMaxFt);
                c.scene.groundMeshSize = s.value("groundMeshSize", c.scene.groundMeshSize);
                c.scene.groundColor = s.value("groundColor", c.scene.groundColor);
                c.scene.outlierColor = s.value("outlierColor", c.scene.outlierColor);
            }

            if (j.contains("categories"))
            {
                c.categories.clear();
                for (const auto &cat : j["categories"])
                {
                    std::string key = cat.at("key").get<std::string>();
                    utils::toLower(key);
                    c.categories.emplace_back(key,
                                              cat.value("color", std::string(DEFAULT_CATEGORY_COLOR)),
                                              cat.value("groundReference", false));
                }
            }

            c.defaultCategoryColor = j.value("defaultCategoryColor", c.defaultCategoryColor);
            if (j.contains("imageExtensions"))
                c.imageExtensions = j["imageExtensions"].get<std::vector<std::string>>();
            c.folderProbeTimeoutMs = j.value("folderProbeTimeoutMs", c.folderProbeTimeoutMs);
            c.listTimeoutMs = j.value("listTimeoutMs", c.listTimeoutMs);
            c.analysisTimeoutMs = j.value("analysisTimeoutMs", c.analysisTimeoutMs);
        }
        catch (const json::exception &e)
        {
            throw ConfigException(std::string("Invalid configuration: ") + e.what());
        }

        c.validate();
        return c;
    }

    AnalysisConfig AnalysisConfig::load(const std::string &filename)
    {
        std::ifstream f(filename);
        if (!f.is_open())
            throw FSException("Cannot open " + filename);

        json j;
        try
        {
            j = json::parse(f);
        }
        catch (const json::parse_error &e)
        {
            throw ConfigException("Cannot parse " + filename + ": " + e.what());
        }

        LOGD << "Loaded configuration from " << filename;
        return fromJson(j);
    }

}
