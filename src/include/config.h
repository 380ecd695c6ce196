/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef CONFIG_H
#define CONFIG_H

#include <string>
#include <vector>
#include "json.h"
#include "sqc_export.h"

namespace sqc
{

    struct PoolConfig
    {
        // Below this many live connections a batch runs sequentially
        int floor;
        int connectTimeoutMs;
        int probeTimeoutMs;
        int leaseTimeoutMs;
        std::string probePath;

        SQC_DLL PoolConfig();
    };

    struct SchedulerConfig
    {
        int itemsPerWorker;
        int minWorkers;
        int maxWorkers;
        int sequentialThreshold;
        int itemTimeoutMs;
        int batchTimeoutMs;
        int itemAttempts;
        int progressInterval;

        SQC_DLL SchedulerConfig();
    };

    struct ExtractorConfig
    {
        size_t prefixBytes;

        // First tag present wins
        std::vector<std::string> altitudeTags;

        SQC_DLL ExtractorConfig();
    };

    struct ClassifierConfig
    {
        double iqrMultiplier;

        SQC_DLL ClassifierConfig();
    };

    struct SceneConfig
    {
        double groundOffsetFt;
        double minZMaxFt;
        int groundMeshSize;
        std::string groundColor;
        std::string outlierColor;

        SQC_DLL SceneConfig();
    };

    struct Category
    {
        std::string key;
        std::string color;

        // Ground reference folders (civil, road) are never outliers,
        // never contribute to bounds and are not drawn
        bool groundReference;

        Category() : groundReference(false) {}
        Category(const std::string &key, const std::string &color, bool groundReference = false) : key(key), color(color), groundReference(groundReference) {}
    };

    struct AnalysisConfig
    {
        PoolConfig pool;
        SchedulerConfig scheduler;
        ExtractorConfig extractor;
        ClassifierConfig classifier;
        SceneConfig scene;

        // Matched in order against the lowercased folder name
        std::vector<Category> categories;
        std::string defaultCategoryColor;

        std::vector<std::string> imageExtensions;
        int folderProbeTimeoutMs;
        int listTimeoutMs;
        int analysisTimeoutMs;

        SQC_DLL AnalysisConfig();

        // Key of the first category contained in folderName, or "default"
        SQC_DLL std::string categoryFor(const std::string &folderName) const;
        SQC_DLL std::string colorFor(const std::string &category) const;
        SQC_DLL bool isGroundReference(const std::string &category) const;

        SQC_DLL void validate() const;

        SQC_DLL json toJson() const;

        // Missing keys keep their defaults
        SQC_DLL static AnalysisConfig fromJson(const json &j);
        SQC_DLL static AnalysisConfig load(const std::string &filename);
    };

}

#endif // CONFIG_H
