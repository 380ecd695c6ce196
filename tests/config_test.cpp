/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include <filesystem>
#include <fstream>
#include "gtest/gtest.h"
#include "config.h"
#include "exceptions.h"
#include "test.h"

namespace fs = std::filesystem;

namespace
{
    using namespace sqc;

    fs::path writeFile(const std::string &name, const std::string &contents)
    {
        const fs::path dir = fs::temp_directory_path() / "sqc_test" / TEST_NAME;
        fs::create_directories(dir);
        const fs::path p = dir / name;
        std::ofstream out(p.string(), std::ios::trunc);
        out << contents;
        return p;
    }

    TEST(analysisConfig, Defaults)
    {
        AnalysisConfig c;
        EXPECT_NO_THROW(c.validate());

        EXPECT_EQ(c.pool.floor, 5);
        EXPECT_EQ(c.scheduler.itemsPerWorker, 10);
        EXPECT_EQ(c.scheduler.minWorkers, 10);
        EXPECT_EQ(c.scheduler.maxWorkers, 20);
        EXPECT_EQ(c.scheduler.sequentialThreshold, 5);
        EXPECT_EQ(c.extractor.prefixBytes, 65536);
        EXPECT_DOUBLE_EQ(c.classifier.iqrMultiplier, 4.0);
        EXPECT_DOUBLE_EQ(c.scene.groundOffsetFt, 20.0);
        EXPECT_EQ(c.extractor.altitudeTags.front(), "Xmp.drone-dji.RelativeAltitude");
    }

    TEST(analysisConfig, Categories)
    {
        AnalysisConfig c;
        EXPECT_EQ(c.categoryFor("Orbit_01"), "orbit");
        EXPECT_EQ(c.categoryFor("north SCAN"), "scan");
        EXPECT_EQ(c.categoryFor("Civil Survey"), "civil");
        EXPECT_EQ(c.categoryFor("misc"), "default");
        EXPECT_EQ(c.categoryFor("\xC3\x89tage Orbit"), "orbit");
        EXPECT_EQ(c.categoryFor("\xC3\xA9l\xC3\xA9vation"), "default");

        EXPECT_TRUE(c.isGroundReference("civil"));
        EXPECT_TRUE(c.isGroundReference("road"));
        EXPECT_FALSE(c.isGroundReference("orbit"));
        EXPECT_FALSE(c.isGroundReference("default"));

        EXPECT_EQ(c.colorFor("default"), c.defaultCategoryColor);
        EXPECT_NE(c.colorFor("orbit"), c.colorFor("scan"));
    }

    TEST(analysisConfig, PartialJsonKeepsDefaults)
    {
        json j = json::parse(R"({
            "scheduler": {"itemTimeoutMs": 5000},
            "classifier": {"iqrMultiplier": 2.5},
            "categories": [{"key": "TOWER", "color": "#ffffff"}, {"key": "pad", "groundReference": true}]
        })");

        AnalysisConfig c = AnalysisConfig::fromJson(j);
        EXPECT_EQ(c.scheduler.itemTimeoutMs, 5000);
        EXPECT_EQ(c.scheduler.batchTimeoutMs, 300000);
        EXPECT_DOUBLE_EQ(c.classifier.iqrMultiplier, 2.5);
        EXPECT_EQ(c.pool.floor, 5);

        ASSERT_EQ(c.categories.size(), 2);
        EXPECT_EQ(c.categoryFor("Tower_East"), "tower");
        EXPECT_EQ(c.colorFor("tower"), "#ffffff");
        EXPECT_TRUE(c.isGroundReference("pad"));
        EXPECT_EQ(c.categoryFor("orbit"), "default");
    }

    TEST(analysisConfig, RoundTrip)
    {
        AnalysisConfig c;
        c.scheduler.maxWorkers = 32;
        c.scene.groundColor = "#123456";

        AnalysisConfig d = AnalysisConfig::fromJson(c.toJson());
        EXPECT_EQ(d.toJson(), c.toJson());
    }

    TEST(analysisConfig, Invalid)
    {
        EXPECT_THROW(AnalysisConfig::fromJson(json::array()), ConfigException);
        EXPECT_THROW(AnalysisConfig::fromJson(json::parse(R"({"scheduler": {"minWorkers": "ten"}})")), ConfigException);
        EXPECT_THROW(AnalysisConfig::fromJson(json::parse(R"({"scheduler": {"minWorkers": 30}})")), ConfigException);
        EXPECT_THROW(AnalysisConfig::fromJson(json::parse(R"({"extractor": {"prefixBytes": 100}})")), ConfigException);
        EXPECT_THROW(AnalysisConfig::fromJson(json::parse(R"({"classifier": {"iqrMultiplier": 0}})")), ConfigException);
        EXPECT_THROW(AnalysisConfig::fromJson(json::parse(R"({"categories": [{"color": "red"}]})")), ConfigException);

        AnalysisConfig c;
        c.scene.groundMeshSize = 1;
        EXPECT_THROW(c.validate(), ConfigException);
    }

    TEST(analysisConfig, Load)
    {
        const fs::path good = writeFile("settings.json", R"({"pool": {"floor": 3}})");
        EXPECT_EQ(AnalysisConfig::load(good.string()).pool.floor, 3);

        const fs::path bad = writeFile("bad.json", "{ not json");
        EXPECT_THROW(AnalysisConfig::load(bad.string()), ConfigException);

        EXPECT_THROW(AnalysisConfig::load((good.parent_path() / "missing.json").string()), FSException);

        fs::remove_all(good.parent_path());
    }

}
