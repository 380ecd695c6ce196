/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include <atomic>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <thread>
#include "gtest/gtest.h"
#include "constants.h"
#include "exceptions.h"
#include "geotag.h"
#include "test.h"
#include "testimage.h"
#include "testsession.h"

namespace fs = std::filesystem;

namespace
{
    using namespace sqc;

    // Offset of the first byte after the APPn and COM segments of a JPEG
    size_t metadataEnd(const std::vector<uint8_t> &jpeg)
    {
        size_t pos = 2;
        while (pos + 4 <= jpeg.size() && jpeg[pos] == 0xFF &&
               ((jpeg[pos + 1] >= 0xE0 && jpeg[pos + 1] <= 0xEF) || jpeg[pos + 1] == 0xFE))
            pos += 2 + ((static_cast<size_t>(jpeg[pos + 2]) << 8) | jpeg[pos + 3]);
        return pos;
    }

    TEST(geotagExtractor, ExifGps)
    {
        GeotagExtractor extractor;
        auto tag = extractor.parse(TestImage(46.8423, -91.9941).build());

        ASSERT_TRUE(tag.has_value());
        EXPECT_NEAR(tag->latitude, 46.8423, 0.0000001);
        EXPECT_NEAR(tag->longitude, -91.9941, 0.0000001);

        // No altitude tag
        EXPECT_DOUBLE_EQ(tag->altitudeFt, 0.0);
        EXPECT_TRUE(tag->altitudeSource.empty());
        EXPECT_DOUBLE_EQ(tag->captureTime, 0.0);
    }

    TEST(geotagExtractor, SouthernHemisphere)
    {
        GeotagExtractor extractor;
        auto tag = extractor.parse(TestImage(-33.8688, 151.2093).build());

        ASSERT_TRUE(tag.has_value());
        EXPECT_NEAR(tag->latitude, -33.8688, 0.0000001);
        EXPECT_NEAR(tag->longitude, 151.2093, 0.0000001);
    }

    TEST(geotagExtractor, RelativeAltitudeWins)
    {
        TestImage img(46.8423, -91.9941);
        img.relativeAltitude = true;
        img.relativeAltitudeMeters = 45.2;
        img.gpsAltitude = true;
        img.altitudeMeters = 312.5;

        auto tag = GeotagExtractor().parse(img.build());
        ASSERT_TRUE(tag.has_value());
        EXPECT_NEAR(tag->altitudeFt, 45.2 * METERS_TO_FEET, 0.001);
        EXPECT_EQ(tag->altitudeSource, "Xmp.drone-dji.RelativeAltitude");
    }

    TEST(geotagExtractor, GpsAltitudeFallback)
    {
        TestImage img(46.8423, -91.9941);
        img.gpsAltitude = true;
        img.altitudeMeters = 100.0;

        auto tag = GeotagExtractor().parse(img.build());
        ASSERT_TRUE(tag.has_value());
        EXPECT_NEAR(tag->altitudeFt, 328.084, 0.001);
        EXPECT_EQ(tag->altitudeSource, "Exif.GPSInfo.GPSAltitude");

        img.altitudeMeters = -10.0;
        tag = GeotagExtractor().parse(img.build());
        ASSERT_TRUE(tag.has_value());
        EXPECT_NEAR(tag->altitudeFt, -32.8084, 0.001);
    }

    TEST(geotagExtractor, AltitudeTagsAreConfigurable)
    {
        TestImage img(46.8423, -91.9941);
        img.relativeAltitude = true;
        img.relativeAltitudeMeters = 45.2;
        img.gpsAltitude = true;
        img.altitudeMeters = 312.5;

        ExtractorConfig config;
        config.altitudeTags = {"Exif.GPSInfo.GPSAltitude"};

        auto tag = GeotagExtractor(config).parse(img.build());
        ASSERT_TRUE(tag.has_value());
        EXPECT_NEAR(tag->altitudeFt, 312.5 * METERS_TO_FEET, 0.001);
    }

    TEST(geotagExtractor, XmpLocationFallback)
    {
        TestImage img(40.7128, -74.006);
        img.gps = false;
        img.xmpLocation = true;

        auto tag = GeotagExtractor().parse(img.build());
        ASSERT_TRUE(tag.has_value());
        EXPECT_NEAR(tag->latitude, 40.7128, 0.0000001);
        EXPECT_NEAR(tag->longitude, -74.006, 0.0000001);
    }

    TEST(geotagExtractor, CaptureTime)
    {
        TestImage img(46.8423, -91.9941);
        img.dateTimeOriginal = "2025:08:20 14:30:00";

        auto tag = GeotagExtractor().parse(img.build());
        ASSERT_TRUE(tag.has_value());
        EXPECT_DOUBLE_EQ(tag->captureTime, 1755700200000.0);

        img.offsetTimeOriginal = "-05:00";
        tag = GeotagExtractor().parse(img.build());
        ASSERT_TRUE(tag.has_value());
        EXPECT_DOUBLE_EQ(tag->captureTime, 1755718200000.0);
    }

    TEST(geotagExtractor, NoGeotag)
    {
        GeotagExtractor extractor;

        TestImage noGps;
        noGps.gps = false;
        EXPECT_FALSE(extractor.parse(noGps.build()).has_value());

        // Out of range
        EXPECT_FALSE(extractor.parse(TestImage(95.0, 10.0).build()).has_value());
    }

    TEST(geotagExtractor, MalformedInput)
    {
        GeotagExtractor extractor;

        EXPECT_FALSE(extractor.parse(std::vector<uint8_t>()).has_value());
        EXPECT_FALSE(extractor.parse(nullptr, 10).has_value());
        EXPECT_FALSE(extractor.parse(std::vector<uint8_t>(1024, 0xAB)).has_value());

        // Truncated inside the metadata
        const auto jpeg = TestImage(46.8423, -91.9941).build();
        for (size_t n : {size_t(2), size_t(4), size_t(32), jpeg.size() / 2})
        {
            std::vector<uint8_t> prefix(jpeg.begin(), jpeg.begin() + n);
            EXPECT_NO_THROW(extractor.parse(prefix));
        }
    }

    TEST(geotagExtractor, ExtractFromSession)
    {
        auto remote = std::make_shared<TestRemote>();
        remote->addFile("/site/orbit/DJI_0001.JPG", TestImage(46.8423, -91.9941).build());
        TestSession session(remote);

        GeotagExtractor extractor;
        auto tag = extractor.extract(session, WorkItem("orbit", "/site/orbit/DJI_0001.JPG", "DJI_0001.JPG"), 1000);

        ASSERT_TRUE(tag.has_value());
        EXPECT_EQ(tag->folder, "orbit");
        EXPECT_EQ(tag->filename, "DJI_0001.JPG");
        EXPECT_EQ(tag->path, "/site/orbit/DJI_0001.JPG");

        EXPECT_THROW(extractor.extract(session, WorkItem("orbit", "/site/orbit/missing.JPG", "missing.JPG"), 1000), RemoteFileException);

        remote->setReadDelay(500, true);
        EXPECT_THROW(extractor.extract(session, WorkItem("orbit", "/site/orbit/DJI_0001.JPG", "DJI_0001.JPG"), 50), RemoteTimeoutException);
    }

    TEST(geotagExtractor, LargeFileReadsOnlyPrefix)
    {
        std::vector<uint8_t> file = TestImage(46.8423, -91.9941).build();
        file.insert(file.end(), static_cast<size_t>(4 * DEFAULT_PREFIX_BYTES), uint8_t(0x5A));

        auto remote = std::make_shared<TestRemote>();
        remote->addFile("/site/scan/DJI_0003.JPG", file);
        TestSession session(remote);

        GeotagExtractor extractor;
        auto tag = extractor.extract(session, WorkItem("scan", "/site/scan/DJI_0003.JPG", "DJI_0003.JPG"), 1000);

        ASSERT_TRUE(tag.has_value());
        EXPECT_NEAR(tag->latitude, 46.8423, 0.0000001);
        EXPECT_NEAR(tag->longitude, -91.9941, 0.0000001);

        EXPECT_EQ(remote->largestRead.load(), static_cast<size_t>(DEFAULT_PREFIX_BYTES));
        EXPECT_EQ(remote->bytesServed.load(), static_cast<size_t>(DEFAULT_PREFIX_BYTES));
        EXPECT_LT(remote->bytesServed.load(), file.size());
    }

    TEST(geotagExtractor, PrefixEndingAfterMetadata)
    {
        TestImage img(46.8423, -91.9941);
        img.relativeAltitude = true;
        img.relativeAltitudeMeters = 45.2;
        const auto jpeg = img.build();

        const size_t end = metadataEnd(jpeg);
        ASSERT_GT(end, size_t(2));
        ASSERT_LT(end + 4, jpeg.size());

        auto remote = std::make_shared<TestRemote>();
        remote->addFile("/site/orbit/DJI_0004.JPG", jpeg);
        TestSession session(remote);

        // The read stops a few bytes into the image data
        ExtractorConfig config;
        config.prefixBytes = end + 4;
        auto tag = GeotagExtractor(config).extract(session, WorkItem("orbit", "/site/orbit/DJI_0004.JPG", "DJI_0004.JPG"), 1000);

        ASSERT_TRUE(tag.has_value());
        EXPECT_NEAR(tag->latitude, 46.8423, 0.0000001);
        EXPECT_NEAR(tag->longitude, -91.9941, 0.0000001);
        EXPECT_NEAR(tag->altitudeFt, 45.2 * METERS_TO_FEET, 0.001);
        EXPECT_EQ(remote->largestRead.load(), end + 4);
    }

    TEST(geotagExtractor, ConcurrentXmpDecoding)
    {
        TestImage img(46.8423, -91.9941);
        img.relativeAltitude = true;
        img.relativeAltitudeMeters = 30.5;
        img.xmpLocation = true;
        const auto jpeg = img.build();

        const GeotagExtractor extractor;
        std::atomic<int> decoded(0);
        std::vector<std::thread> threads;
        for (int t = 0; t < 16; t++)
        {
            threads.emplace_back([&]() {
                for (int i = 0; i < 25; i++)
                {
                    auto tag = extractor.parse(jpeg);
                    if (tag && std::abs(tag->altitudeFt - 30.5 * METERS_TO_FEET) < 0.001)
                        decoded++;
                }
            });
        }
        for (auto &t : threads)
            t.join();

        EXPECT_EQ(decoded.load(), 16 * 25);
    }

    TEST(geotagExtractor, ExtractFile)
    {
        const fs::path dir = fs::temp_directory_path() / "sqc_test" / TEST_NAME;
        fs::create_directories(dir);
        const fs::path file = dir / "DJI_0002.JPG";

        const auto jpeg = TestImage(46.8423, -91.9941).build();
        {
            std::ofstream out(file.string(), std::ios::binary | std::ios::trunc);
            out.write(reinterpret_cast<const char *>(jpeg.data()), static_cast<std::streamsize>(jpeg.size()));
        }

        GeotagExtractor extractor;
        auto tag = extractor.extractFile(file.string());
        ASSERT_TRUE(tag.has_value());
        EXPECT_EQ(tag->filename, "DJI_0002.JPG");
        EXPECT_NEAR(tag->latitude, 46.8423, 0.0000001);

        EXPECT_THROW(extractor.extractFile((dir / "nonexistant.JPG").string()), FSException);

        fs::remove_all(dir);
    }

    TEST(geoTag, ToJSON)
    {
        GeoTag t;
        t.folder = "orbit";
        t.filename = "a.jpg";
        t.path = "/site/orbit/a.jpg";
        t.latitude = 46.5;
        t.longitude = -91.5;
        t.altitudeFt = 150;

        json j = t.toJSON();
        EXPECT_EQ(j["folder"], "orbit");
        EXPECT_EQ(j["latitude"], 46.5);
        EXPECT_EQ(j["altitude"], 150.0);
        EXPECT_TRUE(j["timestamp"].is_null());
        EXPECT_FALSE(j.contains("altitudeSource"));

        t.captureTime = 1000;
        EXPECT_EQ(t.toJSON()["timestamp"], 1000.0);
    }

    TEST(getUTCEpoch, Basic)
    {
        const auto utc = cctz::utc_time_zone();
        EXPECT_DOUBLE_EQ(getUTCEpoch(1970, 1, 1, 0, 0, 1, 0, utc), 1000.0);
        EXPECT_DOUBLE_EQ(getUTCEpoch(1970, 1, 1, 0, 0, 1, 250, utc), 1250.0);

        const auto plus2 = cctz::fixed_time_zone(std::chrono::hours(2));
        EXPECT_DOUBLE_EQ(getUTCEpoch(1970, 1, 1, 2, 0, 0, 0, plus2), 0.0);
    }

}
