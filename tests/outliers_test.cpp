/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "gtest/gtest.h"
#include "exceptions.h"
#include "outliers.h"
#include "test.h"

namespace
{
    using namespace sqc;

    ClassifiedPoint point(double latitude, double longitude, const std::string &folder = "orbit", bool eligible = true)
    {
        ClassifiedPoint p;
        p.latitude = latitude;
        p.longitude = longitude;
        p.folder = folder;
        p.category = folder;
        p.eligible = eligible;
        return p;
    }

    // 9 points a few meters apart, plus one ~70 km north
    std::vector<ClassifiedPoint> clusterWithOutlier()
    {
        std::vector<ClassifiedPoint> points;
        for (int i = 0; i < 9; i++)
            points.push_back(point(46.8400 + i * 0.0001, -91.9900 + i * 0.0001));
        points.push_back(point(47.5, -91.9900));
        return points;
    }

    GeoTag geotag(double latitude, double longitude, const std::string &filename)
    {
        GeoTag t;
        t.latitude = latitude;
        t.longitude = longitude;
        t.filename = filename;
        return t;
    }

    TEST(percentile, Linear)
    {
        const std::vector<double> v = {4, 1, 3, 2};
        EXPECT_DOUBLE_EQ(percentile(v, 0), 1.0);
        EXPECT_DOUBLE_EQ(percentile(v, 25), 1.75);
        EXPECT_DOUBLE_EQ(percentile(v, 50), 2.5);
        EXPECT_DOUBLE_EQ(percentile(v, 75), 3.25);
        EXPECT_DOUBLE_EQ(percentile(v, 100), 4.0);

        EXPECT_DOUBLE_EQ(percentile({7}, 25), 7.0);
    }

    TEST(percentile, InvalidArgs)
    {
        EXPECT_THROW(percentile({}, 50), InvalidArgsException);
        EXPECT_THROW(percentile({1, 2}, -1), InvalidArgsException);
        EXPECT_THROW(percentile({1, 2}, 100.5), InvalidArgsException);
    }

    TEST(outlierClassifier, FlagsDistantPoint)
    {
        auto points = clusterWithOutlier();
        OutlierBounds b = OutlierClassifier().classify(points);

        ASSERT_TRUE(b.valid);
        EXPECT_EQ(b.eligibleCount, 10);
        EXPECT_NEAR(b.latitude.q1, 46.840225, 1e-9);
        EXPECT_NEAR(b.latitude.q3, 46.840675, 1e-9);
        EXPECT_NEAR(b.latitude.upper, 46.840675 + 4.0 * 0.00045, 1e-9);

        for (size_t i = 0; i < 9; i++)
            EXPECT_FALSE(points[i].outlier) << i;
        EXPECT_TRUE(points[9].outlier);
    }

    TEST(outlierClassifier, MultiplierChangesSensitivity)
    {
        auto points = clusterWithOutlier();
        points.push_back(point(46.8420, -91.9900));

        ClassifierConfig loose;
        OutlierClassifier(loose).classify(points);
        EXPECT_FALSE(points[10].outlier);

        ClassifierConfig strict;
        strict.iqrMultiplier = 1.0;
        OutlierClassifier(strict).classify(points);
        EXPECT_TRUE(points[10].outlier);
        EXPECT_TRUE(points[9].outlier);
    }

    TEST(outlierClassifier, Deterministic)
    {
        auto a = clusterWithOutlier();
        auto b = clusterWithOutlier();
        OutlierClassifier c;

        c.classify(a);
        c.classify(b);
        c.classify(b);

        for (size_t i = 0; i < a.size(); i++)
            EXPECT_EQ(a[i].outlier, b[i].outlier);
    }

    TEST(outlierClassifier, GroundReferenceIsNeverOutlier)
    {
        auto points = clusterWithOutlier();
        points.push_back(point(48.0, -90.0, "civil", false));

        OutlierBounds b = OutlierClassifier().classify(points);
        EXPECT_EQ(b.eligibleCount, 10);
        EXPECT_FALSE(points.back().outlier);

        // Bounds are the same as without it
        auto plain = clusterWithOutlier();
        OutlierBounds pb = OutlierClassifier().classify(plain);
        EXPECT_DOUBLE_EQ(b.latitude.upper, pb.latitude.upper);
        EXPECT_DOUBLE_EQ(b.longitude.lower, pb.longitude.lower);
    }

    TEST(outlierClassifier, TooFewPoints)
    {
        std::vector<ClassifiedPoint> none;
        EXPECT_FALSE(OutlierClassifier().classify(none).valid);

        std::vector<ClassifiedPoint> one = {point(46.84, -91.99), point(10, 10, "road", false)};
        OutlierBounds b = OutlierClassifier().classify(one);
        EXPECT_FALSE(b.valid);
        EXPECT_EQ(b.eligibleCount, 1);
        EXPECT_FALSE(one[0].outlier);
        EXPECT_FALSE(one[1].outlier);

        EXPECT_FALSE(b.toJSON().contains("latitude"));
    }

    TEST(outlierClassifier, IdenticalPoints)
    {
        std::vector<ClassifiedPoint> points(8, point(46.84, -91.99));
        OutlierBounds b = OutlierClassifier().classify(points);

        EXPECT_TRUE(b.valid);
        EXPECT_DOUBLE_EQ(b.latitude.iqr(), 0.0);
        for (const auto &p : points)
            EXPECT_FALSE(p.outlier);
    }

    TEST(outlierClassifier, CollectPoints)
    {
        AnalysisConfig config;
        SiteAnalysis a;

        FolderReport orbit;
        orbit.name = "orbit";
        orbit.category = "orbit";
        orbit.results.push_back(geotag(46.84, -91.99, "a.jpg"));
        orbit.results.push_back(geotag(46.85, -91.98, "b.jpg"));
        a.folders["orbit"] = orbit;

        FolderReport road;
        road.name = "Road_East";
        road.results.push_back(geotag(46.9, -91.9, "c.jpg"));
        a.folders["Road_East"] = road;

        auto points = OutlierClassifier::collectPoints(a, config);
        ASSERT_EQ(points.size(), 3);

        // Folders are visited in name order
        EXPECT_EQ(points[0].folder, "Road_East");
        EXPECT_EQ(points[0].category, "road");
        EXPECT_FALSE(points[0].eligible);
        EXPECT_EQ(points[1].filename, "a.jpg");
        EXPECT_TRUE(points[1].eligible);
        EXPECT_FALSE(points[1].outlier);
    }

}
