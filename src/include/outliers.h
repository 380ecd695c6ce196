/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef OUTLIERS_H
#define OUTLIERS_H

#include <string>
#include <vector>
#include "config.h"
#include "json.h"
#include "siteanalysis.h"
#include "sqc_export.h"

namespace sqc
{

    struct ClassifiedPoint
    {
        double latitude;
        double longitude;
        double altitudeFt;
        std::string folder;
        std::string filename;
        std::string category;

        // Whether the point takes part in the bounds (not ground reference)
        bool eligible;
        bool outlier;

        ClassifiedPoint() : latitude(0), longitude(0), altitudeFt(0), eligible(true), outlier(false) {}

        SQC_DLL json toJSON() const;
    };

    struct AxisBounds
    {
        double q1 = 0;
        double q3 = 0;
        double lower = 0;
        double upper = 0;

        double iqr() const { return q3 - q1; }
        bool contains(double v) const { return v >= lower && v <= upper; }
    };

    struct OutlierBounds
    {
        AxisBounds latitude;
        AxisBounds longitude;
        size_t eligibleCount = 0;

        // False when there were too few eligible points to classify
        bool valid = false;

        SQC_DLL json toJSON() const;
    };

    // Linear interpolation between closest ranks (p in [0, 100])
    SQC_DLL double percentile(std::vector<double> values, double p);

    class OutlierClassifier
    {
        ClassifierConfig config;

    public:
        SQC_DLL explicit OutlierClassifier(const ClassifierConfig &config = ClassifierConfig());

        // Flattens the geotags of all folders, tagged with their category
        SQC_DLL static std::vector<ClassifiedPoint> collectPoints(const SiteAnalysis &analysis, const AnalysisConfig &config);

        SQC_DLL OutlierBounds computeBounds(const std::vector<ClassifiedPoint> &points) const;

        // Sets the outlier flag of every point. Ground reference points are
        // always inliers. Returns the bounds that were applied.
        SQC_DLL OutlierBounds classify(std::vector<ClassifiedPoint> &points) const;
    };

}

#endif // OUTLIERS_H
