/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "outliers.h"

#include <algorithm>
#include <cmath>

#include "exceptions.h"
#include "logger.h"

namespace sqc
{

    json ClassifiedPoint::toJSON() const
    {
        json j;
        j["latitude"] = latitude;
        j["longitude"] = longitude;
        j["altitude"] = altitudeFt;
        j["folder"] = folder;
        j["filename"] = filename;
        j["category"] = category;
        j["eligible"] = eligible;
        j["outlier"] = outlier;
        return j;
    }

    json OutlierBounds::toJSON() const
    {
        json j;
        j["valid"] = valid;
        j["eligible"] = eligibleCount;
        if (valid)
        {
            j["latitude"] = {{"q1", latitude.q1}, {"q3", latitude.q3}, {"low", latitude.lower}, {"high", latitude.upper}};
            j["longitude"] = {{"q1", longitude.q1}, {"q3", longitude.q3}, {"low", longitude.lower}, {"high", longitude.upper}};
        }
        return j;
    }

    double percentile(std::vector<double> values, double p)
    {
        if (values.empty())
            throw InvalidArgsException("Cannot compute the percentile of an empty set");
        if (p < 0.0 || p > 100.0)
            throw InvalidArgsException("Percentile must be between 0 and 100");

        std::sort(values.begin(), values.end());

        const double pos = (p / 100.0) * static_cast<double>(values.size() - 1);
        const size_t lo = static_cast<size_t>(std::floor(pos));
        const size_t hi = static_cast<size_t>(std::ceil(pos));

        return values[lo] + (values[hi] - values[lo]) * (pos - static_cast<double>(lo));
    }

    OutlierClassifier::OutlierClassifier(const ClassifierConfig &config) : config(config)
    {
    }

    std::vector<ClassifiedPoint> OutlierClassifier::collectPoints(const SiteAnalysis &analysis, const AnalysisConfig &config)
    {
        std::vector<ClassifiedPoint> points;
        points.reserve(analysis.gpsCount());

        for (const auto &f : analysis.folders)
        {
            const FolderReport &folder = f.second;
            const std::string category = folder.category.empty() ? config.categoryFor(folder.name) : folder.category;
            const bool eligible = !config.isGroundReference(category);

            for (const auto &r : folder.results)
            {
                ClassifiedPoint p;
                p.latitude = r.latitude;
                p.longitude = r.longitude;
                p.altitudeFt = r.altitudeFt;
                p.folder = folder.name;
                p.filename = r.filename;
                p.category = category;
                p.eligible = eligible;
                points.push_back(p);
            }
        }

        return points;
    }

    OutlierBounds OutlierClassifier::computeBounds(const std::vector<ClassifiedPoint> &points) const
    {
        OutlierBounds b;

        std::vector<double> lats, lons;
        for (const auto &p : points)
        {
            if (!p.eligible)
                continue;
            lats.push_back(p.latitude);
            lons.push_back(p.longitude);
        }

        b.eligibleCount = lats.size();
        if (lats.size() < 2)
            return b;

        const double m = config.iqrMultiplier;

        b.latitude.q1 = percentile(lats, 25);
        b.latitude.q3 = percentile(lats, 75);
        b.latitude.lower = b.latitude.q1 - m * b.latitude.iqr();
        b.latitude.upper = b.latitude.q3 + m * b.latitude.iqr();

        b.longitude.q1 = percentile(lons, 25);
        b.longitude.q3 = percentile(lons, 75);
        b.longitude.lower = b.longitude.q1 - m * b.longitude.iqr();
        b.longitude.upper = b.longitude.q3 + m * b.longitude.iqr();

        b.valid = true;
        return b;
    }

    OutlierBounds OutlierClassifier::classify(std::vector<ClassifiedPoint> &points) const
    {
        const OutlierBounds b = computeBounds(points);

        size_t outliers = 0;
        for (auto &p : points)
        {
            p.outlier = b.valid && p.eligible &&
                        !(b.latitude.contains(p.latitude) && b.longitude.contains(p.longitude));
            if (p.outlier)
                outliers++;
        }

        if (b.valid)
            LOGD << "Classified " << points.size() << " points: " << outliers << " outliers";
        else
            LOGD << "Only " << b.eligibleCount << " eligible points, skipping outlier detection";

        return b;
    }

}
