/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef SCENE_H
#define SCENE_H

#include <string>
#include <vector>
#include "config.h"
#include "json.h"
#include "outliers.h"
#include "siteanalysis.h"
#include "sqc_export.h"

namespace sqc
{

    struct MarkerStyle
    {
        double size = 6;
        std::string color;
        std::string symbol = "circle";
        double opacity = 1.0;
    };

    // A marker series: x = longitude, y = latitude, z = altitude (ft)
    struct SceneTrace
    {
        std::string name;
        std::string folder;
        std::string category;
        std::vector<double> x;
        std::vector<double> y;
        std::vector<double> z;
        std::vector<std::string> text;
        MarkerStyle marker;
        bool outliers = false;

        size_t size() const { return x.size(); }

        SQC_DLL json toJSON() const;
    };

    struct GroundPlane
    {
        std::vector<double> x; // mesh longitudes
        std::vector<double> y; // mesh latitudes
        double z = 0;
        std::string color;
        bool visible = false;

        SQC_DLL json toJSON() const;
    };

    struct AxisRange
    {
        double min = 0;
        double max = 0;
    };

    struct Scene
    {
        std::string title;
        std::vector<SceneTrace> traces;
        GroundPlane ground;
        AxisRange x;
        AxisRange y;
        AxisRange z;
        double eye[3] = {1.5, 1.5, 1.2};
        std::string theme = "plotly_dark";

        // No eligible inliers: nothing to draw
        bool empty = true;

        // Plotly figure ({"data": [...], "layout": {...}})
        SQC_DLL json toJson() const;
    };

    class SceneBuilder
    {
        AnalysisConfig config;

    public:
        SQC_DLL explicit SceneBuilder(const AnalysisConfig &config);

        // points must already be classified
        SQC_DLL Scene build(const SiteAnalysis &analysis, const std::vector<ClassifiedPoint> &points) const;
    };

}

#endif // SCENE_H
