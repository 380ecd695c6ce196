/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "scene.h"

#include <algorithm>
#include <limits>

#include "logger.h"
#include "utils.h"

namespace sqc
{

    namespace
    {
        std::vector<double> linspace(double from, double to, int count)
        {
            std::vector<double> res;
            if (count < 2)
            {
                res.push_back(from);
                return res;
            }

            res.reserve(count);
            const double step = (to - from) / static_cast<double>(count - 1);
            for (int i = 0; i < count; i++)
                res.push_back(from + step * i);

            // No rounding drift on the last value
            res.back() = to;
            return res;
        }

        json axisJSON(const std::string &title, const AxisRange &range)
        {
            return {{"title", title},
                    {"gridcolor", "gray"},
                    {"zerolinecolor", "gray"},
                    {"tickfont", {{"color", "#e0e0e0"}}},
                    {"autorange", false},
                    {"range", {range.min, range.max}}};
        }
    }

    json SceneTrace::toJSON() const
    {
        json j;
        j["type"] = "scatter3d";
        j["mode"] = "markers";
        j["name"] = name;
        j["x"] = x;
        j["y"] = y;
        j["z"] = z;
        j["text"] = text;

        json m;
        m["size"] = marker.size;
        m["color"] = marker.color;
        m["symbol"] = marker.symbol;
        m["opacity"] = marker.opacity;
        if (outliers)
            m["line"] = {{"width", 2}};
        j["marker"] = m;

        if (outliers)
        {
            j["hovertemplate"] = "%{text}<extra>(OUTLIER)</extra>";
            j["showlegend"] = false;
        }
        else
        {
            j["hovertemplate"] = "%{text}<extra></extra>";
            j["showlegend"] = true;
            j["legendgroup"] = folder;
        }

        return j;
    }

    json GroundPlane::toJSON() const
    {
        json j;
        j["type"] = "surface";
        j["name"] = "Ground";
        j["x"] = x;
        j["y"] = y;

        json rows = json::array();
        for (size_t i = 0; i < y.size(); i++)
            rows.push_back(std::vector<double>(x.size(), z));
        j["z"] = rows;

        j["colorscale"] = {{0, color}, {1, color}};
        j["showscale"] = false;
        j["opacity"] = 1.0;
        j["hoverinfo"] = "skip";
        return j;
    }

    json Scene::toJson() const
    {
        json data = json::array();
        if (ground.visible)
            data.push_back(ground.toJSON());
        for (const auto &t : traces)
            data.push_back(t.toJSON());

        json layout;
        layout["title"] = {{"text", title},
                           {"x", 0.12},
                           {"xanchor", "left"},
                           {"font", {{"size", 20}, {"color", "#e0e0e0"}}}};
        layout["template"] = theme;
        layout["showlegend"] = true;
        layout["height"] = 800;
        layout["margin"] = {{"l", 0}, {"r", 0}, {"b", 0}, {"t", 80}};
        layout["legend"] = {{"orientation", "v"},
                            {"x", 0},
                            {"y", 1},
                            {"font", {{"size", 12}}},
                            {"bgcolor", "rgba(0,0,0,0)"}};

        if (!empty)
        {
            layout["scene"] = {{"xaxis", axisJSON("Longitude", x)},
                               {"yaxis", axisJSON("Latitude", y)},
                               {"zaxis", axisJSON("Height Above Drone Takeoff", z)},
                               {"bgcolor", "black"},
                               {"camera", {{"eye", {{"x", eye[0]}, {"y", eye[1]}, {"z", eye[2]}}}}}};
        }

        json j;
        j["data"] = data;
        j["layout"] = layout;
        j["empty"] = empty;
        return j;
    }

    SceneBuilder::SceneBuilder(const AnalysisConfig &config) : config(config)
    {
    }

    Scene SceneBuilder::build(const SiteAnalysis &analysis, const std::vector<ClassifiedPoint> &points) const
    {
        Scene scene;
        scene.title = "Site " + analysis.site.siteId + " - Pilot: " + analysis.site.pilot;

        double latMin = std::numeric_limits<double>::max(), latMax = std::numeric_limits<double>::lowest();
        double lonMin = latMin, lonMax = latMax;
        double altMin = latMin, altMax = latMax;
        size_t inliers = 0;

        for (const auto &p : points)
        {
            if (!p.eligible || p.outlier)
                continue;

            const double agl = std::max(p.altitudeFt, 0.0);
            latMin = std::min(latMin, p.latitude);
            latMax = std::max(latMax, p.latitude);
            lonMin = std::min(lonMin, p.longitude);
            lonMax = std::max(lonMax, p.longitude);
            altMin = std::min(altMin, agl);
            altMax = std::max(altMax, agl);
            inliers++;
        }

        if (inliers == 0)
        {
            LOGD << "No GPS data to draw";
            return scene;
        }

        scene.empty = false;
        scene.x = {lonMin, lonMax};
        scene.y = {latMin, latMax};

        const double groundZ = altMin - config.scene.groundOffsetFt;
        const double zMax = std::max(altMax, config.scene.minZMaxFt);
        scene.z = {groundZ, zMax};

        if (zMax > groundZ)
        {
            scene.ground.x = linspace(lonMin, lonMax, config.scene.groundMeshSize);
            scene.ground.y = linspace(latMin, latMax, config.scene.groundMeshSize);
            scene.ground.z = groundZ;
            scene.ground.color = config.scene.groundColor;
            scene.ground.visible = true;
        }

        for (const auto &f : analysis.folders)
        {
            const FolderReport &folder = f.second;
            const std::string category = folder.category.empty() ? config.categoryFor(folder.name) : folder.category;
            if (config.isGroundReference(category))
                continue;

            SceneTrace t;
            t.folder = folder.name;
            t.category = category;
            t.marker.size = 6;
            t.marker.color = config.colorFor(category);
            t.marker.opacity = 0.95;

            for (const auto &p : points)
            {
                if (p.folder != folder.name || p.outlier || !p.eligible)
                    continue;
                t.x.push_back(p.longitude);
                t.y.push_back(p.latitude);
                t.z.push_back(p.altitudeFt);
                t.text.push_back(p.filename);
            }

            if (t.size() == 0)
                continue;

            t.name = folder.name + " (" + utils::bytesToHuman(folder.totalSize) + " - " +
                     std::to_string(folder.imageCount) + " files, " + std::to_string(t.size()) + " points)";
            scene.traces.push_back(t);
        }

        SceneTrace out;
        out.name = "Outliers";
        out.outliers = true;
        out.marker.size = 8;
        out.marker.color = config.scene.outlierColor;
        out.marker.symbol = "x";
        for (const auto &p : points)
        {
            if (!p.outlier)
                continue;
            out.x.push_back(p.longitude);
            out.y.push_back(p.latitude);
            out.z.push_back(p.altitudeFt);
            out.text.push_back(p.filename);
        }
        if (out.size() > 0)
            scene.traces.push_back(out);

        LOGI << "Scene: " << inliers << " inliers, " << out.size() << " outliers";

        return scene;
    }

}
