/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef GEOTAG_H
#define GEOTAG_H

#include <cctz/time_zone.h>
#include <exiv2/exiv2.hpp>
#include <optional>
#include <string>
#include <vector>
#include "config.h"
#include "json.h"
#include "session.h"
#include "sqc_export.h"

namespace sqc
{

    // One image to extract, consumed exactly once
    struct WorkItem
    {
        std::string folder;
        std::string path;
        std::string filename;

        WorkItem() {}
        WorkItem(const std::string &folder, const std::string &path, const std::string &filename) : folder(folder), path(path), filename(filename) {}
    };

    struct GeoTag
    {
        std::string folder;
        std::string filename;
        std::string path;

        double latitude;
        double longitude;
        double altitudeFt;     // 0 when no altitude tag is present
        std::string altitudeSource; // key of the tag that supplied the altitude
        double captureTime;    // ms since epoch (UTC), 0 when unknown

        GeoTag() : latitude(0), longitude(0), altitudeFt(0), captureTime(0) {}

        SQC_DLL json toJSON() const;
    };

    struct GeoLocation
    {
        double latitude;
        double longitude;

        GeoLocation() : latitude(0), longitude(0) {}
        GeoLocation(double latitude, double longitude) : latitude(latitude), longitude(longitude) {}
    };

    class ExifParser
    {
        Exiv2::ExifData exifData;
        Exiv2::XmpData xmpData;

        double parseSubSec(const Exiv2::ExifData::const_iterator &subsec);
        bool parseOffsetTime(const Exiv2::ExifData::const_iterator &offset, int &offsetSeconds);

    public:
        ExifParser(Exiv2::Image *image) : exifData(image->exifData()), xmpData(image->xmpData()) {};

        Exiv2::ExifData::const_iterator findExifKey(const std::string &key);
        Exiv2::ExifData::const_iterator findExifKey(const std::initializer_list<std::string> &keys);
        Exiv2::XmpData::const_iterator findXmpKey(const std::string &key);
        Exiv2::XmpData::const_iterator findXmpKey(const std::initializer_list<std::string> &keys);

        // Latitude/longitude in decimal degrees, from EXIF GPS or else DJI XMP
        bool extractGeo(GeoLocation &geo);

        // Altitude in meters from the first of tags that is present
        bool extractAltitude(const std::vector<std::string> &tags, double &meters, std::string &source);

        double geoToDecimal(const Exiv2::ExifData::const_iterator &geoTag, const Exiv2::ExifData::const_iterator &geoRefTag);
        double evalFrac(const Exiv2::Rational &rational);

        double extractCaptureTime();

        bool hasExif();
        bool hasXmp();
        bool hasTags();
    };

    SQC_DLL double getUTCEpoch(int year, int month, int day, int hour, int minute, int second, double msecs, const cctz::time_zone &tz);

    /**
     * Reads a bounded prefix of an image and extracts its geotag.
     * Missing, truncated or malformed metadata yields an empty result,
     * never an exception. Remote I/O errors do propagate (NetException).
     */
    class GeotagExtractor
    {
        ExtractorConfig config;

    public:
        SQC_DLL explicit GeotagExtractor(const ExtractorConfig &config = ExtractorConfig());

        const ExtractorConfig &getConfig() const { return config; }

        SQC_DLL std::optional<GeoTag> parse(const uint8_t *data, size_t size) const;
        SQC_DLL std::optional<GeoTag> parse(const std::vector<uint8_t> &data) const;

        SQC_DLL std::optional<GeoTag> extract(Session &session, const WorkItem &item, int timeoutMs) const;

        // Reads the prefix of a local file
        SQC_DLL std::optional<GeoTag> extractFile(const std::string &filename) const;
    };

}

#endif // GEOTAG_H
