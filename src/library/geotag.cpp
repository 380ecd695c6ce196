/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "geotag.h"

#include <cctz/civil_time.h>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <fstream>

#include "constants.h"
#include "exceptions.h"
#include "logger.h"
#include "utils.h"

namespace sqc
{

    json GeoTag::toJSON() const
    {
        json j;
        j["folder"] = folder;
        j["filename"] = filename;
        j["path"] = path;
        j["latitude"] = latitude;
        j["longitude"] = longitude;
        j["altitude"] = altitudeFt;
        if (!altitudeSource.empty())
            j["altitudeSource"] = altitudeSource;
        if (captureTime > 0)
            j["timestamp"] = captureTime;
        else
            j["timestamp"] = nullptr;
        return j;
    }

    double getUTCEpoch(int year, int month, int day, int hour, int minute, int second, double msecs, const cctz::time_zone &tz)
    {
        auto time = tz.lookup(cctz::civil_second(year, month, day, hour, minute, second));
        return static_cast<double>(std::chrono::duration_cast<std::chrono::milliseconds>(time.post.time_since_epoch()).count()) + msecs;
    }

    Exiv2::ExifData::const_iterator ExifParser::findExifKey(const std::string &key)
    {
        return findExifKey({key});
    }

    // Find the first available key, or exifData::end() if none exist
    Exiv2::ExifData::const_iterator ExifParser::findExifKey(const std::initializer_list<std::string> &keys)
    {
        for (auto &k : keys)
        {
            try
            {
                auto it = exifData.findKey(Exiv2::ExifKey(k));
                if (it != exifData.end())
                    return it;
            }
            catch (Exiv2::Error &e)
            {
                LOGD << "Invalid EXIF key " << k << ": " << e.what();
            }
        }
        return exifData.end();
    }

    Exiv2::XmpData::const_iterator ExifParser::findXmpKey(const std::string &key)
    {
        return findXmpKey({key});
    }

    Exiv2::XmpData::const_iterator ExifParser::findXmpKey(const std::initializer_list<std::string> &keys)
    {
        for (auto &k : keys)
        {
            try
            {
                auto it = xmpData.findKey(Exiv2::XmpKey(k));
                if (it != xmpData.end())
                    return it;
            }
            catch (Exiv2::Error &)
            {
                // Unregistered namespace
            }
        }
        return xmpData.end();
    }

    bool ExifParser::extractGeo(GeoLocation &geo)
    {
        auto latitude = findExifKey({"Exif.GPSInfo.GPSLatitude"});
        auto latitudeRef = findExifKey({"Exif.GPSInfo.GPSLatitudeRef"});
        auto longitude = findExifKey({"Exif.GPSInfo.GPSLongitude"});
        auto longitudeRef = findExifKey({"Exif.GPSInfo.GPSLongitudeRef"});

        if (latitude != exifData.end() && longitude != exifData.end() &&
            latitude->count() >= 3 && longitude->count() >= 3)
        {
            geo.latitude = geoToDecimal(latitude, latitudeRef);
            geo.longitude = geoToDecimal(longitude, longitudeRef);
            return true;
        }

        // Some models only write XMP
        auto xmpLat = findXmpKey({"Xmp.drone-dji.Latitude", "Xmp.drone-dji.GpsLatitude"});
        auto xmpLon = findXmpKey({"Xmp.drone-dji.Longitude", "Xmp.drone-dji.GpsLongitude", "Xmp.drone-dji.GpsLongtitude"});
        if (xmpLat != xmpData.end() && xmpLon != xmpData.end())
        {
            try
            {
                geo.latitude = std::stod(xmpLat->toString());
                geo.longitude = std::stod(xmpLon->toString());
                return true;
            }
            catch (const std::invalid_argument &)
            {
                LOGD << "Cannot parse XMP coordinates " << xmpLat->toString() << ", " << xmpLon->toString();
            }
            catch (const std::out_of_range &)
            {
                LOGD << "XMP coordinates out of range";
            }
        }

        return false;
    }

    bool ExifParser::extractAltitude(const std::vector<std::string> &tags, double &meters, std::string &source)
    {
        for (const auto &tag : tags)
        {
            if (tag.rfind("Xmp.", 0) == 0)
            {
                auto k = findXmpKey(tag);
                if (k == xmpData.end())
                    continue;

                // Decimal strings such as "+45.30"
                try
                {
                    meters = std::stod(k->toString());
                    source = tag;
                    return true;
                }
                catch (const std::invalid_argument &)
                {
                    LOGD << "Cannot parse " << tag << " value " << k->toString();
                }
                catch (const std::out_of_range &)
                {
                    LOGD << tag << " value out of range";
                }
            }
            else if (tag.rfind("Exif.", 0) == 0)
            {
                auto k = findExifKey(tag);
                if (k == exifData.end() || k->count() == 0)
                    continue;

                const auto type = k->typeId();
                if (type == Exiv2::unsignedRational || type == Exiv2::signedRational)
                {
                    const auto r = k->toRational();
                    if (r.second == 0)
                        continue;
                    meters = evalFrac(r);
                }
                else
                {
                    meters = static_cast<double>(k->toFloat());
                }

                if (tag == "Exif.GPSInfo.GPSAltitude")
                {
                    // 1 = below sea level
                    auto altitudeRef = findExifKey({"Exif.GPSInfo.GPSAltitudeRef"});
                    if (altitudeRef != exifData.end() && altitudeRef->count() > 0)
                    {
                        meters *= altitudeRef->toInt64() == 1 ? -1 : 1;
                    }
                }

                source = tag;
                return true;
            }
            else
            {
                LOGD << "Unsupported altitude tag " << tag;
            }
        }

        return false;
    }

    // Converts a geotag location to decimal degrees
    double ExifParser::geoToDecimal(const Exiv2::ExifData::const_iterator &geoTag, const Exiv2::ExifData::const_iterator &geoRefTag)
    {
        if (geoTag == exifData.end())
            return 0.0;

        // N/S, W/E
        double sign = 1.0;
        if (geoRefTag != exifData.end())
        {
            std::string ref = geoRefTag->toString();
            utils::toUpper(ref);
            if (ref == "S" || ref == "W")
                sign = -1.0;
        }

        double degrees = evalFrac(geoTag->toRational(0));
        double minutes = evalFrac(geoTag->toRational(1));
        double seconds = evalFrac(geoTag->toRational(2));

        return sign * (degrees + minutes / 60.0 + seconds / 3600.0);
    }

    // Evaluates a rational
    double ExifParser::evalFrac(const Exiv2::Rational &rational)
    {
        if (rational.second == 0)
            return 0.0;
        return static_cast<double>(rational.first) / static_cast<double>(rational.second);
    }

    // ."1" --> "100"
    // ."12" --> "120"
    // ."12345" --> "123.45"
    double ExifParser::parseSubSec(const Exiv2::ExifData::const_iterator &subsec)
    {
        if (subsec == exifData.end() || subsec->count() == 0)
            return 0.0;

        double ss = static_cast<double>(subsec->toInt64());
        size_t numDigits = subsec->toString().length();

        if (numDigits == 0)
            return 0.0;
        else if (numDigits == 1)
            return ss * 100.0;
        else if (numDigits == 2)
            return ss * 10.0;
        else if (numDigits == 3)
            return ss;
        else
            return ss / static_cast<double>(pow(10, numDigits - 3));
    }

    // "+02:00", "-0530"
    bool ExifParser::parseOffsetTime(const Exiv2::ExifData::const_iterator &offset, int &offsetSeconds)
    {
        if (offset == exifData.end())
            return false;

        std::string s = offset->toString();
        if (s.length() < 5)
            return false;

        int sign = 1;
        if (s[0] == '-')
            sign = -1;
        else if (s[0] != '+')
            return false;

        int hours = 0, minutes = 0;
        if (sscanf(s.c_str(), "%*c%d:%d", &hours, &minutes) == 2 ||
            sscanf(s.c_str(), "%*c%2d%2d", &hours, &minutes) == 2)
        {
            offsetSeconds = sign * (hours * 3600 + minutes * 60);
            return true;
        }

        return false;
    }

    // Capture time in milliseconds from Jan 1st 1970 UTC, or 0.
    //   1. GPS DateStamp + TimeStamp (always UTC)
    //   2. DateTimeOriginal + OffsetTimeOriginal
    //   3. DateTimeOriginal, assumed UTC
    double ExifParser::extractCaptureTime()
    {
        const cctz::time_zone utc = cctz::utc_time_zone();

        auto datestamp = findExifKey("Exif.GPSInfo.GPSDateStamp");
        auto timestamp = findExifKey("Exif.GPSInfo.GPSTimeStamp");
        if (datestamp != exifData.end() && timestamp != exifData.end() && timestamp->count() >= 3)
        {
            int year, month, day;
            if (sscanf(datestamp->toString().c_str(), "%d:%d:%d", &year, &month, &day) == 3)
            {
                double hours = evalFrac(timestamp->toRational(0));
                double minutes = evalFrac(timestamp->toRational(1));
                double seconds = evalFrac(timestamp->toRational(2));

                int s = static_cast<int>(seconds);
                double result = getUTCEpoch(year, month, day, static_cast<int>(hours), static_cast<int>(minutes), s, (seconds - s) * 1000.0, utc);
                if (result > 0)
                    return result;
            }
            else
            {
                LOGD << "Invalid GPS date stamp: " << datestamp->toString();
            }
        }

        auto time = findExifKey({"Exif.Photo.DateTimeOriginal", "Exif.Image.DateTime"});
        if (time == exifData.end())
            return 0.0;

        int year, month, day, hour, minute, second;
        if (sscanf(time->toString().c_str(), "%d:%d:%d %d:%d:%d", &year, &month, &day, &hour, &minute, &second) != 6)
        {
            LOGD << "Invalid date/time format: " << time->toString();
            return 0.0;
        }

        double msecs = parseSubSec(findExifKey("Exif.Photo.SubSecTimeOriginal"));

        int offsetSecs = 0;
        if (parseOffsetTime(findExifKey("Exif.Photo.OffsetTimeOriginal"), offsetSecs))
        {
            // "+02:00" means local = UTC + 2h
            const cctz::time_zone tz = cctz::fixed_time_zone(std::chrono::seconds(offsetSecs));
            return getUTCEpoch(year, month, day, hour, minute, second, msecs, tz);
        }

        return getUTCEpoch(year, month, day, hour, minute, second, msecs, utc);
    }

    bool ExifParser::hasExif()
    {
        return !exifData.empty();
    }

    bool ExifParser::hasXmp()
    {
        return !xmpData.empty();
    }

    bool ExifParser::hasTags()
    {
        return this->hasExif() || this->hasXmp();
    }

    GeotagExtractor::GeotagExtractor(const ExtractorConfig &config) : config(config)
    {
    }

    std::optional<GeoTag> GeotagExtractor::parse(const uint8_t *data, size_t size) const
    {
        if (data == nullptr || size == 0)
            return std::nullopt;

        Exiv2::Image::UniquePtr image;
        try
        {
            image = Exiv2::ImageFactory::open(data, size);
        }
        catch (const std::exception &e)
        {
            LOGD << "Not a recognized image: " << e.what();
            return std::nullopt;
        }

        if (!image)
            return std::nullopt;

        try
        {
            image->readMetadata();
        }
        catch (const std::exception &e)
        {
            // A prefix read cuts the file short: keep what was decoded so far
            LOGD << "Incomplete metadata (" << e.what() << ")";
        }

        try
        {
            ExifParser p(image.get());
            if (!p.hasTags())
                return std::nullopt;

            GeoLocation geo;
            if (!p.extractGeo(geo))
                return std::nullopt;

            if (std::isnan(geo.latitude) || std::isnan(geo.longitude) ||
                geo.latitude < -90.0 || geo.latitude > 90.0 ||
                geo.longitude < -180.0 || geo.longitude > 180.0)
            {
                LOGD << "Invalid coordinates " << geo.latitude << ", " << geo.longitude;
                return std::nullopt;
            }

            GeoTag tag;
            tag.latitude = geo.latitude;
            tag.longitude = geo.longitude;

            double meters;
            std::string source;
            if (p.extractAltitude(config.altitudeTags, meters, source))
            {
                tag.altitudeFt = meters * METERS_TO_FEET;
                tag.altitudeSource = source;
            }

            tag.captureTime = p.extractCaptureTime();

            return tag;
        }
        catch (const std::exception &e)
        {
            LOGD << "Cannot read geotag: " << e.what();
            return std::nullopt;
        }
    }

    std::optional<GeoTag> GeotagExtractor::parse(const std::vector<uint8_t> &data) const
    {
        return parse(data.data(), data.size());
    }

    std::optional<GeoTag> GeotagExtractor::extract(Session &session, const WorkItem &item, int timeoutMs) const
    {
        const auto data = session.readPrefix(item.path, config.prefixBytes, timeoutMs);

        auto tag = parse(data);
        if (tag)
        {
            tag->folder = item.folder;
            tag->filename = item.filename;
            tag->path = item.path;
        }
        else
        {
            LOGV << "No geotag in " << item.path;
        }

        return tag;
    }

    std::optional<GeoTag> GeotagExtractor::extractFile(const std::string &filename) const
    {
        std::ifstream f(filename, std::ios::binary);
        if (!f.is_open())
            throw FSException("Cannot open " + filename);

        std::vector<uint8_t> data(config.prefixBytes);
        f.read(reinterpret_cast<char *>(data.data()), static_cast<std::streamsize>(data.size()));
        data.resize(static_cast<size_t>(f.gcount()));

        auto tag = parse(data);
        if (tag)
        {
            const size_t slash = filename.find_last_of("/\\");
            tag->filename = slash == std::string::npos ? filename : filename.substr(slash + 1);
            tag->path = filename;
        }

        return tag;
    }

}
