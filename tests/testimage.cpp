/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "testimage.h"

#include <cmath>
#include <exiv2/exiv2.hpp>

#include "exceptions.h"
#include "utils.h"

std::string doubleToDMS(double d)
{
    if (d < 0.0) d = -d;
    int deg = (int)d;
    d -= deg;
    d *= 60;
    int min = (int)d;
    d -= min;
    d *= 60;
    int sec = (int)round(d * 10000.0);

    return std::to_string(deg) + "/1 " +
           std::to_string(min) + "/1 " +
           std::to_string(sec) + "/10000";
}

namespace
{
    std::string toFraction(double d, int precision)
    {
        if (d < 0.0) d = -d;
        const long long denominator = static_cast<long long>(pow(10.0, precision));
        return std::to_string(static_cast<long long>(round(d * denominator))) + "/" + std::to_string(denominator);
    }
}

std::vector<uint8_t> TestImage::build() const
{
    // Blank JPEG backed by memory
    auto image = Exiv2::ImageFactory::create(Exiv2::ImageType::jpeg);
    if (!image)
        throw sqc::AppException("Cannot create test image");

    Exiv2::ExifData exifData;
    Exiv2::XmpData xmpData;

    exifData["Exif.Image.Make"] = "DJI";
    exifData["Exif.Image.Model"] = "FC6310";

    if (gps)
    {
        exifData["Exif.GPSInfo.GPSLatitude"] = doubleToDMS(latitude);
        exifData["Exif.GPSInfo.GPSLatitudeRef"] = latitude >= 0.0 ? "N" : "S";
        exifData["Exif.GPSInfo.GPSLongitude"] = doubleToDMS(longitude);
        exifData["Exif.GPSInfo.GPSLongitudeRef"] = longitude >= 0.0 ? "E" : "W";
    }

    if (gpsAltitude)
    {
        exifData["Exif.GPSInfo.GPSAltitude"] = toFraction(altitudeMeters, 3);
        exifData["Exif.GPSInfo.GPSAltitudeRef"] = altitudeMeters < 0.0 ? "1" : "0";
    }

    if (!dateTimeOriginal.empty())
        exifData["Exif.Photo.DateTimeOriginal"] = dateTimeOriginal;
    if (!offsetTimeOriginal.empty())
        exifData["Exif.Photo.OffsetTimeOriginal"] = offsetTimeOriginal;

    if (relativeAltitude)
        xmpData["Xmp.drone-dji.RelativeAltitude"] = (relativeAltitudeMeters >= 0 ? "+" : "") + sqc::utils::toStr(relativeAltitudeMeters, 2);

    if (xmpLocation)
    {
        xmpData["Xmp.drone-dji.Latitude"] = sqc::utils::toStr(latitude, 8);
        xmpData["Xmp.drone-dji.Longitude"] = sqc::utils::toStr(longitude, 8);
    }

    image->setExifData(exifData);
    image->setXmpData(xmpData);
    image->writeMetadata();

    Exiv2::BasicIo &io = image->io();
    if (io.open() != 0)
        throw sqc::AppException("Cannot read back test image");
    Exiv2::DataBuf buf = io.read(io.size());
    io.close();

    return std::vector<uint8_t>(buf.c_data(), buf.c_data() + buf.size());
}
