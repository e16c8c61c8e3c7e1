/**
 * Copyright (c) 2024 Melown Technologies SE
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * *  Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 * *  Redistributions in binary form must reproduce the above copyright
 *    notice, this list of conditions and the following disclaimer in the
 *    documentation and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED.  IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 * LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 */
#include <algorithm>
#include <stdexcept>

#include <boost/lexical_cast.hpp>
#include <boost/format.hpp>

#include <cpl_string.h>

#include "dbglog/dbglog.hpp"

#include "./metadata.hpp"
#include "./klv.hpp"
#include "./register.hpp"
#include "./detail/dataset.hpp"

namespace gimirrai {

namespace {

boost::optional<double> st0601Value(::GDALDataset &ds, unsigned int tag)
{
    const char *value(ds.GetMetadataItem(klv::tagName(tag), "GIMI_ST0601"));
    if (!value) { return boost::none; }

    try {
        return boost::lexical_cast<double>(value);
    } catch (const boost::bad_lexical_cast&) {
        LOG(warn2) << "Invalid value <" << value << "> of "
                   << klv::tagName(tag) << ".";
    }
    return boost::none;
}

boost::optional<std::string> optionalString(const char *value)
{
    if (!value || !*value) { return boost::none; }
    return std::string(value);
}

BandData::map bandData(::GDALDataset &ds)
{
    BandData::map bands;
    for (int i(1); i <= ds.GetRasterCount(); ++i) {
        auto *band(ds.GetRasterBand(i));

        BandData bd;
        bd.index = i;
        bd.dtype = detail::dtypeName(band->GetRasterDataType());

        int success(0);
        const auto nodata(band->GetNoDataValue(&success));
        if (success) { bd.nodata = nodata; }

        bd.units = optionalString(band->GetUnitType());
        bd.description = optionalString(band->GetDescription());

        bands[i] = bd;
    }
    return bands;
}

} // namespace

math::Extents2 ImageMetadata::extents() const
{
    return math::Extents2(std::min(upperLeftLon, lowerRightLon)
                          , std::min(upperLeftLat, lowerRightLat)
                          , std::max(upperLeftLon, lowerRightLon)
                          , std::max(upperLeftLat, lowerRightLat));
}

ImageMetadata imageMetadata(::GDALDataset &ds)
{
    ImageMetadata im;
    im.width = ds.GetRasterXSize();
    im.height = ds.GetRasterYSize();
    im.bands = bandData(ds);
    im.title = ds.GetMetadataItem("TITLE") ? ds.GetMetadataItem("TITLE") : "";
    im.beginPosition = optionalString(ds.GetMetadataItem("BEGIN_POSITION"));

    const auto west(st0601Value(ds, klv::cornerLongitudePoint1));
    const auto north(st0601Value(ds, klv::cornerLatitudePoint1));
    const auto east(st0601Value(ds, klv::cornerLongitudePoint3));
    const auto south(st0601Value(ds, klv::cornerLatitudePoint3));

    if (west && north && east && south) {
        LOG(debug) << "Using ST0601 corner coordinates.";
        im.crs = 4326;
        im.upperLeftLon = *west;
        im.upperLeftLat = *north;
        im.lowerRightLon = *east;
        im.lowerRightLat = *south;
        im.xResolution = (im.lowerRightLon - im.upperLeftLon) / im.width;
        im.yResolution = (im.lowerRightLat - im.upperLeftLat) / im.height;

        auto &gt(im.affine);
        gt[0] = im.upperLeftLon;
        gt[1] = im.xResolution;
        gt[2] = 0.0;
        gt[3] = im.upperLeftLat;
        gt[4] = 0.0;
        gt[5] = im.yResolution;
        return im;
    }

    // generic georeferenced raster
    im.affine = detail::geoTransform(ds);
    im.crs = detail::datasetEpsg(ds, 4326);

    const auto &gt(im.affine);
    if ((gt[2] != 0.0) || (gt[4] != 0.0)) {
        LOGTHROW(err2, std::runtime_error)
            << "Rotated rasters are not supported.";
    }

    im.upperLeftLon = gt[0];
    im.upperLeftLat = gt[3];
    im.lowerRightLon = gt[0] + im.width * gt[1];
    im.lowerRightLat = gt[3] + im.height * gt[5];
    im.xResolution = gt[1];
    im.yResolution = gt[5];

    return im;
}

GimiMetadata gimiMetadata(const std::string &path)
{
    registerAll();

    auto ds(detail::openDataset(path));

    GimiMetadata gm;

    char **subdatasets(ds->GetMetadata("SUBDATASETS"));
    for (int i(1); ; ++i) {
        const char *name(::CSLFetchNameValue
                         (subdatasets, str(boost::format("SUBDATASET_%d_NAME")
                                           % i).c_str()));
        if (!name) { break; }

        LOG(debug) << "Reading metadata of subdataset " << name << ".";
        auto sub(detail::openDataset(name));
        gm.images.push_back(imageMetadata(*sub));
        gm.images.back().source = name;
    }

    if (gm.images.empty()) {
        gm.images.push_back(imageMetadata(*ds));
        gm.images.back().source = path;
    }

    LOG(info2) << "Read metadata of " << gm.images.size()
               << " image(s) from " << path << ".";
    return gm;
}

} // namespace gimirrai
