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
/**
 * @file metadata.hpp
 *
 * Image metadata of GIMI (and any other georeferenced) files.
 */

#ifndef gimirrai_metadata_hpp_included_
#define gimirrai_metadata_hpp_included_

#include <map>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include <gdal_priv.h>

#include "math/geometry_core.hpp"
#include "geo/geotransform.hpp"

namespace gimirrai {

struct BandData {
    /** One-based band index.
     */
    int index;
    std::string dtype;
    boost::optional<double> nodata;
    boost::optional<std::string> units;
    boost::optional<std::string> description;

    BandData() : index() {}

    typedef std::map<int, BandData> map;
};

struct ImageMetadata {
    /** GDAL dataset name the image is read from (file path or subdataset
     *  name).
     */
    std::string source;

    geo::GeoTransform affine;
    BandData::map bands;
    boost::optional<std::string> beginPosition;

    /** EPSG code.
     */
    int crs;

    int width;
    int height;

    double upperLeftLon;
    double upperLeftLat;
    double lowerRightLon;
    double lowerRightLat;

    std::string title;

    double xResolution;
    double yResolution;

    ImageMetadata()
        : crs(4326), width(), height()
        , upperLeftLon(), upperLeftLat(), lowerRightLon(), lowerRightLat()
        , xResolution(), yResolution()
    {}

    /** Normalized extents covered by the image.
     */
    math::Extents2 extents() const;

    typedef std::vector<ImageMetadata> list;
};

struct GimiMetadata {
    ImageMetadata::list images;
};

/** Builds image metadata from an open dataset. Corners come from ST0601
 *  metadata if present, from the geo transformation otherwise.
 *
 * Throws std::runtime_error if dataset is not georeferenced.
 */
ImageMetadata imageMetadata(::GDALDataset &ds);

/** Reads metadata of all images in given file.
 *
 * Throws std::runtime_error if the file cannot be opened or understood.
 */
GimiMetadata gimiMetadata(const std::string &path);

} // namespace gimirrai

#endif // gimirrai_metadata_hpp_included_
