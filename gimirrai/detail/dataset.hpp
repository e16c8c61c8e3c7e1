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
 * @file detail/dataset.hpp
 *
 * GDAL dataset helpers shared by providers.
 */

#ifndef gimirrai_detail_dataset_hpp_included_
#define gimirrai_detail_dataset_hpp_included_

#include <memory>
#include <string>
#include <vector>

#include <gdal_priv.h>
#include <ogr_spatialref.h>

#include "math/geometry_core.hpp"
#include "geo/srsdef.hpp"
#include "geo/geotransform.hpp"

namespace gimirrai { namespace detail {

typedef std::vector<char> Buffer;

void closeGdalDataset(::GDALDataset *ds);

typedef std::unique_ptr< ::GDALDataset
                         , decltype(&detail::closeGdalDataset)> Dataset;

/** Opens raster dataset in read-only mode. GIMI driver has the first
 *  chance, then any registered driver.
 *
 * Throws std::runtime_error when the dataset cannot be opened.
 */
Dataset openDataset(const std::string &path);

/** Creates an in-memory dataset.
 */
Dataset createMemDataset(const math::Size2 &size, int bands
                         , ::GDALDataType type);

/** Dataset's geo transformation. Throws std::runtime_error when the
 *  dataset is not georeferenced.
 */
geo::GeoTransform geoTransform(::GDALDataset &ds);

void setGeoTransform(::GDALDataset &ds, const geo::GeoTransform &gt);

/** Returns EPSG code of dataset's SRS or given fallback.
 */
int datasetEpsg(::GDALDataset &ds, int fallback);

/** Data type name as used in OGC data type URIs (uint8, int16, float32...)
 */
std::string dtypeName(::GDALDataType type);

/** Writes dataset into memory using given driver.
 */
Buffer encode(::GDALDataset &ds, const std::string &driver
              , const std::vector<std::string> &options
              = std::vector<std::string>());

/** Parses CRS given as EPSG code, "EPSG:<code>", OGC CRS URI or any
 *  definition understood by geo::SrsDefinition::fromString.
 */
geo::SrsDefinition parseCrs(const std::string &crs);

geo::SrsDefinition epsg(int code);

/** Point and extents transformation between two SRS, always in
 *  easting/northing (lon/lat) axis order.
 */
class SrsTransformer {
public:
    SrsTransformer(const geo::SrsDefinition &src
                   , const geo::SrsDefinition &dst);

    math::Point2 operator()(const math::Point2 &p) const;

    /** Transforms extents by sampling its border.
     */
    math::Extents2 operator()(const math::Extents2 &e) const;

    /** Both SRS describe the same system.
     */
    bool identity() const { return identity_; }

private:
    std::shared_ptr< ::OGRCoordinateTransformation> trafo_;
    bool identity_;
};

/** Reference with easting/northing axis order.
 */
::OGRSpatialReference gisReference(const geo::SrsDefinition &srs);

} } // namespace gimirrai::detail

#endif // gimirrai_detail_dataset_hpp_included_
