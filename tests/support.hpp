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
 * @file support.hpp
 *
 * Test fixtures: temporary directories, small georeferenced rasters and
 * GIMI files.
 */

#ifndef gimirrai_tests_support_hpp_included_
#define gimirrai_tests_support_hpp_included_

#include <array>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>

#include <gdal_priv.h>

#include "math/geometry_core.hpp"

#include "gimirrai/provider.hpp"

namespace gimirrai { namespace test {

/** Temporary directory removed in destructor.
 */
class TemporaryDirectory {
public:
    TemporaryDirectory();
    ~TemporaryDirectory();

    const boost::filesystem::path& path() const { return path_; }

    boost::filesystem::path operator/(const std::string &name) const {
        return path_ / name;
    }

private:
    boost::filesystem::path path_;
};

/** Pixel value generator: band (1-based), column, row.
 */
typedef std::function<double(int, int, int)> PixelValue;

struct RasterSpec {
    math::Size2 size;
    int bands;
    ::GDALDataType type;

    /** Extents in EPSG:4326 (lon/lat).
     */
    math::Extents2 extents;

    PixelValue value;

    /** Nodata value of the first band, NaN means none.
     */
    double nodata;

    RasterSpec();
};

/** Creates GeoTIFF at given path.
 */
void createRaster(const boost::filesystem::path &path
                  , const RasterSpec &spec);

typedef std::vector<std::uint8_t> Bytes;

/** Appends big endian unsigned integer of given size.
 */
void append(Bytes &out, std::uint64_t value, int size);

/** Appends BER length, long form for 128 and more.
 */
void berLength(Bytes &out, std::size_t value);

/** Appends ST0601 item with one byte tag.
 */
void klvItem(Bytes &out, std::uint8_t tag, std::uint64_t value, int size);

std::uint32_t encodeLatitude(double lat);
std::uint32_t encodeLongitude(double lon);

/** ST0601 items: time stamp, mission id and corners of given extents
 *  (clockwise from upper left).
 */
Bytes st0601Items(const math::Extents2 &extents, const std::string &title
                  , std::uint64_t timestamp);

/** Keyed ST0601 local set closed by checksum.
 */
Bytes st0601Packet(const Bytes &items, bool validChecksum = true);

struct GimiImage {
    math::Extents2 extents;
    std::array<std::uint8_t, 3> color;
    std::string title;
};

struct GimiSpec {
    math::Size2 size;

    /** One solid color image each, first one is primary.
     */
    std::vector<GimiImage> images;

    /** Thumbnail bounding box of the first image, 0 means no thumbnail.
     */
    int thumbnail;

    /** Content id and security XML of the first image.
     */
    std::string contentId;
    std::string security;

    /** Time stamp of all images, microseconds since epoch.
     */
    std::uint64_t timestamp;

    GimiSpec();
};

/** Writes HEIF file. Returns false when libheif provides no encoder.
 */
bool createGimi(const boost::filesystem::path &path, const GimiSpec &spec);

/** Provider definition of built-in provider of given type.
 */
ProviderDefinition definition(ProviderType type
                              , const boost::filesystem::path &data);

} } // namespace gimirrai::test

#endif // gimirrai_tests_support_hpp_included_
