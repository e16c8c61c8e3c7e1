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
 * @file tiles.hpp
 *
 * Tile provider: renders GIMI imagery into tiles of well-known tile matrix
 * sets.
 */

#ifndef gimirrai_tiles_hpp_included_
#define gimirrai_tiles_hpp_included_

#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "jsoncpp/json.hpp"

#include "utility/enum-io.hpp"
#include "math/geometry_core.hpp"

#include "./provider.hpp"
#include "./metadata.hpp"
#include "./tilematrixset.hpp"
#include "./detail/dataset.hpp"
#include "./detail/tilecache.hpp"

namespace gimirrai {

enum class TileFormat { png, jpeg };

UTILITY_GENERATE_ENUM_IO(TileFormat,
                         ((png)("png"))
                         ((jpeg)("jpeg"))
                         )

enum class TilesMetadataFormat { json, tilejson };

UTILITY_GENERATE_ENUM_IO(TilesMetadataFormat,
                         ((json)("json"))
                         ((tilejson)("tilejson"))
                         )

enum class Resampling { nearest, bilinear, cubic };

UTILITY_GENERATE_ENUM_IO(Resampling,
                         ((nearest)("nearest"))
                         ((bilinear)("bilinear"))
                         ((cubic)("cubic"))
                         )

class TileProvider : public Provider {
public:
    struct Tile {
        detail::Buffer data;
        std::string mimetype;
    };

    /** Configured tile matrix set.
     */
    struct Scheme {
        const TileMatrixSet *tms;
        int minZoom;
        int maxZoom;

        /** Data bounds in the matrix set's SRS.
         */
        math::Extents2 extents;

        Scheme() : tms(), minZoom(), maxZoom() {}

        typedef std::vector<Scheme> list;
    };

    /** Throws ProviderConnectionError when data cannot be read or options
     *  are invalid.
     */
    TileProvider(const ProviderDefinition &definition);

    /** Layer name: the data file name.
     */
    std::string layer() const;

    /** List of tile matrix set links.
     */
    Json::Value tilingSchemes() const;

    /** Tiles service description: one templated link per tiling scheme.
     */
    Json::Value tilesService(const std::string &baseUrl
                             , const std::string &servicePath
                             , const std::string &format = "png") const;

    /** Renders tile at given tile matrix (z), row (y) and column (x).
     *
     * Returns none for tiles outside the data bounds.
     *
     * Throws ProviderTilesetIdNotFoundError, ProviderTileNotFoundError or
     * ProviderInvalidQueryError.
     */
    boost::optional<Tile> tile(const std::string &tileMatrixSet
                               , int z, int y, int x
                               , const std::string &format = "png") const;

    /** Tileset metadata.
     *
     * With empty tileset a json request returns a list of documents, one per
     * configured tiling scheme; TileJSON always describes single tileset
     * (the first configured one if none given).
     *
     * Throws ProviderInvalidQueryError for unknown metadata format.
     */
    Json::Value metadata(const std::string &metadataFormat
                         , const std::string &serverUrl
                         , const std::string &title = ""
                         , const std::string &description = ""
                         , const std::vector<std::string> &keywords
                         = std::vector<std::string>()
                         , const std::string &tileset = "") const;

    /** Configured metadata format.
     */
    TilesMetadataFormat metadataFormat() const { return metadataFormat_; }

    /** Data bounds, CRS84.
     */
    const math::Extents2& bounds() const { return bounds_; }

    const Scheme::list& schemes() const { return schemes_; }

private:
    const Scheme& scheme(const std::string &tileMatrixSet) const;

    boost::optional<Tile> render(const Scheme &scheme, int z, int x, int y
                                 , TileFormat format) const;

    Json::Value tilesetMetadata(const Scheme &scheme
                                , const std::string &serverUrl
                                , const std::string &title
                                , const std::string &description
                                , const std::vector<std::string> &keywords)
        const;

    Json::Value tileJson(const Scheme &scheme, const std::string &serverUrl
                         , const std::string &title
                         , const std::string &description) const;

    GimiMetadata metadata_;
    math::Extents2 bounds_;
    Scheme::list schemes_;
    TilesMetadataFormat metadataFormat_;
    Resampling resampling_;
    boost::optional<detail::TileCache> cache_;
};

} // namespace gimirrai

#endif // gimirrai_tiles_hpp_included_
