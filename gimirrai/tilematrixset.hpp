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
 * @file tilematrixset.hpp
 *
 * Well-known tile matrix sets.
 */

#ifndef gimirrai_tilematrixset_hpp_included_
#define gimirrai_tilematrixset_hpp_included_

#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "jsoncpp/json.hpp"

#include "math/geometry_core.hpp"
#include "geo/srsdef.hpp"

namespace gimirrai {

/** Inclusive range of tiles.
 */
struct TileRange {
    int minCol;
    int minRow;
    int maxCol;
    int maxRow;

    TileRange() : minCol(), minRow(), maxCol(), maxRow() {}
    TileRange(int minCol, int minRow, int maxCol, int maxRow)
        : minCol(minCol), minRow(minRow), maxCol(maxCol), maxRow(maxRow)
    {}
};

struct TileMatrixSet {
    std::string id;
    std::string uri;

    /** CRS URI.
     */
    std::string crs;
    geo::SrsDefinition srs;

    /** Extents covered by the whole matrix.
     */
    math::Extents2 extents;

    /** Number of tiles at zoom 0.
     */
    math::Size2 rootSize;

    math::Size2 tileSize;
    int minZoom;
    int maxZoom;

    typedef std::vector<TileMatrixSet> list;

    TileMatrixSet() : minZoom(), maxZoom() {}

    /** Number of tiles at given zoom.
     */
    math::Size2 matrixSize(int z) const;

    /** Extents of given tile. Column grows east, row grows south from the
     *  top-left corner.
     */
    math::Extents2 tileExtents(int z, int x, int y) const;

    bool valid(int z, int x, int y) const;

    /** Tiles touched by given extents at given zoom, clipped to the matrix.
     *  Returns none when extents are disjoint from the matrix.
     */
    boost::optional<TileRange> tileRange(int z, const math::Extents2 &e)
        const;

    /** Tile matrix set link: tileMatrixSet, tileMatrixSetURI and crs.
     */
    Json::Value link() const;

    /** Finds tile matrix set by its id. Returns nullptr if unknown.
     */
    static const TileMatrixSet* find(const std::string &id);

    static const list& all();
};

} // namespace gimirrai

#endif // gimirrai_tilematrixset_hpp_included_
