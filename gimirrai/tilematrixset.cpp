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
#include <cmath>

#include "./tilematrixset.hpp"
#include "./detail/dataset.hpp"

namespace gimirrai {

namespace {

const double WebMercatorHalf(20037508.3427892);

TileMatrixSet::list buildAll()
{
    TileMatrixSet::list all;

    {
        TileMatrixSet tms;
        tms.id = "WorldCRS84Quad";
        tms.uri = "http://www.opengis.net/def/tilematrixset/OGC/1.0/"
            "WorldCRS84Quad";
        tms.crs = "http://www.opengis.net/def/crs/OGC/1.3/CRS84";
        tms.srs = detail::epsg(4326);
        tms.extents = math::Extents2(-180.0, -90.0, 180.0, 90.0);
        tms.rootSize = math::Size2(2, 1);
        tms.tileSize = math::Size2(256, 256);
        tms.minZoom = 0;
        tms.maxZoom = 17;
        all.push_back(tms);
    }

    {
        TileMatrixSet tms;
        tms.id = "WebMercatorQuad";
        tms.uri = "http://www.opengis.net/def/tilematrixset/OGC/1.0/"
            "WebMercatorQuad";
        tms.crs = "http://www.opengis.net/def/crs/EPSG/0/3857";
        tms.srs = detail::epsg(3857);
        tms.extents = math::Extents2(-WebMercatorHalf, -WebMercatorHalf
                                     , WebMercatorHalf, WebMercatorHalf);
        tms.rootSize = math::Size2(1, 1);
        tms.tileSize = math::Size2(256, 256);
        tms.minZoom = 0;
        tms.maxZoom = 24;
        all.push_back(tms);
    }

    return all;
}

} // namespace

math::Size2 TileMatrixSet::matrixSize(int z) const
{
    return math::Size2(rootSize.width << z, rootSize.height << z);
}

math::Extents2 TileMatrixSet::tileExtents(int z, int x, int y) const
{
    const auto ms(matrixSize(z));
    const auto es(math::size(extents));
    const double tw(es.width / ms.width);
    const double th(es.height / ms.height);

    return math::Extents2(extents.ll(0) + x * tw
                          , extents.ur(1) - (y + 1) * th
                          , extents.ll(0) + (x + 1) * tw
                          , extents.ur(1) - y * th);
}

bool TileMatrixSet::valid(int z, int x, int y) const
{
    if ((z < minZoom) || (z > maxZoom)) { return false; }
    const auto ms(matrixSize(z));
    return ((x >= 0) && (x < ms.width) && (y >= 0) && (y < ms.height));
}

boost::optional<TileRange>
TileMatrixSet::tileRange(int z, const math::Extents2 &e) const
{
    if ((e.ll(0) >= extents.ur(0)) || (e.ur(0) <= extents.ll(0))
        || (e.ll(1) >= extents.ur(1)) || (e.ur(1) <= extents.ll(1)))
    {
        return boost::none;
    }

    const auto ms(matrixSize(z));
    const auto es(math::size(extents));
    const double tw(es.width / ms.width);
    const double th(es.height / ms.height);

    const auto clamp([](int value, int limit) -> int
    {
        return std::max(0, std::min(value, limit - 1));
    });

    TileRange tr;
    tr.minCol = clamp(int(std::floor((e.ll(0) - extents.ll(0)) / tw))
                      , ms.width);
    tr.maxCol = clamp(int(std::ceil((e.ur(0) - extents.ll(0)) / tw)) - 1
                      , ms.width);
    tr.minRow = clamp(int(std::floor((extents.ur(1) - e.ur(1)) / th))
                      , ms.height);
    tr.maxRow = clamp(int(std::ceil((extents.ur(1) - e.ll(1)) / th)) - 1
                      , ms.height);

    // degenerate extents
    tr.maxCol = std::max(tr.minCol, tr.maxCol);
    tr.maxRow = std::max(tr.minRow, tr.maxRow);

    return tr;
}

Json::Value TileMatrixSet::link() const
{
    Json::Value link(Json::objectValue);
    link["tileMatrixSet"] = id;
    link["tileMatrixSetURI"] = uri;
    link["crs"] = crs;
    return link;
}

const TileMatrixSet::list& TileMatrixSet::all()
{
    static const list all(buildAll());
    return all;
}

const TileMatrixSet* TileMatrixSet::find(const std::string &id)
{
    for (const auto &tms : all()) {
        if (tms.id == id) { return &tms; }
    }
    return nullptr;
}

} // namespace gimirrai
