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
#include <cstdint>
#include <limits>
#include <memory>
#include <utility>

#include <boost/lexical_cast.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/classification.hpp>

#include <opencv2/core/core.hpp>
#include <opencv2/highgui/highgui.hpp>

#include <gdalwarper.h>
#include <cpl_string.h>

#include "dbglog/dbglog.hpp"

#include "./tiles.hpp"
#include "./register.hpp"
#include "./detail/stretch.hpp"

namespace ba = boost::algorithm;
namespace fs = boost::filesystem;

namespace gimirrai {

namespace {

const double MaxMercatorLatitude(85.0511287798066);
const char *Crs84("http://www.opengis.net/def/crs/OGC/1.3/CRS84");

std::string mimetype(TileFormat format)
{
    switch (format) {
    case TileFormat::png: return "image/png";
    case TileFormat::jpeg: return "image/jpeg";
    }
    return "application/octet-stream";
}

TileFormat parseFormat(const std::string &format)
{
    auto f(ba::to_lower_copy(format));
    if (f == "jpg") { f = "jpeg"; }
    try {
        return boost::lexical_cast<TileFormat>(f);
    } catch (const boost::bad_lexical_cast&) {
        LOGTHROW(warn2, ProviderInvalidQueryError)
            << "Unsupported tile format <" << format << ">.";
    }
    throw; // never reached
}

::GDALResampleAlg resampleAlg(Resampling resampling)
{
    switch (resampling) {
    case Resampling::nearest: return GRA_NearestNeighbour;
    case Resampling::bilinear: return GRA_Bilinear;
    case Resampling::cubic: return GRA_Cubic;
    }
    return GRA_Bilinear;
}

std::string join(const std::string &base, const std::string &path)
{
    const auto b(ba::trim_right_copy_if(base, ba::is_any_of("/")));
    const auto p(ba::trim_left_copy_if(path, ba::is_any_of("/")));
    if (p.empty()) { return b; }
    if (b.empty()) { return p; }
    return b + "/" + p;
}

std::string tileTemplate(const std::string &base, const TileMatrixSet &tms
                         , const std::string &format)
{
    return join(base, tms.id)
        + "/{tileMatrix}/{tileRow}/{tileCol}?f=" + format;
}

const Json::Value& option(const Json::Value &options, const char *name
                          , bool (Json::Value::*check)() const
                          , const char *what)
{
    const auto &value(options[name]);
    if (!value.isNull() && !(value.*check)()) {
        LOGTHROW(err2, ProviderConnectionError)
            << "Tile provider option <" << name << "> is not " << what
            << ".";
    }
    return value;
}

template <typename Enum>
Enum enumOption(const Json::Value &options, const char *name, Enum dflt)
{
    const auto &value(options[name]);
    if (value.isNull()) { return dflt; }
    if (!value.isString()) {
        LOGTHROW(err2, ProviderConnectionError)
            << "Tile provider option <" << name << "> is not a string.";
    }
    try {
        return boost::lexical_cast<Enum>
            (ba::to_lower_copy(value.asString()));
    } catch (const boost::bad_lexical_cast&) {
        LOGTHROW(err2, ProviderConnectionError)
            << "Invalid value <" << value.asString()
            << "> of tile provider option <" << name << ">.";
    }
    throw; // never reached
}

/** Bounds valid in given tile matrix set.
 */
math::Extents2 clampBounds(const TileMatrixSet &tms, math::Extents2 bounds)
{
    bounds.ll(0) = std::max(bounds.ll(0), -180.0);
    bounds.ur(0) = std::min(bounds.ur(0), 180.0);
    const double maxLat((tms.id == "WebMercatorQuad")
                        ? MaxMercatorLatitude : 90.0);
    bounds.ll(1) = std::max(bounds.ll(1), -maxLat);
    bounds.ur(1) = std::min(bounds.ur(1), maxLat);
    return bounds;
}

bool disjoint(const math::Extents2 &a, const math::Extents2 &b)
{
    return ((a.ur(0) <= b.ll(0)) || (b.ur(0) <= a.ll(0))
            || (a.ur(1) <= b.ll(1)) || (b.ur(1) <= a.ll(1)));
}

std::string cacheKey(const TileMatrixSet &tms, int z, int x, int y
                     , TileFormat format)
{
    return tms.id + "/" + boost::lexical_cast<std::string>(z)
        + "/" + boost::lexical_cast<std::string>(x)
        + "/" + boost::lexical_cast<std::string>(y)
        + "." + boost::lexical_cast<std::string>(format);
}

/** Bands to render: RGB from 3+ band rasters, gray from anything else.
 */
std::vector<int> renderBands(::GDALDataset &ds)
{
    std::vector<int> bands;
    const int count(ds.GetRasterCount());
    for (int i(1); i <= count; ++i) {
        if (ds.GetRasterBand(i)->GetColorInterpretation() == GCI_AlphaBand) {
            continue;
        }
        bands.push_back(i);
        if (bands.size() == 3) { break; }
    }
    if (bands.size() == 2) { bands.resize(1); }
    return bands;
}

int alphaBand(::GDALDataset &ds)
{
    for (int i(1); i <= ds.GetRasterCount(); ++i) {
        if (ds.GetRasterBand(i)->GetColorInterpretation() == GCI_AlphaBand) {
            return i;
        }
    }
    return 0;
}

typedef std::unique_ptr<void, void(*)(void*)> Transformer;

/** Warps source dataset into destination dataset. Last destination band
 *  is alpha.
 */
void warp(::GDALDataset &src, ::GDALDataset &dst
          , const std::vector<int> &bands, const std::string &srcSrs
          , Resampling resampling)
{
    char **to(nullptr);
    if (!srcSrs.empty()) { to = ::CSLSetNameValue(to, "SRC_SRS"
                                                  , srcSrs.c_str()); }
    Transformer transformer(::GDALCreateGenImgProjTransformer2
                            (::GDALDataset::ToHandle(&src)
                             , ::GDALDataset::ToHandle(&dst), to)
                            , &::GDALDestroyGenImgProjTransformer);
    ::CSLDestroy(to);

    if (!transformer) {
        LOGTHROW(err2, std::runtime_error)
            << "Cannot create warp transformation: "
            << ::CPLGetLastErrorMsg();
    }

    std::unique_ptr< ::GDALWarpOptions, void(*)(::GDALWarpOptions*)>
        wo(::GDALCreateWarpOptions(), &::GDALDestroyWarpOptions);

    wo->hSrcDS = ::GDALDataset::ToHandle(&src);
    wo->hDstDS = ::GDALDataset::ToHandle(&dst);
    wo->eResampleAlg = resampleAlg(resampling);
    wo->pfnTransformer = ::GDALGenImgProjTransform;
    wo->pTransformerArg = transformer.get();

    const int count(int(bands.size()));
    wo->nBandCount = count;
    wo->panSrcBands = static_cast<int*>(::CPLMalloc(count * sizeof(int)));
    wo->panDstBands = static_cast<int*>(::CPLMalloc(count * sizeof(int)));
    for (int i(0); i < count; ++i) {
        wo->panSrcBands[i] = bands[i];
        wo->panDstBands[i] = i + 1;
    }
    wo->nSrcAlphaBand = alphaBand(src);
    wo->nDstAlphaBand = dst.GetRasterCount();

    int hasNodata(0);
    const double nodata(src.GetRasterBand(bands.front())
                        ->GetNoDataValue(&hasNodata));
    if (hasNodata) {
        wo->padfSrcNoDataReal = static_cast<double*>
            (::CPLCalloc(count, sizeof(double)));
        for (int i(0); i < count; ++i) { wo->padfSrcNoDataReal[i] = nodata; }
    }

    ::GDALWarpOperation operation;
    if ((operation.Initialize(wo.get()) != CE_None)
        || (operation.ChunkAndWarpImage(0, 0, dst.GetRasterXSize()
                                        , dst.GetRasterYSize()) != CE_None))
    {
        LOGTHROW(err2, std::runtime_error)
            << "Cannot warp <" << src.GetDescription() << ">: "
            << ::CPLGetLastErrorMsg();
    }
}

/** Band value range, empty when it cannot be computed.
 */
detail::Stretch computeStretch(::GDALRasterBand &band)
{
    double minmax[2];
    if (band.ComputeRasterMinMax(TRUE, minmax) != CE_None) {
        LOG(warn1) << "Cannot compute value range of band "
                   << band.GetBand() << ".";
        return {};
    }
    return detail::Stretch(minmax[0], minmax[1]);
}

} // namespace

TileProvider::TileProvider(const ProviderDefinition &definition)
    : Provider(definition)
    , metadataFormat_(TilesMetadataFormat::json)
    , resampling_(Resampling::bilinear)
{
    try {
        registerAll();
        metadata_ = gimirrai::gimiMetadata(definition.data);
        if (metadata_.images.empty()) {
            LOGTHROW(err2, std::runtime_error)
                << "No image found in " << definition.data << ".";
        }

        // data bounds in CRS84
        bool first(true);
        for (const auto &im : metadata_.images) {
            auto e(im.extents());
            if (im.crs != 4326) {
                e = detail::SrsTransformer(detail::epsg(im.crs)
                                           , detail::epsg(4326))(e);
            }
            if (first) {
                bounds_ = e;
                first = false;
            } else {
                bounds_ = math::Extents2
                    (std::min(bounds_.ll(0), e.ll(0))
                     , std::min(bounds_.ll(1), e.ll(1))
                     , std::max(bounds_.ur(0), e.ur(0))
                     , std::max(bounds_.ur(1), e.ur(1)));
            }
        }
    } catch (const std::exception &e) {
        LOG(warn2) << e.what();
        throw ProviderConnectionError(e.what());
    }

    const auto &options(this->options());

    const auto &bounds(option(options, "bounds", &Json::Value::isArray
                              , "a list"));
    if (!bounds.isNull()) {
        if (bounds.size() != 4) {
            LOGTHROW(err2, ProviderConnectionError)
                << "Tile provider option <bounds> must hold 4 numbers.";
        }
        double b[4];
        for (int i(0); i < 4; ++i) {
            if (!bounds[i].isNumeric()) {
                LOGTHROW(err2, ProviderConnectionError)
                    << "Tile provider option <bounds> holds a non-number.";
            }
            b[i] = bounds[i].asDouble();
        }
        bounds_ = math::Extents2(b[0], b[1], b[2], b[3]);
    }

    int minZoom(0), maxZoom(std::numeric_limits<int>::max());
    const auto &zoom(option(options, "zoom", &Json::Value::isObject
                            , "an object"));
    if (!zoom.isNull()) {
        const auto &zmin(option(zoom, "min", &Json::Value::isInt
                                , "an integer"));
        const auto &zmax(option(zoom, "max", &Json::Value::isInt
                                , "an integer"));
        if (!zmin.isNull()) { minZoom = zmin.asInt(); }
        if (!zmax.isNull()) { maxZoom = zmax.asInt(); }
        if (minZoom > maxZoom) {
            LOGTHROW(err2, ProviderConnectionError)
                << "Invalid zoom range " << minZoom << ".." << maxZoom << ".";
        }
    }

    std::vector<const TileMatrixSet*> tmss;
    const auto &schemes(option(options, "schemes", &Json::Value::isArray
                               , "a list"));
    if (schemes.isNull()) {
        for (const auto &tms : TileMatrixSet::all()) { tmss.push_back(&tms); }
    } else {
        for (const auto &id : schemes) {
            if (!id.isString()) {
                LOGTHROW(err2, ProviderConnectionError)
                    << "Tile provider option <schemes> holds a non-string.";
            }
            const auto *tms(TileMatrixSet::find(id.asString()));
            if (!tms) {
                LOGTHROW(err2, ProviderConnectionError)
                    << "Unknown tile matrix set <" << id.asString() << ">.";
            }
            tmss.push_back(tms);
        }
    }

    for (const auto *tms : tmss) {
        Scheme scheme;
        scheme.tms = tms;
        scheme.minZoom = std::max(minZoom, tms->minZoom);
        scheme.maxZoom = std::min(maxZoom, tms->maxZoom);
        if (scheme.minZoom > scheme.maxZoom) {
            LOG(warn2) << "Zoom range does not intersect " << tms->id
                       << ", skipping.";
            continue;
        }

        try {
            scheme.extents = detail::SrsTransformer
                (detail::epsg(4326), tms->srs)(clampBounds(*tms, bounds_));
        } catch (const std::exception &e) {
            LOGTHROW(err2, ProviderConnectionError)
                << "Cannot transform bounds into " << tms->id << ": "
                << e.what();
        }

        schemes_.push_back(scheme);
    }

    metadataFormat_ = enumOption(options, "metadata_format"
                                 , TilesMetadataFormat::json);
    resampling_ = enumOption(options, "resampling", Resampling::bilinear);

    const auto &cache(option(options, "cache", &Json::Value::isString
                             , "a string"));
    if (!cache.isNull()) {
        const auto &ttl(option(options, "cache_ttl", &Json::Value::isIntegral
                                   , "an integer"));
        cache_ = detail::TileCache(cache.asString()
                                   , ttl.isNull() ? 0 : ttl.asInt());
        LOG(info2) << "Caching tiles in " << cache.asString() << ".";
    }

    LOG(info2) << "Tile provider for " << definition.data << " with "
               << schemes_.size() << " tiling scheme(s).";
}

std::string TileProvider::layer() const
{
    return fs::path(data()).filename().string();
}

Json::Value TileProvider::tilingSchemes() const
{
    Json::Value links(Json::arrayValue);
    for (const auto &scheme : schemes_) { links.append(scheme.tms->link()); }
    return links;
}

Json::Value TileProvider::tilesService(const std::string &baseUrl
                                       , const std::string &servicePath
                                       , const std::string &format) const
{
    const auto f(parseFormat(format));
    const auto base(join(baseUrl, servicePath));

    Json::Value service(Json::objectValue);
    auto &links(service["links"] = Json::arrayValue);
    for (const auto &scheme : schemes_) {
        Json::Value link(Json::objectValue);
        link["type"] = mimetype(f);
        link["rel"] = "item";
        link["title"] = "This collection as image tiles ("
            + scheme.tms->id + ")";
        link["href"] = tileTemplate(base, *scheme.tms, format);
        link["templated"] = true;
        links.append(link);
    }
    return service;
}

const TileProvider::Scheme&
TileProvider::scheme(const std::string &tileMatrixSet) const
{
    for (const auto &scheme : schemes_) {
        if (scheme.tms->id == tileMatrixSet) { return scheme; }
    }

    LOGTHROW(warn2, ProviderTilesetIdNotFoundError)
        << "Tile matrix set <" << tileMatrixSet << "> not available.";
    throw; // never reached
}

boost::optional<TileProvider::Tile>
TileProvider::tile(const std::string &tileMatrixSet, int z, int y, int x
                   , const std::string &format) const
{
    const auto &s(scheme(tileMatrixSet));

    if ((z < s.minZoom) || (z > s.maxZoom)) {
        LOGTHROW(warn2, ProviderTileNotFoundError)
            << "Zoom " << z << " outside of range " << s.minZoom
            << ".." << s.maxZoom << ".";
    }

    if (!s.tms->valid(z, x, y)) {
        LOGTHROW(warn2, ProviderTileNotFoundError)
            << "Tile " << z << "/" << x << "/" << y
            << " outside of tile matrix.";
    }

    const auto f(parseFormat(format));

    if (disjoint(s.tms->tileExtents(z, x, y), s.extents)) {
        LOG(info1) << "Tile z=" << z << " x=" << x << " y=" << y
                   << " outside bounds.";
        return boost::none;
    }

    if (!cache_) { return render(s, z, x, y, f); }

    const auto key(cacheKey(*s.tms, z, x, y, f));
    auto entry(cache_->fetch(key));
    switch (entry.type) {
    case detail::TileCache::Entry::Type::valid: {
        Tile tile;
        tile.data = std::move(entry.data);
        tile.mimetype = mimetype(f);
        return tile;
    }

    case detail::TileCache::Entry::Type::empty:
        return boost::none;

    case detail::TileCache::Entry::Type::notFound:
        break;
    }

    const auto tile(render(s, z, x, y, f));
    if (tile) {
        detail::TileCache::Entry e;
        e.data = tile->data;
        cache_->store(key, e);
    } else {
        cache_->store(key, detail::TileCache::Entry
                      (detail::TileCache::Entry::Type::empty));
    }
    return tile;
}

boost::optional<TileProvider::Tile>
TileProvider::render(const Scheme &scheme, int z, int x, int y
                     , TileFormat format) const
{
    const auto &tms(*scheme.tms);
    const auto extents(tms.tileExtents(z, x, y));
    const auto &ts(tms.tileSize);

    LOG(info1) << "Rendering tile " << tms.id << "/" << z << "/" << x
               << "/" << y << ".";

    // sources intersecting the tile
    struct Source {
        detail::Dataset ds;
        std::vector<int> bands;
        std::string srs;

        Source(detail::Dataset &&ds) : ds(std::move(ds)) {}
    };
    std::vector<Source> sources;

    bool byteData(true);
    int channels(1);

    try {
        for (const auto &im : metadata_.images) {
            const auto e(detail::SrsTransformer(detail::epsg(im.crs), tms.srs)
                         (clampBounds(tms, detail::SrsTransformer
                                      (detail::epsg(im.crs)
                                       , detail::epsg(4326))(im.extents()))));
            if (disjoint(e, extents)) { continue; }

            sources.emplace_back(detail::openDataset(im.source));
            auto &source(sources.back());
            source.bands = renderBands(*source.ds);
            if (source.bands.empty()) {
                sources.pop_back();
                continue;
            }

            const char *wkt(source.ds->GetProjectionRef());
            if (!wkt || !*wkt) {
                source.srs = detail::epsg(im.crs)
                    .as(geo::SrsDefinition::Type::wkt).srs;
            }

            channels = std::max(channels, int(source.bands.size()));
            for (auto b : source.bands) {
                if (source.ds->GetRasterBand(b)->GetRasterDataType()
                    != GDT_Byte)
                {
                    byteData = false;
                }
            }
        }
    } catch (const std::exception &e) {
        LOGTHROW(err2, ProviderQueryError)
            << "Cannot open data of " << data() << ": " << e.what();
    }

    if (sources.empty()) {
        LOG(info1) << "No image intersects tile " << tms.id << "/" << z
                   << "/" << x << "/" << y << ".";
        return boost::none;
    }

    std::vector<detail::Stretch> stretch(channels);
    cv::Mat image(ts.height, ts.width, CV_8UC4, cv::Scalar(0, 0, 0, 0));

    try {
        auto dst(detail::createMemDataset
                 (ts, channels + 1, byteData ? GDT_Byte : GDT_Float32));

        geo::GeoTransform gt;
        gt[0] = extents.ll(0);
        gt[1] = (extents.ur(0) - extents.ll(0)) / ts.width;
        gt[2] = 0.0;
        gt[3] = extents.ur(1);
        gt[4] = 0.0;
        gt[5] = -(extents.ur(1) - extents.ll(1)) / ts.height;
        detail::setGeoTransform(*dst, gt);

        const auto dstSrs(detail::gisReference(tms.srs));
        dst->SetSpatialRef(&dstSrs);
        dst->GetRasterBand(channels + 1)
            ->SetColorInterpretation(GCI_AlphaBand);

        for (auto &source : sources) {
            auto bands(source.bands);
            // gray source into color tile
            while (int(bands.size()) < channels) {
                bands.push_back(bands.front());
            }
            warp(*source.ds, *dst, bands, source.srs, resampling_);

            // common range over all sources
            if (!byteData) {
                for (int c(0); c < channels; ++c) {
                    stretch[c].update(computeStretch
                                      (*source.ds->GetRasterBand(bands[c])));
                }
            }
        }

        for (auto &s : stretch) {
            if (s.empty()) { s = detail::Stretch(0.0, 255.0); }
        }

        // BGRA
        std::vector<double> values(std::size_t(ts.width) * ts.height);
        const auto readBand([&](int band)
        {
            if (dst->GetRasterBand(band)->RasterIO
                (GF_Read, 0, 0, ts.width, ts.height, values.data()
                 , ts.width, ts.height, GDT_Float64, 0, 0, nullptr)
                != CE_None)
            {
                LOGTHROW(err2, std::runtime_error)
                    << "Cannot read warped band " << band << ": "
                    << ::CPLGetLastErrorMsg();
            }
        });

        for (int c(0); c < 3; ++c) {
            const int channel(std::min(c, channels - 1));
            readBand(channel + 1);
            const auto &s(stretch[channel]);
            auto i(values.begin());
            for (int row(0); row < ts.height; ++row) {
                auto *p(image.ptr<cv::Vec4b>(row));
                for (int col(0); col < ts.width; ++col, ++i) {
                    p[col][2 - c] = byteData
                        ? std::uint8_t(*i) : s(*i);
                }
            }
        }

        readBand(channels + 1);
        auto i(values.begin());
        for (int row(0); row < ts.height; ++row) {
            auto *p(image.ptr<cv::Vec4b>(row));
            for (int col(0); col < ts.width; ++col, ++i) {
                p[col][3] = std::uint8_t(*i);
            }
        }
    } catch (const ProviderError&) {
        throw;
    } catch (const std::exception &e) {
        LOGTHROW(err2, ProviderQueryError)
            << "Cannot render tile " << tms.id << "/" << z << "/" << x
            << "/" << y << ": " << e.what();
    }

    std::vector<uchar> buf;
    bool encoded(false);
    switch (format) {
    case TileFormat::png:
        encoded = cv::imencode(".png", image, buf);
        break;

    case TileFormat::jpeg: {
        cv::Mat bgr(image.rows, image.cols, CV_8UC3);
        int fromTo[] = { 0, 0, 1, 1, 2, 2 };
        cv::mixChannels(&image, 1, &bgr, 1, fromTo, 3);
        encoded = cv::imencode(".jpg", bgr, buf);
        break;
    }
    }

    if (!encoded) {
        LOGTHROW(err2, ProviderQueryError)
            << "Cannot encode tile as " << format << ".";
    }

    Tile tile;
    tile.data.assign(buf.begin(), buf.end());
    tile.mimetype = mimetype(format);
    return tile;
}

Json::Value TileProvider::tilesetMetadata
(const Scheme &scheme, const std::string &serverUrl
 , const std::string &title, const std::string &description
 , const std::vector<std::string> &keywords) const
{
    const auto &tms(*scheme.tms);

    Json::Value md(Json::objectValue);
    md["title"] = title.empty() ? layer() : title;
    md["description"] = description;
    auto &kw(md["keywords"] = Json::arrayValue);
    for (const auto &keyword : keywords) { kw.append(keyword); }
    md["dataType"] = "map";
    md["crs"] = tms.crs;
    md["tileMatrixSetURI"] = tms.uri;

    auto &bbox(md["boundingBox"] = Json::objectValue);
    bbox["lowerLeft"].append(bounds_.ll(0));
    bbox["lowerLeft"].append(bounds_.ll(1));
    bbox["upperRight"].append(bounds_.ur(0));
    bbox["upperRight"].append(bounds_.ur(1));
    bbox["crs"] = Crs84;

    auto &limits(md["tileMatrixSetLimits"] = Json::arrayValue);
    for (int z(scheme.minZoom); z <= scheme.maxZoom; ++z) {
        const auto range(tms.tileRange(z, scheme.extents));
        if (!range) { continue; }

        Json::Value limit(Json::objectValue);
        limit["tileMatrix"] = boost::lexical_cast<std::string>(z);
        limit["minTileRow"] = range->minRow;
        limit["maxTileRow"] = range->maxRow;
        limit["minTileCol"] = range->minCol;
        limit["maxTileCol"] = range->maxCol;
        limits.append(limit);
    }

    auto &links(md["links"] = Json::arrayValue);
    {
        Json::Value link(Json::objectValue);
        link["rel"] = "http://www.opengis.net/def/rel/ogc/1.0/tiling-scheme";
        link["type"] = "application/json";
        link["title"] = tms.id + " definition";
        link["href"] = tms.uri;
        links.append(link);
    }
    {
        Json::Value link(Json::objectValue);
        link["rel"] = "item";
        link["type"] = mimetype(TileFormat::png);
        link["title"] = title.empty() ? layer() : title;
        link["href"] = tileTemplate(serverUrl, tms, "png");
        link["templated"] = true;
        links.append(link);
    }

    return md;
}

Json::Value TileProvider::tileJson(const Scheme &scheme
                                   , const std::string &serverUrl
                                   , const std::string &title
                                   , const std::string &description) const
{
    Json::Value tj(Json::objectValue);
    tj["tilejson"] = "3.0.0";
    tj["name"] = title.empty() ? layer() : title;
    tj["description"] = description;
    tj["tiles"].append(tileTemplate(serverUrl, *scheme.tms, "png"));
    tj["minzoom"] = scheme.minZoom;
    tj["maxzoom"] = scheme.maxZoom;

    auto &bounds(tj["bounds"] = Json::arrayValue);
    bounds.append(bounds_.ll(0));
    bounds.append(bounds_.ll(1));
    bounds.append(bounds_.ur(0));
    bounds.append(bounds_.ur(1));

    auto &center(tj["center"] = Json::arrayValue);
    center.append((bounds_.ll(0) + bounds_.ur(0)) / 2.0);
    center.append((bounds_.ll(1) + bounds_.ur(1)) / 2.0);
    center.append(scheme.minZoom);

    return tj;
}

Json::Value TileProvider::metadata(const std::string &metadataFormat
                                   , const std::string &serverUrl
                                   , const std::string &title
                                   , const std::string &description
                                   , const std::vector<std::string> &keywords
                                   , const std::string &tileset) const
{
    TilesMetadataFormat mf(TilesMetadataFormat::json);
    try {
        mf = boost::lexical_cast<TilesMetadataFormat>
            (ba::to_lower_copy(metadataFormat));
    } catch (const boost::bad_lexical_cast&) {
        LOGTHROW(warn2, ProviderInvalidQueryError)
            << "Unsupported tiles metadata format <" << metadataFormat
            << ">.";
    }

    if (schemes_.empty()) {
        LOGTHROW(warn2, ProviderTilesetIdNotFoundError)
            << "No tiling scheme configured.";
    }

    switch (mf) {
    case TilesMetadataFormat::json:
        if (!tileset.empty()) {
            return tilesetMetadata(scheme(tileset), serverUrl, title
                                   , description, keywords);
        } else {
            Json::Value list(Json::arrayValue);
            for (const auto &s : schemes_) {
                list.append(tilesetMetadata(s, serverUrl, title
                                            , description, keywords));
            }
            return list;
        }

    case TilesMetadataFormat::tilejson:
        return tileJson(tileset.empty() ? schemes_.front() : scheme(tileset)
                        , serverUrl, title, description);
    }

    return Json::Value();
}

} // namespace gimirrai
