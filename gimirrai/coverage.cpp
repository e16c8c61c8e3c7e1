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
#include <fstream>

#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string/case_conv.hpp>

#include <cpl_string.h>

#include "dbglog/dbglog.hpp"
#include "utility/streams.hpp"

#include "./coverage.hpp"
#include "./register.hpp"

namespace ba = boost::algorithm;

namespace gimirrai {

namespace {

const char *CoverageJsonMimeType("application/prs.coverage+json");
const double PixelEpsilon(1e-9);

struct Window {
    int col;
    int row;
    int width;
    int height;

    Window(int col = 0, int row = 0, int width = 0, int height = 0)
        : col(col), row(row), width(width), height(height)
    {}
};

Json::Value optionalValue(const boost::optional<double> &value)
{
    if (!value) { return Json::Value(); }
    return *value;
}

Json::Value optionalValue(const boost::optional<std::string> &value)
{
    if (!value) { return Json::Value(); }
    return *value;
}

Json::Value regularAxis(const std::string &label, double lower, double upper
                        , const std::string &uom, double resolution)
{
    Json::Value axis(Json::objectValue);
    axis["type"] = "RegularAxis";
    axis["axisLabel"] = label;
    axis["lowerBound"] = lower;
    axis["upperBound"] = upper;
    axis["uomLabel"] = uom;
    axis["resolution"] = resolution;
    return axis;
}

Json::Value indexAxis(const std::string &label, int upper)
{
    Json::Value axis(Json::objectValue);
    axis["type"] = "IndexAxis";
    axis["axisLabel"] = label;
    axis["lowerBound"] = 0;
    axis["upperBound"] = upper;
    return axis;
}

/** Pixels touched by given extents, clipped to the raster.
 */
Window pixelWindow(const ImageMetadata &im, const math::Extents2 &e)
{
    const auto &gt(im.affine);

    const double x1((e.ll(0) - gt[0]) / gt[1]);
    const double x2((e.ur(0) - gt[0]) / gt[1]);
    const double y1((e.ll(1) - gt[3]) / gt[5]);
    const double y2((e.ur(1) - gt[3]) / gt[5]);

    int col0(int(std::floor(std::min(x1, x2) + PixelEpsilon)));
    int col1(int(std::ceil(std::max(x1, x2) - PixelEpsilon)));
    int row0(int(std::floor(std::min(y1, y2) + PixelEpsilon)));
    int row1(int(std::ceil(std::max(y1, y2) - PixelEpsilon)));

    col0 = std::max(col0, 0);
    row0 = std::max(row0, 0);
    col1 = std::min(col1, im.width);
    row1 = std::min(row1, im.height);

    if ((col1 <= col0) || (row1 <= row0)) {
        LOGTHROW(warn2, ProviderQueryError)
            << "Input shapes do not overlap raster.";
    }

    return Window(col0, row0, col1 - col0, row1 - row0);
}

std::vector<int> selectBands(const std::vector<std::string> &properties
                             , int count)
{
    std::vector<int> bands;
    if (properties.empty()) {
        for (int i(1); i <= count; ++i) { bands.push_back(i); }
        return bands;
    }

    for (const auto &property : properties) {
        int band(0);
        try {
            band = boost::lexical_cast<int>(property);
        } catch (const boost::bad_lexical_cast&) {
            LOGTHROW(warn2, ProviderInvalidQueryError)
                << "Invalid band <" << property << ">.";
        }

        if ((band < 1) || (band > count)) {
            LOGTHROW(warn2, ProviderInvalidQueryError)
                << "Band " << band << " out of range 1.." << count << ".";
        }
        bands.push_back(band);
    }
    return bands;
}

typedef std::vector<double> Raster;

Raster readBand(::GDALDataset &ds, int band, const Window &w)
{
    Raster raster(std::size_t(w.width) * w.height);
    auto *b(ds.GetRasterBand(band));
    if (b->RasterIO(GF_Read, w.col, w.row, w.width, w.height
                    , raster.data(), w.width, w.height, GDT_Float64
                    , 0, 0, nullptr) != CE_None)
    {
        LOGTHROW(err2, ProviderQueryError)
            << "Cannot read band " << band << " of <"
            << ds.GetDescription() << ">: " << ::CPLGetLastErrorMsg();
    }
    return raster;
}

/** Scalar options go to the output driver as creation options.
 */
std::vector<std::string> creationOptions(const Json::Value &options)
{
    std::vector<std::string> out;
    for (const auto &key : options.getMemberNames()) {
        if ((key == "crs") || (key == "native_driver")) { continue; }

        const auto &value(options[key]);
        std::string str;
        if (value.isString()) {
            str = value.asString();
        } else if (value.isBool()) {
            str = value.asBool() ? "YES" : "NO";
        } else if (value.isInt()) {
            str = boost::lexical_cast<std::string>(value.asInt());
        } else if (value.isUInt()) {
            str = boost::lexical_cast<std::string>(value.asUInt());
        } else if (value.isDouble()) {
            str = boost::lexical_cast<std::string>(value.asDouble());
        } else {
            continue;
        }

        out.push_back(ba::to_upper_copy(key) + "=" + str);
    }
    return out;
}

bool canCreate(const std::string &driverName)
{
    auto *driver(::GetGDALDriverManager()
                 ->GetDriverByName(driverName.c_str()));
    if (!driver) { return false; }
    return ::CPLFetchBool(driver->GetMetadata(), GDAL_DCAP_CREATECOPY, false)
        || ::CPLFetchBool(driver->GetMetadata(), GDAL_DCAP_CREATE, false);
}

} // namespace

CoverageProvider::CoverageProvider(const ProviderDefinition &definition)
    : Provider(definition)
    , axes_{ "Long", "Lat" }
    , nativeFormat_(definition.format ? definition.format->name : "GTiff")
{
    try {
        registerAll();
        metadata_ = gimirrai::gimiMetadata(definition.data);
        if (metadata_.images.empty()) {
            LOGTHROW(err2, std::runtime_error)
                << "No image found in " << definition.data << ".";
        }
        if (metadata_.images.front().bands.empty()) {
            LOGTHROW(err2, std::runtime_error)
                << "Image in " << definition.data << " has no bands.";
        }
    } catch (const std::exception &e) {
        LOG(warn2) << e.what();
        throw ProviderConnectionError(e.what());
    }

    const auto &im(image());

    auto &cp(properties_);
    cp.bbox = {{ im.upperLeftLon, im.lowerRightLat
                 , im.lowerRightLon, im.upperLeftLat }};
    cp.bboxCrs = "http://www.opengis.net/def/crs/OGC/1.3/CRS84";
    cp.crsType = "GeographicCRS";
    cp.bboxUnits = "deg";
    cp.xAxisLabel = axes_[0];
    cp.yAxisLabel = axes_[1];
    cp.width = im.width;
    cp.height = im.height;
    cp.resx = im.xResolution;
    cp.resy = im.yResolution;

    for (std::size_t i(1); i <= im.bands.size(); ++i) {
        fields_.push_back(boost::lexical_cast<std::string>(i));
    }

    LOG(info2) << "Coverage provider for " << definition.data << ": "
               << cp.width << "x" << cp.height << " pixels, "
               << fields_.size() << " band(s).";
}

Json::Value CoverageProvider::domainSet() const
{
    const auto &cp(properties_);

    Json::Value ds(Json::objectValue);
    ds["type"] = "DomainSet";

    auto &grid(ds["generalGrid"] = Json::objectValue);
    grid["type"] = "GeneralGridCoverage";
    grid["srsName"] = cp.bboxCrs;

    auto &labels(grid["axisLabels"] = Json::arrayValue);
    labels.append(cp.xAxisLabel);
    labels.append(cp.yAxisLabel);

    auto &axis(grid["axis"] = Json::arrayValue);
    axis.append(regularAxis(cp.xAxisLabel, cp.bbox[0], cp.bbox[2]
                            , cp.bboxUnits, cp.resx));
    axis.append(regularAxis(cp.yAxisLabel, cp.bbox[1], cp.bbox[3]
                            , cp.bboxUnits, cp.resy));

    auto &limits(grid["gridLimits"] = Json::objectValue);
    limits["type"] = "GridLimits";
    limits["srsName"] = "http://www.opengis.net/def/crs/OGC/0/Index2D";
    auto &indexLabels(limits["axisLabels"] = Json::arrayValue);
    indexLabels.append("i");
    indexLabels.append("j");
    auto &indexAxes(limits["axis"] = Json::arrayValue);
    indexAxes.append(indexAxis("i", cp.width));
    indexAxes.append(indexAxis("j", cp.height));

    ds["_meta"]["tags"] = cp.tags;
    return ds;
}

Json::Value CoverageProvider::rangeType() const
{
    Json::Value rt(Json::objectValue);
    rt["type"] = "DataRecord";
    auto &fields(rt["fields"] = Json::arrayValue);

    for (const auto &item : image().bands) {
        const auto &band(item.second);
        LOG(debug) << "Determining range type for band " << band.index << ".";

        Json::Value field(Json::objectValue);
        field["id"] = band.index;
        field["type"] = "Quantity";
        field["name"] = optionalValue(band.description);
        field["encodingInfo"]["dataType"]
            = "http://www.opengis.net/def/dataType/OGC/0/" + band.dtype;
        field["nodata"] = optionalValue(band.nodata);
        fields.append(field);
    }

    return rt;
}

CoverageProvider::Response CoverageProvider::passthrough() const
{
    LOG(info1) << "No query parameters given, returning native data.";

    Response response;
    response.type = Response::Type::native;
    response.mimetype = (definition_.format
                         ? definition_.format->mimetype
                         : "application/octet-stream");

    try {
        utility::ifstreambuf f(data());
        f.seekg(0, std::ifstream::end);
        const std::size_t size(f.tellg());
        f.seekg(0);
        response.data.resize(size);
        f.read(response.data.data(), size);
        f.close();
    } catch (const std::exception &e) {
        LOGTHROW(err2, ProviderQueryError)
            << "Cannot read " << data() << ": " << e.what() << ".";
    }
    return response;
}

CoverageProvider::Response CoverageProvider::query(const Query &query) const
{
    const auto &cp(properties_);
    const auto &im(image());

    if (query.properties.empty() && query.subsets.empty()
        && query.bbox.empty() && (query.format != "json"))
    {
        return passthrough();
    }

    for (const auto &subset : query.subsets) {
        if ((subset.first != cp.xAxisLabel)
            && (subset.first != cp.yAxisLabel))
        {
            LOGTHROW(warn2, ProviderInvalidQueryError)
                << "Invalid subset axis <" << subset.first << ">.";
        }
    }

    const auto fx(query.subsets.find(cp.xAxisLabel));
    const auto fy(query.subsets.find(cp.yAxisLabel));
    const bool spatialSubset((fx != query.subsets.end())
                             && (fy != query.subsets.end()));

    if (spatialSubset && !query.bbox.empty()) {
        LOGTHROW(warn2, ProviderQueryError)
            << "bbox and subsetting by coordinates are exclusive";
    }

    if (query.datetime) {
        LOG(info1) << "Ignoring datetime <" << *query.datetime << ">.";
    }

    const auto bands(selectBands(query.properties, numBands()));

    // output bbox, [minx, miny, maxx, maxy]
    std::array<double, 4> bbox(cp.bbox);
    boost::optional<math::Extents2> window;

    if (!query.bbox.empty()) {
        if (query.bbox.size() != 4) {
            LOGTHROW(warn2, ProviderInvalidQueryError)
                << "bbox must have 4 values, got " << query.bbox.size()
                << ".";
        }

        const auto &b(query.bbox);
        std::copy(b.begin(), b.end(), bbox.begin());

        math::Point2 ll(b[0], b[1]);
        math::Point2 ur(b[2], b[3]);

        const auto &options(this->options());
        if (options.isMember("crs") && options["crs"].isString()) {
            try {
                const detail::SrsTransformer trafo
                    (detail::epsg(query.bboxCrs)
                     , detail::parseCrs(options["crs"].asString()));
                if (!trafo.identity()) {
                    LOG(debug) << "Reprojecting bbox into native coordinates.";
                    ll = trafo(ll);
                    ur = trafo(ur);
                }
            } catch (const ProviderError&) {
                throw;
            } catch (const std::exception &e) {
                LOGTHROW(warn2, ProviderInvalidQueryError)
                    << "Cannot reproject bbox: " << e.what();
            }
        }

        window = math::Extents2(std::min(ll(0), ur(0)), std::min(ll(1), ur(1))
                                , std::max(ll(0), ur(0))
                                , std::max(ll(1), ur(1)));
    } else if (spatialSubset) {
        LOG(debug) << "Creating spatial subset.";
        const auto &x(fx->second);
        const auto &y(fy->second);
        bbox = {{ x.first, y.first, x.second, y.second }};
        window = math::Extents2(std::min(x.first, x.second)
                                , std::min(y.first, y.second)
                                , std::max(x.first, x.second)
                                , std::max(y.first, y.second));
    } else if (!query.subsets.empty()) {
        LOG(info1) << "Subset on a single axis ignored.";
    }

    const Window w(window ? pixelWindow(im, *window)
                   : Window(0, 0, im.width, im.height));

    LOG(info1) << "Reading window " << w.width << "x" << w.height
               << " at (" << w.col << ", " << w.row << ") from "
               << im.source << ".";

    detail::Dataset ds(nullptr, &detail::closeGdalDataset);
    try {
        ds = detail::openDataset(im.source);
    } catch (const std::exception &e) {
        LOGTHROW(err2, ProviderQueryError)
            << "Cannot open " << im.source << ": " << e.what();
    }

    std::vector<Raster> rasters;
    for (auto band : bands) { rasters.push_back(readBand(*ds, band, w)); }

    Response response;

    if (query.format == "json") {
        LOG(debug) << "Creating output in CoverageJSON.";
        response.type = Response::Type::json;
        response.mimetype = CoverageJsonMimeType;

        auto &cj(response.json = Json::objectValue);
        cj["type"] = "Coverage";

        auto &domain(cj["domain"] = Json::objectValue);
        domain["type"] = "Domain";
        domain["domainType"] = "Grid";
        auto &axes(domain["axes"] = Json::objectValue);
        axes["x"]["start"] = bbox[0];
        axes["x"]["stop"] = bbox[2];
        axes["x"]["num"] = w.width;
        axes["y"]["start"] = bbox[3];
        axes["y"]["stop"] = bbox[1];
        axes["y"]["num"] = w.height;

        Json::Value referencing(Json::objectValue);
        referencing["coordinates"].append("x");
        referencing["coordinates"].append("y");
        referencing["system"]["type"] = cp.crsType;
        referencing["system"]["id"] = cp.bboxCrs;
        domain["referencing"].append(referencing);

        auto &parameters(cj["parameters"] = Json::objectValue);
        auto &ranges(cj["ranges"] = Json::objectValue);

        for (std::size_t i(0); i < bands.size(); ++i) {
            const auto &bd(im.bands.at(bands[i]));
            const auto key(boost::lexical_cast<std::string>(bands[i]));

            auto &parameter(parameters[key] = Json::objectValue);
            parameter["type"] = "Parameter";
            parameter["description"] = Json::Value();
            parameter["unit"]["symbol"] = optionalValue(bd.units);
            parameter["observedProperty"]["id"] = Json::Value();
            parameter["observedProperty"]["label"]["en"]
                = optionalValue(bd.description);

            auto &range(ranges[key] = Json::objectValue);
            range["type"] = "NdArray";
            range["dataType"] = "float";
            range["axisNames"].append("y");
            range["axisNames"].append("x");
            range["shape"].append(w.height);
            range["shape"].append(w.width);

            auto &values(range["values"] = Json::arrayValue);
            for (auto value : rasters[i]) {
                if (std::isnan(value) || (bd.nodata && (value == *bd.nodata)))
                {
                    values.append(Json::Value());
                } else {
                    values.append(value);
                }
            }
        }

        return response;
    }

    // native format
    const auto &options(this->options());
    std::string driver("GTiff");
    if (options.isMember("native_driver")
        && options["native_driver"].isString())
    {
        driver = options["native_driver"].asString();
    } else if (canCreate(nativeFormat_)) {
        driver = nativeFormat_;
    } else {
        LOG(info1) << "GDAL cannot write " << nativeFormat_
                   << ", falling back to " << driver << ".";
    }

    try {
        auto mem(detail::createMemDataset
                 (math::Size2(w.width, w.height), int(bands.size())
                  , ds->GetRasterBand(bands.front())->GetRasterDataType()));

        auto gt(im.affine);
        gt[0] += w.col * gt[1];
        gt[3] += w.row * gt[5];
        detail::setGeoTransform(*mem, gt);

        const auto srs(detail::gisReference(detail::epsg(im.crs)));
        mem->SetSpatialRef(&srs);

        for (std::size_t i(0); i < bands.size(); ++i) {
            auto *band(mem->GetRasterBand(int(i) + 1));
            const auto &bd(im.bands.at(bands[i]));
            if (bd.nodata) { band->SetNoDataValue(*bd.nodata); }

            auto &raster(rasters[i]);
            if (band->RasterIO(GF_Write, 0, 0, w.width, w.height
                               , raster.data(), w.width, w.height
                               , GDT_Float64, 0, 0, nullptr) != CE_None)
            {
                LOGTHROW(err2, std::runtime_error)
                    << "Cannot write band " << (i + 1) << ": "
                    << ::CPLGetLastErrorMsg();
            }
        }

        response.type = Response::Type::native;
        response.data = detail::encode(*mem, driver
                                       , creationOptions(options));
    } catch (const std::exception &e) {
        LOGTHROW(err2, ProviderQueryError)
            << "Cannot encode coverage as " << driver << ": " << e.what();
    }

    auto *gdalDriver(::GetGDALDriverManager()->GetDriverByName
                     (driver.c_str()));
    const char *mimetype(gdalDriver ? gdalDriver->GetMetadataItem
                         (GDAL_DMD_MIMETYPE) : nullptr);
    if (mimetype && *mimetype) {
        response.mimetype = mimetype;
    } else if (definition_.format && !definition_.format->mimetype.empty()) {
        response.mimetype = definition_.format->mimetype;
    } else {
        response.mimetype = "application/octet-stream";
    }

    return response;
}

} // namespace gimirrai
