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
#include <cctype>
#include <limits>
#include <stdexcept>

#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/case_conv.hpp>

#include <cpl_conv.h>
#include <cpl_error.h>
#include <cpl_vsi.h>

#include "dbglog/dbglog.hpp"

#include "./dataset.hpp"

namespace ba = boost::algorithm;

namespace gimirrai { namespace detail {

namespace {

namespace def {
    const int EdgeSamples(21);
} // namespace def

Dataset wrap(::GDALDatasetH ds)
{
    return Dataset(::GDALDataset::FromHandle(ds), &closeGdalDataset);
}

bool allDigits(const std::string &value)
{
    return !value.empty()
        && std::all_of(value.begin(), value.end()
                       , [](char c)
    {
        return std::isdigit(static_cast<unsigned char>(c));
    });
}

} // namespace

void closeGdalDataset(::GDALDataset *ds) { ::GDALClose(ds); }

Dataset openDataset(const std::string &path)
{
    const char *gimiOnly[] = { "GIMI", nullptr };
    const auto flags(GDAL_OF_RASTER | GDAL_OF_READONLY);

    {
        // GIMI driver first, HEIF driver would accept the file as well
        ::CPLPushErrorHandler(::CPLQuietErrorHandler);
        auto ds(wrap(::GDALOpenEx(path.c_str(), flags, gimiOnly
                                  , nullptr, nullptr)));
        ::CPLPopErrorHandler();
        if (ds) { return ds; }
    }

    ::CPLErrorReset();
    auto ds(wrap(::GDALOpenEx(path.c_str(), flags, nullptr
                              , nullptr, nullptr)));
    if (!ds) {
        LOGTHROW(err2, std::runtime_error)
            << "file " << path << " is not supported ("
            << ::CPLGetLastErrorMsg() << ").";
    }
    return ds;
}

Dataset createMemDataset(const math::Size2 &size, int bands
                         , ::GDALDataType type)
{
    auto *driver(::GetGDALDriverManager()->GetDriverByName("MEM"));
    if (!driver) {
        LOGTHROW(err2, std::runtime_error)
            << "Cannot find GDAL MEM driver.";
    }

    Dataset ds(driver->Create("", size.width, size.height, bands
                              , type, nullptr)
               , &closeGdalDataset);
    if (!ds) {
        LOGTHROW(err2, std::runtime_error)
            << "Cannot create in-memory dataset of size "
            << size.width << "x" << size.height << ": "
            << ::CPLGetLastErrorMsg();
    }
    return ds;
}

geo::GeoTransform geoTransform(::GDALDataset &ds)
{
    geo::GeoTransform gt;
    if (::GDALGetGeoTransform(::GDALDataset::ToHandle(&ds), gt.data())
        != CE_None)
    {
        LOGTHROW(err2, std::runtime_error)
            << "Dataset <" << ds.GetDescription()
            << "> has no geo transformation.";
    }
    return gt;
}

void setGeoTransform(::GDALDataset &ds, const geo::GeoTransform &gt)
{
    auto tmp(gt);
    if (::GDALSetGeoTransform(::GDALDataset::ToHandle(&ds), tmp.data())
        != CE_None)
    {
        LOGTHROW(err2, std::runtime_error)
            << "Cannot set geo transformation: "
            << ::CPLGetLastErrorMsg();
    }
}

int datasetEpsg(::GDALDataset &ds, int fallback)
{
    const char *wkt(ds.GetProjectionRef());
    if (!wkt || !*wkt) { return fallback; }

    ::OGRSpatialReference srs;
    if (srs.SetFromUserInput(wkt) != OGRERR_NONE) { return fallback; }
    srs.AutoIdentifyEPSG();

    const char *name(srs.GetAuthorityName(nullptr));
    const char *code(srs.GetAuthorityCode(nullptr));
    if (!name || !code || !ba::iequals(name, "EPSG")) { return fallback; }

    try {
        return boost::lexical_cast<int>(code);
    } catch (const boost::bad_lexical_cast&) {
        LOG(warn1) << "Invalid EPSG code <" << code << ">.";
    }
    return fallback;
}

std::string dtypeName(::GDALDataType type)
{
    switch (type) {
    case GDT_Byte: return "uint8";
    case GDT_UInt16: return "uint16";
    case GDT_Int16: return "int16";
    case GDT_UInt32: return "uint32";
    case GDT_Int32: return "int32";
    case GDT_Float32: return "float32";
    case GDT_Float64: return "float64";
    case GDT_CInt16: return "complex_int16";
    case GDT_CFloat32: return "complex64";
    case GDT_CFloat64: return "complex128";
    default: break;
    }

    const char *name(::GDALGetDataTypeName(type));
    return name ? ba::to_lower_copy(std::string(name)) : "unknown";
}

Buffer encode(::GDALDataset &ds, const std::string &driverName
              , const std::vector<std::string> &options)
{
    auto *driver(::GetGDALDriverManager()
                 ->GetDriverByName(driverName.c_str()));
    if (!driver) {
        LOGTHROW(err2, std::runtime_error)
            << "Unknown GDAL driver <" << driverName << ">.";
    }

    std::string path(str(boost::format("/vsimem/gimirrai-%p") % &ds));
    if (const char *ext = driver->GetMetadataItem(GDAL_DMD_EXTENSION)) {
        if (*ext) { path += std::string(".") + ext; }
    }

    std::vector<const char*> opts;
    for (const auto &option : options) { opts.push_back(option.c_str()); }
    opts.push_back(nullptr);

    LOG(debug) << "Encoding dataset as " << driverName
               << " into " << path << ".";

    {
        Dataset out(driver->CreateCopy(path.c_str(), &ds, FALSE
                                       , const_cast<char**>(opts.data())
                                       , nullptr, nullptr)
                    , &closeGdalDataset);
        if (!out) {
            ::VSIUnlink(path.c_str());
            LOGTHROW(err2, std::runtime_error)
                << "Cannot encode dataset as " << driverName << ": "
                << ::CPLGetLastErrorMsg();
        }
    }

    ::vsi_l_offset size(0);
    auto *data(::VSIGetMemFileBuffer(path.c_str(), &size, TRUE));
    ::VSIUnlink((path + ".aux.xml").c_str());
    if (!data) {
        LOGTHROW(err2, std::runtime_error)
            << "Encoded dataset " << path << " not found.";
    }

    Buffer buffer(reinterpret_cast<const char*>(data)
                  , reinterpret_cast<const char*>(data) + size);
    ::CPLFree(data);
    return buffer;
}

geo::SrsDefinition epsg(int code)
{
    return geo::SrsDefinition(boost::lexical_cast<std::string>(code)
                              , geo::SrsDefinition::Type::epsg);
}

geo::SrsDefinition parseCrs(const std::string &crs)
{
    if (allDigits(crs)) {
        return geo::SrsDefinition(crs, geo::SrsDefinition::Type::epsg);
    }

    if (ba::istarts_with(crs, "EPSG:") && allDigits(crs.substr(5))) {
        return geo::SrsDefinition(crs.substr(5)
                                  , geo::SrsDefinition::Type::epsg);
    }

    // http://www.opengis.net/def/crs/EPSG/0/<code>
    const auto pos(crs.find("/def/crs/EPSG/"));
    if (pos != std::string::npos) {
        const auto code(crs.substr(crs.rfind('/') + 1));
        if (allDigits(code)) {
            return geo::SrsDefinition(code, geo::SrsDefinition::Type::epsg);
        }
    }

    // CRS84 differs from EPSG:4326 only in axis order
    if (ba::iends_with(crs, "CRS84")) { return epsg(4326); }

    return geo::SrsDefinition::fromString(crs);
}

::OGRSpatialReference gisReference(const geo::SrsDefinition &srs)
{
    auto ref(srs.reference());
    ref.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
    return ref;
}

SrsTransformer::SrsTransformer(const geo::SrsDefinition &src
                               , const geo::SrsDefinition &dst)
    : identity_(false)
{
    auto srcRef(gisReference(src));
    auto dstRef(gisReference(dst));

    if (srcRef.IsSame(&dstRef)) {
        identity_ = true;
        return;
    }

    trafo_.reset(::OGRCreateCoordinateTransformation(&srcRef, &dstRef)
                 , [](::OGRCoordinateTransformation *trafo)
                 {
                     ::OGRCoordinateTransformation::DestroyCT(trafo);
                 });

    if (!trafo_) {
        LOGTHROW(err2, std::runtime_error)
            << "Cannot create coordinate transformation: "
            << ::CPLGetLastErrorMsg();
    }
}

math::Point2 SrsTransformer::operator()(const math::Point2 &p) const
{
    if (identity_) { return p; }

    double x(p(0)), y(p(1));
    if (!trafo_->Transform(1, &x, &y)) {
        LOGTHROW(err1, std::runtime_error)
            << "Cannot transform point (" << p(0) << ", " << p(1) << ").";
    }
    return math::Point2(x, y);
}

math::Extents2 SrsTransformer::operator()(const math::Extents2 &e) const
{
    if (identity_) { return e; }

    std::vector<double> xs, ys;
    const auto step(1.0 / (def::EdgeSamples - 1));
    for (int i(0); i < def::EdgeSamples; ++i) {
        const auto x(e.ll(0) + i * step * (e.ur(0) - e.ll(0)));
        const auto y(e.ll(1) + i * step * (e.ur(1) - e.ll(1)));
        xs.insert(xs.end(), { x, x, e.ll(0), e.ur(0) });
        ys.insert(ys.end(), { e.ll(1), e.ur(1), y, y });
    }

    std::vector<int> success(xs.size());
    trafo_->Transform(xs.size(), xs.data(), ys.data(), nullptr
                      , success.data());

    auto inf(std::numeric_limits<double>::infinity());
    double xmin(inf), ymin(inf), xmax(-inf), ymax(-inf);
    bool valid(false);
    for (std::size_t i(0); i < xs.size(); ++i) {
        if (!success[i]) { continue; }
        xmin = std::min(xmin, xs[i]); xmax = std::max(xmax, xs[i]);
        ymin = std::min(ymin, ys[i]); ymax = std::max(ymax, ys[i]);
        valid = true;
    }

    if (!valid) {
        LOGTHROW(err1, std::runtime_error)
            << "Cannot transform extents (" << e.ll(0) << ", " << e.ll(1)
            << ", " << e.ur(0) << ", " << e.ur(1) << ").";
    }

    return math::Extents2(xmin, ymin, xmax, ymax);
}

} } // namespace gimirrai::detail
