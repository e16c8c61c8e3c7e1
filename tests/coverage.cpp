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
#include <cstring>
#include <memory>
#include <string>
#include <utility>

#include <boost/filesystem.hpp>
#include <boost/optional.hpp>

#include <gtest/gtest.h>

#include <cpl_vsi.h>

#include "gimirrai/coverage.hpp"
#include "gimirrai/detail/dataset.hpp"

#include "./support.hpp"

namespace fs = boost::filesystem;

namespace gimirrai {

namespace {

class CoverageProviderTest : public ::testing::Test {
protected:
    virtual void SetUp() override {
        test::RasterSpec spec;
        spec.bands = 2;
        spec.nodata = -9999.0;
        spec.value = [](int band, int col, int row) -> double {
            if ((band == 1) && !col && !row) { return -9999.0; }
            return (band - 1) * 100.0 + row * 10.0 + col;
        };

        path_ = tmp_ / "coverage.tif";
        test::createRaster(path_, spec);

        provider_ = createProvider<CoverageProvider>
            (test::definition(ProviderType::coverage, path_));
    }

    std::unique_ptr<CoverageProvider>
    provider(const Json::Value &options) const {
        auto pd(test::definition(ProviderType::coverage, path_));
        pd.options = options;
        return createProvider<CoverageProvider>(pd);
    }

    CoverageProvider::Query subset() const {
        CoverageProvider::Query q;
        q.subsets["Long"] = std::make_pair(10.2, 10.5);
        q.subsets["Lat"] = std::make_pair(49.7, 49.9);
        return q;
    }

    test::TemporaryDirectory tmp_;
    fs::path path_;
    std::unique_ptr<CoverageProvider> provider_;
};

/** Single band byte raster, written by drivers with narrow type support.
 */
class ByteCoverageTest : public ::testing::Test {
protected:
    virtual void SetUp() override {
        test::RasterSpec spec;
        spec.type = GDT_Byte;
        path_ = tmp_ / "byte.tif";
        test::createRaster(path_, spec);
    }

    std::unique_ptr<CoverageProvider>
    provider(const Json::Value &options
             , const boost::optional<ProviderDefinition::Format> &format
             = boost::none) const
    {
        auto pd(test::definition(ProviderType::coverage, path_));
        pd.options = options;
        pd.format = format;
        return createProvider<CoverageProvider>(pd);
    }

    test::TemporaryDirectory tmp_;
    fs::path path_;
};

bool isPng(const detail::Buffer &data)
{
    return (data.size() > 8) && !std::memcmp(data.data(), "\x89PNG", 4);
}

ProviderDefinition::Format format(const std::string &name
                                  , const std::string &mimetype)
{
    ProviderDefinition::Format f;
    f.name = name;
    f.mimetype = mimetype;
    return f;
}

} // namespace

TEST_F(CoverageProviderTest, properties)
{
    const auto &cp(provider_->coverageProperties());
    EXPECT_DOUBLE_EQ(10.0, cp.bbox[0]);
    EXPECT_DOUBLE_EQ(49.5, cp.bbox[1]);
    EXPECT_DOUBLE_EQ(11.0, cp.bbox[2]);
    EXPECT_DOUBLE_EQ(50.0, cp.bbox[3]);
    EXPECT_EQ(10, cp.width);
    EXPECT_EQ(5, cp.height);
    EXPECT_DOUBLE_EQ(0.1, cp.resx);
    EXPECT_DOUBLE_EQ(-0.1, cp.resy);
    EXPECT_EQ("Long", cp.xAxisLabel);
    EXPECT_EQ("Lat", cp.yAxisLabel);
    EXPECT_EQ("http://www.opengis.net/def/crs/OGC/1.3/CRS84", provider_->crs());

    EXPECT_EQ(2, provider_->numBands());
    ASSERT_EQ(2u, provider_->fields().size());
    EXPECT_EQ("1", provider_->fields()[0]);
    EXPECT_EQ("2", provider_->fields()[1]);
}

TEST_F(CoverageProviderTest, domainSetAndRangeType)
{
    const auto ds(provider_->domainSet());
    EXPECT_EQ("DomainSet", ds["type"].asString());
    const auto &grid(ds["generalGrid"]);
    ASSERT_EQ(2u, grid["axis"].size());
    EXPECT_EQ("Long", grid["axis"][0]["axisLabel"].asString());
    EXPECT_DOUBLE_EQ(11.0, grid["axis"][0]["upperBound"].asDouble());
    EXPECT_EQ(10, grid["gridLimits"]["axis"][0]["upperBound"].asInt());
    EXPECT_EQ(5, grid["gridLimits"]["axis"][1]["upperBound"].asInt());

    const auto rt(provider_->rangeType());
    EXPECT_EQ("DataRecord", rt["type"].asString());
    ASSERT_EQ(2u, rt["fields"].size());
    EXPECT_EQ(1, rt["fields"][0]["id"].asInt());
    EXPECT_EQ("http://www.opengis.net/def/dataType/OGC/0/float32"
              , rt["fields"][0]["encodingInfo"]["dataType"].asString());
    EXPECT_DOUBLE_EQ(-9999.0, rt["fields"][0]["nodata"].asDouble());
}

TEST_F(CoverageProviderTest, fullCoverageJson)
{
    const auto r(provider_->query(CoverageProvider::Query()));
    ASSERT_EQ(CoverageProvider::Response::Type::json, r.type);
    EXPECT_EQ("application/prs.coverage+json", r.mimetype);

    const auto &cj(r.json);
    EXPECT_EQ("Coverage", cj["type"].asString());
    EXPECT_EQ(10, cj["domain"]["axes"]["x"]["num"].asInt());
    EXPECT_EQ(5, cj["domain"]["axes"]["y"]["num"].asInt());
    EXPECT_DOUBLE_EQ(50.0, cj["domain"]["axes"]["y"]["start"].asDouble());

    ASSERT_TRUE(cj["ranges"].isMember("1"));
    ASSERT_TRUE(cj["ranges"].isMember("2"));
    const auto &values(cj["ranges"]["1"]["values"]);
    ASSERT_EQ(50u, values.size());

    // nodata
    EXPECT_TRUE(values[0].isNull());
    EXPECT_DOUBLE_EQ(1.0, values[1].asDouble());
    EXPECT_DOUBLE_EQ(49.0, values[49].asDouble());

    EXPECT_EQ(5, cj["ranges"]["2"]["shape"][0].asInt());
    EXPECT_EQ(10, cj["ranges"]["2"]["shape"][1].asInt());
}

TEST_F(CoverageProviderTest, spatialSubset)
{
    auto q(subset());
    q.properties.push_back("2");

    const auto r(provider_->query(q));
    const auto &cj(r.json);
    EXPECT_EQ(3, cj["domain"]["axes"]["x"]["num"].asInt());
    EXPECT_EQ(2, cj["domain"]["axes"]["y"]["num"].asInt());
    EXPECT_DOUBLE_EQ(10.2, cj["domain"]["axes"]["x"]["start"].asDouble());
    EXPECT_DOUBLE_EQ(49.9, cj["domain"]["axes"]["y"]["start"].asDouble());

    EXPECT_FALSE(cj["ranges"].isMember("1"));
    const auto &values(cj["ranges"]["2"]["values"]);
    ASSERT_EQ(6u, values.size());
    EXPECT_DOUBLE_EQ(112.0, values[0].asDouble());
    EXPECT_DOUBLE_EQ(124.0, values[5].asDouble());
}

TEST_F(CoverageProviderTest, bboxQuery)
{
    CoverageProvider::Query q;
    q.bbox = { 10.2, 49.7, 10.5, 49.9 };
    q.properties.push_back("1");

    const auto r(provider_->query(q));
    const auto &values(r.json["ranges"]["1"]["values"]);
    ASSERT_EQ(6u, values.size());
    EXPECT_DOUBLE_EQ(12.0, values[0].asDouble());
}

TEST_F(CoverageProviderTest, singleAxisSubsetIsIgnored)
{
    CoverageProvider::Query q;
    q.subsets["Long"] = std::make_pair(10.2, 10.5);

    const auto r(provider_->query(q));
    EXPECT_EQ(10, r.json["domain"]["axes"]["x"]["num"].asInt());
}

TEST_F(CoverageProviderTest, invalidQueries)
{
    {
        auto q(subset());
        q.bbox = { 10.2, 49.7, 10.5, 49.9 };
        EXPECT_THROW(provider_->query(q), ProviderQueryError);
    }

    {
        CoverageProvider::Query q;
        q.subsets["Time"] = std::make_pair(0.0, 1.0);
        EXPECT_THROW(provider_->query(q), ProviderInvalidQueryError);
    }

    {
        CoverageProvider::Query q;
        q.properties.push_back("3");
        EXPECT_THROW(provider_->query(q), ProviderInvalidQueryError);
        q.properties = { "red" };
        EXPECT_THROW(provider_->query(q), ProviderInvalidQueryError);
    }

    {
        CoverageProvider::Query q;
        q.bbox = { 10.0, 49.5, 11.0 };
        EXPECT_THROW(provider_->query(q), ProviderInvalidQueryError);
    }

    {
        CoverageProvider::Query q;
        q.bbox = { 20.0, 20.0, 21.0, 21.0 };
        EXPECT_THROW(provider_->query(q), ProviderQueryError);
    }
}

TEST_F(CoverageProviderTest, passthrough)
{
    CoverageProvider::Query q;
    q.format = "GTiff";

    const auto r(provider_->query(q));
    ASSERT_EQ(CoverageProvider::Response::Type::native, r.type);
    EXPECT_EQ(fs::file_size(path_), r.data.size());
    EXPECT_EQ("application/octet-stream", r.mimetype);
}

TEST_F(CoverageProviderTest, nativeOutput)
{
    auto q(subset());
    q.format = "GTiff";

    const auto r(provider_->query(q));
    ASSERT_EQ(CoverageProvider::Response::Type::native, r.type);
    ASSERT_GT(r.data.size(), 4u);
    EXPECT_TRUE((r.data[0] == 'I') || (r.data[0] == 'M'));
    EXPECT_EQ(r.data[0], r.data[1]);
    EXPECT_EQ("image/tiff", r.mimetype);
}

TEST_F(CoverageProviderTest, bboxInOtherCrs)
{
    // bbox given in web mercator, data in EPSG:4326
    const detail::SrsTransformer trafo(detail::epsg(4326)
                                       , detail::epsg(3857));
    const auto ll(trafo(math::Point2(10.25, 49.75)));
    const auto ur(trafo(math::Point2(10.45, 49.85)));

    CoverageProvider::Query q;
    q.bbox = { ll(0), ll(1), ur(0), ur(1) };
    q.bboxCrs = 3857;
    q.properties.push_back("1");

    Json::Value options(Json::objectValue);
    options["crs"] = "EPSG:4326";
    const auto r(provider(options)->query(q));
    EXPECT_EQ(3, r.json["domain"]["axes"]["x"]["num"].asInt());
    EXPECT_EQ(2, r.json["domain"]["axes"]["y"]["num"].asInt());
    const auto &values(r.json["ranges"]["1"]["values"]);
    ASSERT_EQ(6u, values.size());
    EXPECT_DOUBLE_EQ(12.0, values[0].asDouble());

    // without crs option bbox is taken as native coordinates
    EXPECT_THROW(provider_->query(q), ProviderQueryError);

    // same system, nothing to reproject
    q.bbox = { 10.25, 49.75, 10.45, 49.85 };
    q.bboxCrs = 4326;
    const auto same(provider(options)->query(q));
    EXPECT_DOUBLE_EQ(12.0, same.json["ranges"]["1"]["values"][0].asDouble());

    options["crs"] = "not a crs";
    q.bboxCrs = 3857;
    EXPECT_THROW(provider(options)->query(q), ProviderError);
}

TEST_F(CoverageProviderTest, creationOptions)
{
    Json::Value options(Json::objectValue);
    options["compress"] = "deflate";
    options["tiled"] = true;
    options["blockxsize"] = 16;
    options["blockysize"] = 16;
    options["crs"] = "EPSG:4326";

    CoverageProvider::Query q;
    q.format = "GTiff";
    q.properties.push_back("1");
    const auto r(provider(options)->query(q));
    ASSERT_EQ(CoverageProvider::Response::Type::native, r.type);

    const std::string path("/vsimem/gimirrai-coverage-test.tif");
    auto *f(::VSIFileFromMemBuffer
            (path.c_str()
             , reinterpret_cast<GByte*>(const_cast<char*>(r.data.data()))
             , r.data.size(), FALSE));
    ASSERT_TRUE(f);
    ::VSIFCloseL(f);

    {
        const auto ds(detail::openDataset(path));
        const char *compression(ds->GetMetadataItem("COMPRESSION"
                                                    , "IMAGE_STRUCTURE"));
        ASSERT_TRUE(compression);
        EXPECT_EQ(std::string("DEFLATE"), compression);

        int bx(0), by(0);
        ds->GetRasterBand(1)->GetBlockSize(&bx, &by);
        EXPECT_EQ(16, bx);
        EXPECT_EQ(16, by);
        EXPECT_EQ(10, ds->GetRasterXSize());
        EXPECT_EQ(GDT_Float32, ds->GetRasterBand(1)->GetRasterDataType());
    }
    ::VSIUnlink(path.c_str());
}

TEST_F(ByteCoverageTest, nativeDriverOption)
{
    Json::Value options(Json::objectValue);
    options["native_driver"] = "PNG";
    options["zlevel"] = 9;

    CoverageProvider::Query q;
    q.format = "PNG";
    q.subsets["Long"] = std::make_pair(10.2, 10.5);
    q.subsets["Lat"] = std::make_pair(49.7, 49.9);

    const auto r(provider(options)->query(q));
    ASSERT_EQ(CoverageProvider::Response::Type::native, r.type);
    EXPECT_TRUE(isPng(r.data));
    EXPECT_EQ("image/png", r.mimetype);

    // native_driver wins over provider format
    const auto tiff(provider(options, format("GTiff", "image/tiff"))
                    ->query(q));
    EXPECT_TRUE(isPng(tiff.data));

    options["native_driver"] = "NoSuchDriver";
    EXPECT_THROW(provider(options)->query(q), ProviderQueryError);
}

TEST_F(ByteCoverageTest, formatSelectsDriver)
{
    CoverageProvider::Query q;
    q.format = "PNG";
    q.subsets["Long"] = std::make_pair(10.2, 10.5);
    q.subsets["Lat"] = std::make_pair(49.7, 49.9);

    const auto png(provider(Json::objectValue, format("PNG", "image/png"))
                   ->query(q));
    EXPECT_TRUE(isPng(png.data));
    EXPECT_EQ("image/png", png.mimetype);

    // GIMI driver cannot write, GeoTIFF is used instead
    const auto gimi(provider(Json::objectValue, format("GIMI", "image/heif"))
                    ->query(q));
    ASSERT_GT(gimi.data.size(), 4u);
    EXPECT_TRUE((gimi.data[0] == 'I') || (gimi.data[0] == 'M'));
    EXPECT_EQ("image/tiff", gimi.mimetype);
}

TEST(CoverageProviderErrorTest, missingFile)
{
    EXPECT_THROW(createProvider
                 (test::definition(ProviderType::coverage
                                   , "/nonexistent/coverage.heif"))
                 , ProviderConnectionError);
}

} // namespace gimirrai
