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
#include <cmath>
#include <cstddef>
#include <initializer_list>
#include <limits>
#include <memory>
#include <stdexcept>
#include <vector>

#include <boost/filesystem.hpp>

#include <libheif/heif.h>

#include "dbglog/dbglog.hpp"

#include "gimirrai/klv.hpp"
#include "gimirrai/detail/dataset.hpp"

#include "./support.hpp"

namespace fs = boost::filesystem;

namespace gimirrai { namespace test {

TemporaryDirectory::TemporaryDirectory()
    : path_(fs::temp_directory_path()
            / fs::unique_path("gimirrai-test-%%%%-%%%%-%%%%"))
{
    fs::create_directories(path_);
}

TemporaryDirectory::~TemporaryDirectory()
{
    boost::system::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        LOG(warn2) << "Cannot remove " << path_ << ": " << ec.message();
    }
}

RasterSpec::RasterSpec()
    : size(10, 5), bands(1), type(GDT_Float32)
    , extents(10.0, 49.5, 11.0, 50.0)
    , value([](int band, int col, int row) -> double {
            return (band - 1) * 100.0 + row * 10.0 + col;
        })
    , nodata(std::numeric_limits<double>::quiet_NaN())
{}

void createRaster(const fs::path &path, const RasterSpec &spec)
{
    auto *driver(::GetGDALDriverManager()->GetDriverByName("GTiff"));
    if (!driver) {
        LOGTHROW(err2, std::runtime_error) << "No GTiff driver.";
    }

    detail::Dataset ds(driver->Create(path.string().c_str()
                                      , spec.size.width, spec.size.height
                                      , spec.bands, spec.type, nullptr)
                       , &detail::closeGdalDataset);
    if (!ds) {
        LOGTHROW(err2, std::runtime_error)
            << "Cannot create " << path << ".";
    }

    const auto es(math::size(spec.extents));
    geo::GeoTransform gt;
    gt[0] = spec.extents.ll(0);
    gt[1] = es.width / spec.size.width;
    gt[2] = 0.0;
    gt[3] = spec.extents.ur(1);
    gt[4] = 0.0;
    gt[5] = -es.height / spec.size.height;
    detail::setGeoTransform(*ds, gt);

    const auto srs(detail::gisReference(detail::epsg(4326)));
    ds->SetSpatialRef(&srs);

    std::vector<double> data(std::size_t(spec.size.width)
                             * spec.size.height);
    for (int b(1); b <= spec.bands; ++b) {
        auto i(data.begin());
        for (int row(0); row < spec.size.height; ++row) {
            for (int col(0); col < spec.size.width; ++col, ++i) {
                *i = spec.value(b, col, row);
            }
        }

        auto *band(ds->GetRasterBand(b));
        if ((b == 1) && !std::isnan(spec.nodata)) {
            band->SetNoDataValue(spec.nodata);
        }

        if (band->RasterIO(GF_Write, 0, 0, spec.size.width, spec.size.height
                           , data.data(), spec.size.width, spec.size.height
                           , GDT_Float64, 0, 0, nullptr) != CE_None)
        {
            LOGTHROW(err2, std::runtime_error)
                << "Cannot write band " << b << " of " << path << ".";
        }
    }
}

void append(Bytes &out, std::uint64_t value, int size)
{
    for (int i(size - 1); i >= 0; --i) {
        out.push_back(std::uint8_t((value >> (8 * i)) & 0xff));
    }
}

void berLength(Bytes &out, std::size_t value)
{
    if (value < 0x80) {
        out.push_back(std::uint8_t(value));
    } else if (value < 0x100) {
        out.push_back(0x81);
        append(out, value, 1);
    } else {
        out.push_back(0x82);
        append(out, value, 2);
    }
}

void klvItem(Bytes &out, std::uint8_t tag, std::uint64_t value, int size)
{
    out.push_back(tag);
    out.push_back(std::uint8_t(size));
    append(out, value, size);
}

std::uint32_t encodeLatitude(double lat)
{
    return std::uint32_t(std::int32_t(std::lround
                                      (lat * 4294967294.0 / 180.0)));
}

std::uint32_t encodeLongitude(double lon)
{
    return std::uint32_t(std::int32_t(std::lround
                                      (lon * 4294967294.0 / 360.0)));
}

Bytes st0601Items(const math::Extents2 &extents, const std::string &title
                  , std::uint64_t timestamp)
{
    Bytes out;
    klvItem(out, klv::precisionTimeStamp, timestamp, 8);

    out.push_back(klv::missionId);
    berLength(out, title.size());
    out.insert(out.end(), title.begin(), title.end());

    const auto north(encodeLatitude(extents.ur(1)));
    const auto south(encodeLatitude(extents.ll(1)));
    const auto west(encodeLongitude(extents.ll(0)));
    const auto east(encodeLongitude(extents.ur(0)));

    klvItem(out, klv::cornerLatitudePoint1, north, 4);
    klvItem(out, klv::cornerLongitudePoint1, west, 4);
    klvItem(out, klv::cornerLatitudePoint2, north, 4);
    klvItem(out, klv::cornerLongitudePoint2, east, 4);
    klvItem(out, klv::cornerLatitudePoint3, south, 4);
    klvItem(out, klv::cornerLongitudePoint3, east, 4);
    klvItem(out, klv::cornerLatitudePoint4, south, 4);
    klvItem(out, klv::cornerLongitudePoint4, west, 4);

    return out;
}

Bytes st0601Packet(const Bytes &items, bool validChecksum)
{
    Bytes out(klv::St0601Key.begin(), klv::St0601Key.end());
    berLength(out, items.size() + 4);
    out.insert(out.end(), items.begin(), items.end());

    // checksum covers everything up to its own length
    out.push_back(klv::checksum);
    out.push_back(2);
    auto crc(klv::computeChecksum(out.data(), out.size()));
    if (!validChecksum) { ++crc; }
    append(out, crc, 2);

    return out;
}

GimiSpec::GimiSpec()
    : size(64, 32), thumbnail(32)
    , contentId("urn:uuid:4d1e8b5e-3b5c-4f0e-9a39-2c1f0c6c1a7e")
    , security("<?xml version=\"1.0\"?><edh:Security "
               "xmlns:edh=\"urn:us:gov:ic:edh\" "
               "classification=\"U\"/>")
    , timestamp(1700000000000000ull)
{
    images.push_back({ math::Extents2(10.0, 49.5, 11.0, 50.0)
                       , {{ 200, 100, 50 }}, "Image one" });
    images.push_back({ math::Extents2(11.0, 49.5, 12.0, 50.0)
                       , {{ 20, 140, 220 }}, "Image two" });
}

namespace {

void check(const ::heif_error &err, const std::string &what)
{
    if (err.code != heif_error_Ok) {
        LOGTHROW(err2, std::runtime_error)
            << what << ": " << (err.message ? err.message : "unknown error")
            << ".";
    }
}

typedef std::shared_ptr< ::heif_encoder> Encoder;

/** First available encoder, lossless where the codec can do it.
 */
Encoder encoder(::heif_context *ctx)
{
    for (const auto format : { heif_compression_uncompressed
                               , heif_compression_HEVC
                               , heif_compression_AV1
                               , heif_compression_JPEG })
    {
        ::heif_encoder *raw(nullptr);
        if ((::heif_context_get_encoder_for_format(ctx, format, &raw).code
             != heif_error_Ok) || !raw)
        {
            continue;
        }
        Encoder enc(raw, &::heif_encoder_release);

        if (::heif_encoder_set_lossless(raw, 1).code != heif_error_Ok) {
            LOG(info2) << "Encoder " << ::heif_encoder_get_name(raw)
                       << " is lossy.";
            check(::heif_encoder_set_lossy_quality(raw, 100)
                  , "Cannot set encoder quality");
        }
        return enc;
    }
    return {};
}

} // namespace

bool createGimi(const fs::path &path, const GimiSpec &spec)
{
    std::shared_ptr< ::heif_context> context(::heif_context_alloc()
                                             , &::heif_context_free);
    auto *ctx(context.get());

    const auto enc(encoder(ctx));
    if (!enc) {
        LOG(warn2) << "No HEIF encoder available.";
        return false;
    }

    const int width(spec.size.width);
    const int height(spec.size.height);

    bool first(true);
    for (const auto &im : spec.images) {
        ::heif_image *rawImage(nullptr);
        check(::heif_image_create(width, height, heif_colorspace_RGB
                                  , heif_chroma_interleaved_RGB, &rawImage)
              , "Cannot create image");
        std::shared_ptr< ::heif_image> image(rawImage, &::heif_image_release);

        check(::heif_image_add_plane(rawImage, heif_channel_interleaved
                                     , width, height, 8)
              , "Cannot add image plane");

        int stride(0);
        auto *plane(::heif_image_get_plane(rawImage, heif_channel_interleaved
                                           , &stride));
        for (int row(0); row < height; ++row) {
            auto *p(plane + std::ptrdiff_t(row) * stride);
            for (int col(0); col < width; ++col) {
                for (int c(0); c < 3; ++c) { *p++ = im.color[c]; }
            }
        }

        ::heif_image_handle *rawHandle(nullptr);
        check(::heif_context_encode_image(ctx, rawImage, enc.get(), nullptr
                                          , &rawHandle)
              , "Cannot encode image");
        std::shared_ptr< ::heif_image_handle>
            handle(rawHandle, &::heif_image_handle_release);

        const auto klvData(st0601Packet(st0601Items(im.extents, im.title
                                                    , spec.timestamp)));
        ::heif_item_id id(0);
        check(::heif_context_add_generic_uri_metadata
              (ctx, rawHandle, klvData.data(), int(klvData.size())
               , klv::St0601UriType, &id)
              , "Cannot add ST0601 metadata");

        if (first) {
            check(::heif_context_set_primary_image(ctx, rawHandle)
                  , "Cannot set primary image");

            if (spec.thumbnail) {
                ::heif_image_handle *thumbnail(nullptr);
                check(::heif_context_encode_thumbnail
                      (ctx, rawImage, rawHandle, enc.get(), nullptr
                       , spec.thumbnail, &thumbnail)
                      , "Cannot encode thumbnail");
                if (thumbnail) { ::heif_image_handle_release(thumbnail); }
            }

            if (!spec.contentId.empty()) {
                check(::heif_context_add_generic_uri_metadata
                      (ctx, rawHandle, spec.contentId.data()
                       , int(spec.contentId.size()), klv::ContentIdUriType
                       , &id)
                      , "Cannot add content id");
            }

            if (!spec.security.empty()) {
                check(::heif_context_add_generic_metadata
                      (ctx, rawHandle, spec.security.data()
                       , int(spec.security.size()), "mime"
                       , "application/dni-arh+xml")
                      , "Cannot add security metadata");
            }
            first = false;
        }
    }

    check(::heif_context_write_to_file(ctx, path.string().c_str())
          , "Cannot write " + path.string());
    return true;
}

ProviderDefinition definition(ProviderType type, const fs::path &data)
{
    ProviderDefinition pd;
    pd.type = type;
    pd.name = ((type == ProviderType::coverage)
               ? "gimirrai.providers.GimiCoverageProvider"
               : "gimirrai.providers.GimiTileProvider");
    pd.data = data.string();
    return pd;
}

} } // namespace gimirrai::test
