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
#include <cstring>
#include <stdexcept>

#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <cpl_port.h>

#include "dbglog/dbglog.hpp"

#include "./gimidataset.hpp"

namespace ba = boost::algorithm;

namespace gimirrai {

namespace {

namespace def {
    const char *DriverName("GIMI");
    const char *Prefix("GIMI:");

    const char *St0601Domain("GIMI_ST0601");
    const char *ContentIdDomain("GIMI_CONTENT_ID");
    const char *SecurityDomain("xml:GIMI_SECURITY");
    const char *XmpDomain("xml:XMP");

    const std::size_t MaxMetadataSize(16 * 1024 * 1024);
} // namespace def

std::string message(const ::heif_error &err)
{
    return err.message ? err.message : "unknown error";
}

void check(const ::heif_error &err, const std::string &what)
{
    if (err.code != heif_error_Ok) {
        LOGTHROW(err1, std::runtime_error)
            << what << ": " << message(err) << ".";
    }
}

std::string asString(const std::vector<std::uint8_t> &data)
{
    std::string value(data.begin(), data.end());
    // strip trailing NULs
    while (!value.empty() && !value.back()) { value.pop_back(); }
    return value;
}

void setMetadata(::GDALDataset &ds, const std::string &value
                 , const char *domain)
{
    std::string tmp(value);
    char *list[2] = { &tmp[0], nullptr };
    ds.SetMetadata(list, domain);
}

} // namespace

/* class GimiDataset::RasterBand */

class GimiDataset::RasterBand : public ::GDALRasterBand {
public:
    RasterBand(GimiDataset *dset, int numBand);

    virtual ~RasterBand() {}

    virtual CPLErr IReadBlock(int blockCol, int blockRow, void *image);

    virtual GDALColorInterp GetColorInterpretation();

    virtual int GetOverviewCount();

    virtual ::GDALRasterBand* GetOverview(int index);
};

GimiDataset::RasterBand::RasterBand(GimiDataset *dset, int numBand)
{
    poDS = dset;
    nBand = numBand;
    eDataType = dset->dataType_;

    // image is decoded as a whole, serve it line by line
    nBlockXSize = dset->GetRasterXSize();
    nBlockYSize = 1;

    const int bits(::heif_image_handle_get_luma_bits_per_pixel
                   (dset->handle_.get()));
    if ((bits != 8) && (bits != 16)) {
        SetMetadataItem("NBITS", boost::lexical_cast<std::string>(bits)
                        .c_str(), "IMAGE_STRUCTURE");
    }
}

CPLErr GimiDataset::RasterBand::IReadBlock(int, int blockRow
                                           , void *rawImage)
{
    auto &dset(*static_cast<GimiDataset*>(poDS));

    try {
        const auto *image(dset.image());
        const int bands(dset.GetRasterCount());

        int stride(0);
        const std::uint8_t *src(::heif_image_get_plane_readonly
                                (image, heif_channel_interleaved, &stride));
        if (!src) {
            LOGTHROW(err1, std::runtime_error)
                << "Decoded image has no interleaved plane.";
        }
        src += std::ptrdiff_t(blockRow) * stride;

        if (eDataType == GDT_Byte) {
            auto *dst(static_cast<std::uint8_t*>(rawImage));
            for (int i(0); i < nBlockXSize; ++i) {
                dst[i] = src[nBand - 1 + i * bands];
            }
        } else {
            const auto *src16(reinterpret_cast<const std::uint16_t*>(src));
            auto *dst(static_cast<std::uint16_t*>(rawImage));
            for (int i(0); i < nBlockXSize; ++i) {
                dst[i] = src16[nBand - 1 + i * bands];
            }
        }
    } catch (const std::exception &e) {
        CPLError(CE_Failure, CPLE_AppDefined, "%s\n", e.what());
        return CE_Failure;
    }
    return CE_None;
}

GDALColorInterp GimiDataset::RasterBand::GetColorInterpretation()
{
    switch (nBand) {
    case 1: return GCI_RedBand;
    case 2: return GCI_GreenBand;
    case 3: return GCI_BlueBand;
    case 4: return GCI_AlphaBand;
    }
    return GCI_Undefined;
}

int GimiDataset::RasterBand::GetOverviewCount()
{
    return int(static_cast<GimiDataset*>(poDS)->overviews_.size());
}

::GDALRasterBand* GimiDataset::RasterBand::GetOverview(int index)
{
    auto &overviews(static_cast<GimiDataset*>(poDS)->overviews_);
    if ((index < 0) || (index >= int(overviews.size()))) { return nullptr; }
    return overviews[index]->GetRasterBand(nBand);
}

/* class GimiDataset */

int GimiDataset::Identify(GDALOpenInfo *openInfo)
{
    if (ba::istarts_with(openInfo->pszFilename, def::Prefix)) {
        return TRUE;
    }

    if (!openInfo->pabyHeader || (openInfo->nHeaderBytes < 12)) {
        return FALSE;
    }

    const auto res(::heif_check_filetype(openInfo->pabyHeader
                                         , openInfo->nHeaderBytes));
    return ((res == heif_filetype_yes_supported)
            || (res == heif_filetype_maybe));
}

::GDALDataset* GimiDataset::Open(GDALOpenInfo *openInfo)
{
    if (!Identify(openInfo)) { return nullptr; }

    // no updates
    if (openInfo->eAccess == GA_Update) {
        CPLError(CE_Failure, CPLE_NotSupported,
                 "The GIMI driver does not support update "
                 "access to existing datasets.\n");
        return nullptr;
    }

    std::string path(openInfo->pszFilename);
    int index(0);

    if (ba::istarts_with(path, def::Prefix)) {
        // GIMI:N:PATH
        const auto rest(path.substr(std::strlen(def::Prefix)));
        const auto colon(rest.find(':'));
        if (colon == std::string::npos) {
            CPLError(CE_Failure, CPLE_OpenFailed
                     , "Invalid GIMI subdataset name <%s>.\n"
                     , openInfo->pszFilename);
            return nullptr;
        }

        try {
            index = boost::lexical_cast<int>(rest.substr(0, colon));
        } catch (const boost::bad_lexical_cast&) {
            CPLError(CE_Failure, CPLE_OpenFailed
                     , "Invalid image index in GIMI subdataset name <%s>.\n"
                     , openInfo->pszFilename);
            return nullptr;
        }
        path = rest.substr(colon + 1);

        if (index < 1) {
            CPLError(CE_Failure, CPLE_OpenFailed
                     , "Image index in <%s> must be positive.\n"
                     , openInfo->pszFilename);
            return nullptr;
        }
    }

    // initialize dataset
    try {
        return open(path, index).release();
    } catch (const std::exception &e) {
        CPLError(CE_Failure, CPLE_OpenFailed
                 , "GIMI dataset initialization failure (%s).\n", e.what());
        return nullptr;
    }
}

std::unique_ptr<GimiDataset>
GimiDataset::open(const std::string &path, int index)
{
    Context context(::heif_context_alloc(), &::heif_context_free);
    if (!context) {
        LOGTHROW(err1, std::runtime_error) << "Cannot allocate HEIF context.";
    }

    check(::heif_context_read_from_file(context.get(), path.c_str()
                                        , nullptr)
          , "Cannot read HEIF file " + path);

    const int count(::heif_context_get_number_of_top_level_images
                    (context.get()));
    if (count <= 0) {
        LOGTHROW(err1, std::runtime_error)
            << "No image found in " << path << ".";
    }

    if (index > count) {
        LOGTHROW(err1, std::runtime_error)
            << "Invalid image index " << index << ", " << path
            << " has " << count << " images.";
    }

    std::vector< ::heif_item_id> ids(count);
    ::heif_context_get_list_of_top_level_image_IDs(context.get(), ids.data()
                                                  , count);

    ::heif_item_id id(ids.front());
    if (index) {
        id = ids[index - 1];
    } else {
        ::heif_item_id primary(0);
        if (::heif_context_get_primary_image_ID(context.get(), &primary)
            .code == heif_error_Ok)
        {
            id = primary;
        }
    }

    ::heif_image_handle *rawHandle(nullptr);
    check(::heif_context_get_image_handle(context.get(), id, &rawHandle)
          , "Cannot get image handle");
    Handle handle(rawHandle, &::heif_image_handle_release);

    std::unique_ptr<GimiDataset> ds(new GimiDataset(context, handle));
    if (!index && (count > 1)) { ds->setSubdatasets(path, count); }

    LOG(info1) << "Opened GIMI image " << id << " from " << path << " ("
               << ds->GetRasterXSize() << "x" << ds->GetRasterYSize()
               << ", " << ds->GetRasterCount() << " bands).";
    return ds;
}

GimiDataset::GimiDataset(const Context &context, const Handle &handle
                         , bool overview)
    : context_(context), handle_(handle), decodeFailed_(false)
    , dataType_(GDT_Byte)
{
    nRasterXSize = ::heif_image_handle_get_width(handle_.get());
    nRasterYSize = ::heif_image_handle_get_height(handle_.get());

    if ((nRasterXSize <= 0) || (nRasterYSize <= 0)) {
        LOGTHROW(err1, std::runtime_error)
            << "Invalid image size " << nRasterXSize << "x"
            << nRasterYSize << ".";
    }

    if (::heif_image_handle_get_luma_bits_per_pixel(handle_.get()) > 8) {
        dataType_ = GDT_UInt16;
    }

    const int bands
        (3 + (::heif_image_handle_has_alpha_channel(handle_.get()) ? 1 : 0));
    for (int i(1); i <= bands; ++i) {
        SetBand(i, new RasterBand(this, i));
    }

    if (overview) { return; }

    readMetadata();
    georeference();
    loadOverviews();
}

GimiDataset::~GimiDataset() {}

void GimiDataset::setSubdatasets(const std::string &path, int count)
{
    for (int i(1); i <= count; ++i) {
        SetMetadataItem(str(boost::format("SUBDATASET_%d_NAME") % i).c_str()
                        , str(boost::format("%s%d:%s")
                              % def::Prefix % i % path).c_str()
                        , "SUBDATASETS");
        SetMetadataItem(str(boost::format("SUBDATASET_%d_DESC") % i).c_str()
                        , str(boost::format("Image #%d of %s")
                              % i % path).c_str()
                        , "SUBDATASETS");
    }
}

void GimiDataset::readMetadata()
{
    auto *h(handle_.get());

    const int count(::heif_image_handle_get_number_of_metadata_blocks
                    (h, nullptr));
    if (count <= 0) {
        LOG(info1) << "Image has no metadata blocks.";
        return;
    }

    std::vector< ::heif_item_id> ids(count);
    ::heif_image_handle_get_list_of_metadata_block_IDs(h, nullptr, ids.data()
                                                       , count);

    for (const auto id : ids) {
        const char *rawType(::heif_image_handle_get_metadata_type(h, id));
        const std::string type(rawType ? rawType : "");
        const auto size(::heif_image_handle_get_metadata_size(h, id));

        if (!size || (size > def::MaxMetadataSize)) {
            LOG(warn1) << "Skipping metadata block " << id
                       << " of size " << size << ".";
            continue;
        }

        std::vector<std::uint8_t> data(size);
        const auto err(::heif_image_handle_get_metadata(h, id, data.data()));
        if (err.code != heif_error_Ok) {
            LOG(warn2) << "Cannot read metadata block " << id << ": "
                       << message(err) << ".";
            continue;
        }

        if (type == "uri ") {
            uriMetadata(id, data);
        } else if (type == "mime") {
            mimeMetadata(id, data);
        } else {
            LOG(debug) << "Skipping metadata block " << id
                       << " of type <" << type << ">.";
        }
    }
}

void GimiDataset::uriMetadata(::heif_item_id id
                              , const std::vector<std::uint8_t> &data)
{
    auto decodeSt0601([&]()
    {
        try {
            klv_ = decodeKlv(data);
        } catch (const std::runtime_error &e) {
            LOG(warn2) << "Cannot decode KLV metadata block " << id
                       << ": " << e.what();
            return;
        }

        for (const auto &item : klv_.items) {
            SetMetadataItem(item.first.c_str(), item.second.c_str()
                            , def::St0601Domain);
        }
        if (klv_.title) {
            SetMetadataItem("TITLE", klv_.title->c_str());
        }
        if (klv_.beginPosition) {
            SetMetadataItem("BEGIN_POSITION", klv_.beginPosition->c_str());
        }
    });

    const char *uriType(::heif_image_handle_get_metadata_item_uri_type
                        (handle_.get(), id));
    const std::string type(uriType ? uriType : "");

    if (type == klv::St0601UriType) {
        decodeSt0601();
    } else if (type == klv::ContentIdUriType) {
        SetMetadataItem("CONTENT_ID", asString(data).c_str()
                        , def::ContentIdDomain);
    } else {
        LOG(debug) << "Skipping uri metadata block " << id
                   << " of type <" << type << ">.";
    }
}

void GimiDataset::mimeMetadata(::heif_item_id id
                               , const std::vector<std::uint8_t> &data)
{
    const char *rawContentType(::heif_image_handle_get_metadata_content_type
                               (handle_.get(), id));
    const std::string contentType(rawContentType ? rawContentType : "");
    const auto value(asString(data));

    if (value.find("<?xpacket") != std::string::npos) {
        setMetadata(*this, value, def::XmpDomain);
        return;
    }

    if (ba::icontains(contentType, "xml")
        || ba::starts_with(value, "<"))
    {
        LOG(info1) << "Found security information of type <"
                   << contentType << ">.";
        setMetadata(*this, value, def::SecurityDomain);
        if (!contentType.empty()) {
            SetMetadataItem("CONTENT_TYPE", contentType.c_str()
                            , "GIMI_SECURITY");
        }
        return;
    }

    LOG(debug) << "Skipping mime metadata block " << id
               << " of type <" << contentType << ">.";
}

void GimiDataset::georeference()
{
    const auto ul(klv_.upperLeft());
    const auto lr(klv_.lowerRight());

    if (ul && lr) {
        geo::GeoTransform gt;
        gt[0] = (*ul)(0);
        gt[1] = ((*lr)(0) - (*ul)(0)) / nRasterXSize;
        gt[2] = 0.0;
        gt[3] = (*ul)(1);
        gt[4] = 0.0;
        gt[5] = ((*lr)(1) - (*ul)(1)) / nRasterYSize;
        setGeoTransform(gt);
    }

    if (const auto corners = klv_.corners()) {
        const double w(nRasterXSize), h(nRasterYSize);
        const auto &c(*corners);
        setGcps({
                { math::Point2(0, 0), c[0] }
                , { math::Point2(w, 0), c[1] }
                , { math::Point2(w, h), c[2] }
                , { math::Point2(0, h), c[3] }
            });
    }

    if ((ul && lr) || klv_.corners()) {
        setSrs(detail::epsg(4326));
    } else {
        LOG(warn2) << "GIMI image has no usable corner coordinates, "
            "dataset is not georeferenced.";
    }
}

void GimiDataset::loadOverviews()
{
    auto *h(handle_.get());
    const int count(::heif_image_handle_get_number_of_thumbnails(h));
    if (count <= 0) { return; }

    std::vector< ::heif_item_id> ids(count);
    ::heif_image_handle_get_list_of_thumbnail_IDs(h, ids.data(), count);

    const auto bits(::heif_image_handle_get_luma_bits_per_pixel(h));

    for (const auto id : ids) {
        ::heif_image_handle *rawThumbnail(nullptr);
        const auto err(::heif_image_handle_get_thumbnail(h, id
                                                         , &rawThumbnail));
        if (err.code != heif_error_Ok) {
            LOG(warn1) << "Cannot get thumbnail " << id << ": "
                       << message(err) << ".";
            continue;
        }
        Handle thumbnail(rawThumbnail, &::heif_image_handle_release);

        const int bands(3 + (::heif_image_handle_has_alpha_channel
                             (rawThumbnail) ? 1 : 0));
        if ((bands != GetRasterCount())
            || (::heif_image_handle_get_luma_bits_per_pixel(rawThumbnail)
                != bits))
        {
            LOG(debug) << "Thumbnail " << id
                       << " does not match image layout, skipping.";
            continue;
        }

        overviews_.emplace_back(new GimiDataset(context_, thumbnail, true));
    }

    // largest first
    std::sort(overviews_.begin(), overviews_.end()
              , [](const std::unique_ptr<GimiDataset> &l
                   , const std::unique_ptr<GimiDataset> &r)
    {
        return l->GetRasterXSize() > r->GetRasterXSize();
    });
}

const ::heif_image* GimiDataset::image()
{
    if (image_) { return image_.get(); }

    if (decodeFailed_) {
        LOGTHROW(err1, std::runtime_error)
            << "Image decoding has already failed.";
    }

    const bool alpha(GetRasterCount() == 4);
    ::heif_chroma chroma;
    if (dataType_ == GDT_UInt16) {
#if CPL_IS_LSB
        chroma = (alpha ? heif_chroma_interleaved_RRGGBBAA_LE
                  : heif_chroma_interleaved_RRGGBB_LE);
#else
        chroma = (alpha ? heif_chroma_interleaved_RRGGBBAA_BE
                  : heif_chroma_interleaved_RRGGBB_BE);
#endif
    } else {
        chroma = (alpha ? heif_chroma_interleaved_RGBA
                  : heif_chroma_interleaved_RGB);
    }

    ::heif_image *raw(nullptr);
    const auto err(::heif_decode_image(handle_.get(), &raw
                                       , heif_colorspace_RGB, chroma
                                       , nullptr));
    if (err.code != heif_error_Ok) {
        decodeFailed_ = true;
        LOGTHROW(err1, std::runtime_error)
            << "Cannot decode image: " << message(err) << ".";
    }
    Image image(raw, &::heif_image_release);

    const int bpp(::heif_image_get_bits_per_pixel(raw
                                                  , heif_channel_interleaved));
    const int expected(GetRasterCount() * ::GDALGetDataTypeSizeBits
                       (dataType_));
    if (bpp != expected) {
        decodeFailed_ = true;
        LOGTHROW(err1, std::runtime_error)
            << "Unexpected bits per pixel " << bpp << ", expected "
            << expected << ".";
    }

    LOG(info1) << "Decoded GIMI image (" << nRasterXSize << "x"
               << nRasterYSize << ").";
    image_ = image;
    return image_.get();
}

} // namespace gimirrai

/* GDALRegister_Gimi */

void GDALRegister_Gimi()
{
    if (!GDALGetDriverByName(gimirrai::def::DriverName)) {
        std::unique_ptr<GDALDriver> driver(new GDALDriver());

        driver->SetDescription(gimirrai::def::DriverName);
        driver->SetMetadataItem(GDAL_DCAP_RASTER, "YES");
        driver->SetMetadataItem(GDAL_DMD_LONGNAME
                                , "GEOINT Imagery Media for ISR (GIMI)");
        driver->SetMetadataItem(GDAL_DMD_EXTENSIONS, "heif heic hif");
        driver->SetMetadataItem(GDAL_DMD_MIMETYPE, "image/heif");
        driver->SetMetadataItem(GDAL_DMD_SUBDATASETS, "YES");

        driver->pfnOpen = gimirrai::GimiDataset::Open;
        driver->pfnIdentify = gimirrai::GimiDataset::Identify;

        GetGDALDriverManager()->RegisterDriver(driver.release());
    }
}
