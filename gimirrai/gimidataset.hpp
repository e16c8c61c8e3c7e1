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
 * @file gimidataset.hpp
 *
 * GIMI GDAL driver implementation
 *
 * Adds to GDAL an ability to read GIMI files: HEIF containers with
 * georeferenced imagery and MISB ST0601 KLV metadata items.
 *
 * Dataset path is either a plain file path (primary image is opened and
 * all top-level images are listed as subdatasets) or GIMI:N:PATH where N is
 * one-based index of top-level image.
 *
 * Metadata domains:
 *    * GIMI_ST0601: decoded KLV values
 *    * GIMI_CONTENT_ID: GIMI content identifier
 *    * xml:GIMI_SECURITY: security markings XML
 *    * xml:XMP: XMP packet
 */

#ifndef gimirrai_gimidataset_hpp_included_
#define gimirrai_gimidataset_hpp_included_

#include <memory>
#include <vector>

#include <gdal_priv.h>

#include <libheif/heif.h>

#include "./klv.hpp"
#include "./detail/georeferenced.hpp"

namespace gimirrai {

class GimiDataset : public detail::GeoreferencedDataset {
public:
    static int Identify(GDALOpenInfo *openInfo);

    static ::GDALDataset* Open(GDALOpenInfo *openInfo);

    virtual ~GimiDataset();

    /** Decoded ST0601 metadata, empty when image has none.
     */
    const Klv& klv() const { return klv_; }

    typedef std::shared_ptr< ::heif_context> Context;
    typedef std::shared_ptr< ::heif_image_handle> Handle;
    typedef std::shared_ptr< ::heif_image> Image;

private:
    class RasterBand;
    friend class RasterBand;

    GimiDataset(const Context &context, const Handle &handle
                , bool overview = false);

    /** Opens index-th top level image (1-based, 0 means primary image).
     */
    static std::unique_ptr<GimiDataset>
    open(const std::string &path, int index);

    void readMetadata();
    void uriMetadata(::heif_item_id id, const std::vector<std::uint8_t> &data);
    void mimeMetadata(::heif_item_id id
                      , const std::vector<std::uint8_t> &data);
    void georeference();
    void loadOverviews();
    void setSubdatasets(const std::string &path, int count);

    /** Decodes image on first use. Throws std::runtime_error on failure.
     */
    const ::heif_image* image();

    Context context_;
    Handle handle_;
    Image image_;
    bool decodeFailed_;

    ::GDALDataType dataType_;

    Klv klv_;

    std::vector<std::unique_ptr<GimiDataset> > overviews_;
};

} // namespace gimirrai

// driver registration function
CPL_C_START
void GDALRegister_Gimi(void);
CPL_C_END

#endif // gimirrai_gimidataset_hpp_included_
