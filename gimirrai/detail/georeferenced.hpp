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
 * @file detail/georeferenced.hpp
 *
 * Base for read-only datasets that carry their own SRS, geo transformation
 * and ground control points.
 */

#ifndef gimirrai_detail_georeferenced_hpp_included_
#define gimirrai_detail_georeferenced_hpp_included_

#include <string>
#include <vector>

#include <boost/optional.hpp>

#include <gdal_priv.h>

#include "math/geometry_core.hpp"
#include "geo/srsdef.hpp"
#include "geo/geotransform.hpp"

#include "./dataset.hpp"

namespace gimirrai { namespace detail {

class GeoreferencedDataset : public ::GDALDataset {
public:
    GeoreferencedDataset() = default;
    virtual ~GeoreferencedDataset() {}

    virtual const ::OGRSpatialReference* GetSpatialRef() const override {
        return (hasSrs_ && gt_) ? &srs_ : nullptr;
    }

    virtual const ::OGRSpatialReference* GetGCPSpatialRef() const override {
        return (hasSrs_ && !gcps_.empty()) ? &srs_ : nullptr;
    }

#if GDAL_VERSION_NUM >= GDAL_COMPUTE_VERSION(3, 12, 0)
    virtual CPLErr GetGeoTransform(::GDALGeoTransform &gt) const override {
        if (!gt_) { return CE_Failure; }
        for (int i(0); i < 6; ++i) { gt[i] = (*gt_)[i]; }
        return CE_None;
    }
#else
    virtual CPLErr GetGeoTransform(double *gt) override {
        if (!gt_) { return CE_Failure; }
        for (int i(0); i < 6; ++i) { gt[i] = (*gt_)[i]; }
        return CE_None;
    }
#endif

    virtual int GetGCPCount() override { return int(gcps_.size()); }

    virtual const GDAL_GCP* GetGCPs() override {
        return gcps_.empty() ? nullptr : gcps_.data();
    }

    struct Gcp {
        math::Point2 pixel;
        math::Point2 world;
    };

protected:
    void setSrs(const geo::SrsDefinition &srs) {
        srs_ = gisReference(srs);
        hasSrs_ = true;
    }

    void setGeoTransform(const geo::GeoTransform &gt) { gt_ = gt; }

    void setGcps(const std::vector<Gcp> &gcps) {
        gcpIds_.clear();
        for (std::size_t i(0); i < gcps.size(); ++i) {
            gcpIds_.push_back("GCP_" + std::to_string(i + 1));
        }

        gcps_.resize(gcps.size());
        for (std::size_t i(0); i < gcps.size(); ++i) {
            auto &g(gcps_[i]);
            g.pszId = const_cast<char*>(gcpIds_[i].c_str());
            g.pszInfo = const_cast<char*>(gcpInfo_.c_str());
            g.dfGCPPixel = gcps[i].pixel(0);
            g.dfGCPLine = gcps[i].pixel(1);
            g.dfGCPX = gcps[i].world(0);
            g.dfGCPY = gcps[i].world(1);
            g.dfGCPZ = 0.0;
        }
    }

private:
    ::OGRSpatialReference srs_;
    bool hasSrs_ = false;
    boost::optional<geo::GeoTransform> gt_;
    std::vector<std::string> gcpIds_;
    std::string gcpInfo_;
    std::vector< ::GDAL_GCP> gcps_;
};

} } // namespace gimirrai::detail

#endif // gimirrai_detail_georeferenced_hpp_included_
