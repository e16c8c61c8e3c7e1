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
#include <cstdlib>

#include <boost/filesystem/path.hpp>

#include <cpl_string.h>

#include "dbglog/dbglog.hpp"

#include "service/cmdline.hpp"

#include "gimirrai/register.hpp"
#include "gimirrai/metadata.hpp"
#include "gimirrai/coverage.hpp"
#include "gimirrai/detail/dataset.hpp"

#include "./common.hpp"

namespace po = boost::program_options;
namespace fs = boost::filesystem;

namespace {

Json::Value jsonValue(const boost::optional<double> &value)
{
    return value ? Json::Value(*value) : Json::Value();
}

Json::Value jsonValue(const boost::optional<std::string> &value)
{
    return value ? Json::Value(*value) : Json::Value();
}

Json::Value asJson(const gimirrai::ImageMetadata &im)
{
    Json::Value out(Json::objectValue);
    out["source"] = im.source;
    out["title"] = im.title;
    out["beginPosition"] = jsonValue(im.beginPosition);
    out["crs"] = im.crs;
    out["width"] = im.width;
    out["height"] = im.height;
    out["upperLeft"].append(im.upperLeftLon);
    out["upperLeft"].append(im.upperLeftLat);
    out["lowerRight"].append(im.lowerRightLon);
    out["lowerRight"].append(im.lowerRightLat);
    out["resolution"].append(im.xResolution);
    out["resolution"].append(im.yResolution);

    auto &affine(out["affine"] = Json::arrayValue);
    for (int i(0); i < 6; ++i) { affine.append(im.affine[i]); }

    auto &bands(out["bands"] = Json::arrayValue);
    for (const auto &item : im.bands) {
        const auto &bd(item.second);
        Json::Value band(Json::objectValue);
        band["index"] = bd.index;
        band["dtype"] = bd.dtype;
        band["nodata"] = jsonValue(bd.nodata);
        band["units"] = jsonValue(bd.units);
        band["description"] = jsonValue(bd.description);
        bands.append(band);
    }

    // KLV pairs
    auto ds(gimirrai::detail::openDataset(im.source));
    auto &klv(out["klv"] = Json::objectValue);
    if (char **md = ds->GetMetadata("GIMI_ST0601")) {
        for (; *md; ++md) {
            char *key(nullptr);
            const char *value(::CPLParseNameValue(*md, &key));
            if (key && value) { klv[key] = value; }
            ::CPLFree(key);
        }
    }

    return out;
}

} // namespace

class GimiInfo : public service::Cmdline {
public:
    GimiInfo()
        : service::Cmdline("gimi-info", "1.0")
    {}

private:
    void configuration(po::options_description &cmdline
                       , po::options_description &config
                       , po::positional_options_description &pd);

    void configure(const po::variables_map&) {}

    int run();

    fs::path file_;
    fs::path output_;
};

void GimiInfo::configuration(po::options_description &cmdline
                             , po::options_description &config
                             , po::positional_options_description &pd)
{
    cmdline.add_options()
        ("file", po::value(&file_)->required()
         , "Path to GIMI (or any georeferenced raster) file.")
        ("output", po::value(&output_)->default_value(fs::path("-"), "-")
         , "Output file, - means stdout.")
        ;

    pd.add("file", 1);

    (void) config;
}

int GimiInfo::run()
{
    try {
        const auto gm(gimirrai::gimiMetadata(file_.string()));

        Json::Value info(Json::objectValue);
        auto &images(info["images"] = Json::arrayValue);
        for (const auto &im : gm.images) { images.append(asJson(im)); }

        gimirrai::ProviderDefinition pd;
        pd.type = gimirrai::ProviderType::coverage;
        pd.name = "gimirrai.providers.GimiCoverageProvider";
        pd.data = file_.string();
        const auto coverage(gimirrai::createProvider
                            <gimirrai::CoverageProvider>(pd));

        info["domainset"] = coverage->domainSet();
        info["rangetype"] = coverage->rangeType();

        gimirrai::tools::write(output_, info);
    } catch (const std::exception &e) {
        LOG(fatal) << "Cannot describe " << file_ << ": " << e.what();
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

int main(int argc, char *argv[])
{
    gimirrai::registerAll();
    return GimiInfo()(argc, argv);
}
