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
#include <string>

#include <boost/lexical_cast.hpp>
#include <boost/filesystem/path.hpp>

#include "dbglog/dbglog.hpp"

#include "service/cmdline.hpp"

#include "gimirrai/register.hpp"
#include "gimirrai/tiles.hpp"

#include "./common.hpp"

namespace po = boost::program_options;
namespace fs = boost::filesystem;

class GimiTile : public service::Cmdline {
public:
    GimiTile()
        : service::Cmdline("gimi-tile", "1.0")
        , zoom_(), row_(), col_(), metadata_(false)
    {}

private:
    void configuration(po::options_description &cmdline
                       , po::options_description &config
                       , po::positional_options_description &pd);

    void configure(const po::variables_map &vars);

    int run();

    fs::path data_;
    fs::path config_;
    std::string collection_;
    fs::path output_;

    std::string tms_;
    int zoom_;
    int row_;
    int col_;
    std::string format_;

    bool metadata_;
    std::string metadataFormat_;
    std::string url_;
};

void GimiTile::configuration(po::options_description &cmdline
                             , po::options_description &config
                             , po::positional_options_description &pd)
{
    cmdline.add_options()
        ("data", po::value(&data_)
         , "Path to GIMI file. Mutually exclusive with --config.")
        ("config", po::value(&config_)
         , "Path to server configuration.")
        ("collection", po::value(&collection_)
         , "Collection (resource) id in server configuration.")
        ("output", po::value(&output_)->default_value(fs::path("-"), "-")
         , "Output file, - means stdout.")

        ("tms", po::value(&tms_)->default_value("WebMercatorQuad")
         , "Tile matrix set id.")
        ("zoom", po::value(&zoom_)
         , "Tile matrix (zoom level).")
        ("row", po::value(&row_)
         , "Tile row.")
        ("col", po::value(&col_)
         , "Tile column.")
        ("format", po::value(&format_)->default_value("png")
         , "Tile format: png or jpeg.")

        ("metadata", "Print tileset metadata instead of rendering a tile.")
        ("metadata-format", po::value(&metadataFormat_)
         , "Metadata format: json or tilejson. Defaults to provider's "
         "configured format.")
        ("url", po::value(&url_)
         ->default_value("http://localhost:5000/collections/tiles")
         , "Base URL of tiles endpoint used in metadata links.")
        ;

    pd.add("data", 1);

    (void) config;
}

void GimiTile::configure(const po::variables_map &vars)
{
    if (vars.count("config") == vars.count("data")) {
        throw po::error("exactly one of --config and --data is required");
    }

    if (vars.count("config") && !vars.count("collection")) {
        throw po::required_option("collection");
    }

    metadata_ = vars.count("metadata");
    if (!metadata_) {
        for (const auto *name : { "zoom", "row", "col" }) {
            if (!vars.count(name)) { throw po::required_option(name); }
        }
    }
}

int GimiTile::run()
{
    try {
        const auto pd(gimirrai::tools::providerDefinition
                      (gimirrai::ProviderType::tile, data_, config_
                       , collection_));
        const auto tiles(gimirrai::createProvider
                         <gimirrai::TileProvider>(pd));

        if (metadata_) {
            const auto format
                (metadataFormat_.empty()
                 ? boost::lexical_cast<std::string>(tiles->metadataFormat())
                 : metadataFormat_);
            gimirrai::tools::write
                (output_, tiles->metadata(format, url_, tiles->layer()));
            return EXIT_SUCCESS;
        }

        const auto tile(tiles->tile(tms_, zoom_, row_, col_, format_));
        if (!tile) {
            LOG(info4) << "Tile " << tms_ << "/" << zoom_ << "/" << row_
                       << "/" << col_ << " is outside of data bounds.";
            return EXIT_SUCCESS;
        }

        gimirrai::tools::write(output_, tile->data);
    } catch (const std::exception &e) {
        LOG(fatal) << "Tile request failed: " << e.what();
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

int main(int argc, char *argv[])
{
    gimirrai::registerAll();
    return GimiTile()(argc, argv);
}
