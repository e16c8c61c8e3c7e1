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
#include <vector>

#include <boost/lexical_cast.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>

#include "dbglog/dbglog.hpp"

#include "service/cmdline.hpp"

#include "gimirrai/register.hpp"
#include "gimirrai/coverage.hpp"

#include "./common.hpp"

namespace po = boost::program_options;
namespace fs = boost::filesystem;
namespace ba = boost::algorithm;

class GimiCoverage : public service::Cmdline {
public:
    GimiCoverage()
        : service::Cmdline("gimi-coverage", "1.0")
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

    std::string bbox_;
    std::vector<std::string> subsets_;
    std::string properties_;
    std::string datetime_;

    gimirrai::CoverageProvider::Query query_;
};

void GimiCoverage::configuration(po::options_description &cmdline
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

        ("bbox", po::value(&bbox_)
         , "Bounding box: minx,miny,maxx,maxy.")
        ("bbox-crs", po::value(&query_.bboxCrs)
         ->default_value(query_.bboxCrs)
         , "EPSG code of bounding box coordinates.")
        ("subset", po::value(&subsets_)->multitoken()
         , "Subset AXIS=LOW:HIGH, can be repeated.")
        ("properties", po::value(&properties_)
         , "Comma separated list of bands.")
        ("datetime", po::value(&datetime_)
         , "Temporal filter.")
        ("format", po::value(&query_.format)
         ->default_value(query_.format)
         , "Output format: json or native.")
        ;

    pd.add("data", 1);

    (void) config;
}

void GimiCoverage::configure(const po::variables_map &vars)
{
    if (vars.count("config") == vars.count("data")) {
        throw po::error("exactly one of --config and --data is required");
    }

    if (vars.count("config") && !vars.count("collection")) {
        throw po::required_option("collection");
    }

    if (vars.count("bbox")) {
        std::vector<std::string> parts;
        ba::split(parts, bbox_, ba::is_any_of(","));
        try {
            for (const auto &part : parts) {
                query_.bbox.push_back(boost::lexical_cast<double>(part));
            }
        } catch (const boost::bad_lexical_cast&) {
            throw po::validation_error
                (po::validation_error::invalid_option_value, "bbox", bbox_);
        }
    }

    for (const auto &subset : subsets_) {
        const auto eq(subset.find('='));
        const auto colon(subset.find(':', eq));
        if ((eq == std::string::npos) || (colon == std::string::npos)) {
            throw po::validation_error
                (po::validation_error::invalid_option_value, "subset"
                 , subset);
        }

        try {
            query_.subsets[subset.substr(0, eq)]
                = std::make_pair
                (boost::lexical_cast<double>
                 (subset.substr(eq + 1, colon - eq - 1))
                 , boost::lexical_cast<double>(subset.substr(colon + 1)));
        } catch (const boost::bad_lexical_cast&) {
            throw po::validation_error
                (po::validation_error::invalid_option_value, "subset"
                 , subset);
        }
    }

    if (vars.count("properties")) {
        ba::split(query_.properties, properties_, ba::is_any_of(","));
    }

    if (vars.count("datetime")) { query_.datetime = datetime_; }
}

int GimiCoverage::run()
{
    try {
        const auto pd(gimirrai::tools::providerDefinition
                      (gimirrai::ProviderType::coverage, data_, config_
                       , collection_));
        const auto coverage(gimirrai::createProvider
                            <gimirrai::CoverageProvider>(pd));

        const auto response(coverage->query(query_));
        switch (response.type) {
        case gimirrai::CoverageProvider::Response::Type::json:
            gimirrai::tools::write(output_, response.json);
            break;

        case gimirrai::CoverageProvider::Response::Type::native:
            gimirrai::tools::write(output_, response.data);
            break;
        }
    } catch (const std::exception &e) {
        LOG(fatal) << "Coverage query failed: " << e.what();
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

int main(int argc, char *argv[])
{
    gimirrai::registerAll();
    return GimiCoverage()(argc, argv);
}
