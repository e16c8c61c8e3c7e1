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
 * @file coverage.hpp
 *
 * Coverage provider: domain set, range type and coverage queries over the
 * first image of a GIMI file.
 */

#ifndef gimirrai_coverage_hpp_included_
#define gimirrai_coverage_hpp_included_

#include <array>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <boost/optional.hpp>

#include "jsoncpp/json.hpp"

#include "./provider.hpp"
#include "./metadata.hpp"
#include "./detail/dataset.hpp"

namespace gimirrai {

struct CoverageProperties {
    /** [minx, miny, maxx, maxy]
     */
    std::array<double, 4> bbox;
    std::string bboxCrs;
    std::string crsType;
    std::string bboxUnits;
    std::string xAxisLabel;
    std::string yAxisLabel;
    int width;
    int height;
    double resx;
    double resy;
    Json::Value tags;

    CoverageProperties()
        : bbox(), width(), height(), resx(), resy()
        , tags(Json::objectValue)
    {}
};

class CoverageProvider : public Provider {
public:
    struct Query {
        /** Selected bands, 1-based band numbers as strings.
         */
        std::vector<std::string> properties;

        /** Axis label -> [low, high]
         */
        std::map<std::string, std::pair<double, double> > subsets;

        /** Empty or [minx, miny, maxx, maxy]
         */
        std::vector<double> bbox;

        /** EPSG code of bbox.
         */
        int bboxCrs;

        boost::optional<std::string> datetime;

        /** "json" or anything else for native format.
         */
        std::string format;

        Query() : bboxCrs(4326), format("json") {}
    };

    struct Response {
        enum class Type { json, native };

        Type type;

        /** CoverageJSON document, valid for Type::json.
         */
        Json::Value json;

        /** Encoded data, valid for Type::native.
         */
        detail::Buffer data;

        std::string mimetype;

        Response() : type(Type::json) {}
    };

    /** Reads metadata of definition's data file.
     *
     * Throws ProviderConnectionError on failure.
     */
    CoverageProvider(const ProviderDefinition &definition);

    const GimiMetadata& gimiMetadata() const { return metadata_; }
    const CoverageProperties& coverageProperties() const {
        return properties_;
    }

    const std::vector<std::string>& axes() const { return axes_; }
    const std::string& crs() const { return properties_.bboxCrs; }
    int numBands() const { return int(fields_.size()); }
    const std::vector<std::string>& fields() const { return fields_; }
    const std::string& nativeFormat() const { return nativeFormat_; }

    Json::Value domainSet() const;

    Json::Value rangeType() const;

    /** Runs coverage query.
     *
     * Throws ProviderQueryError or ProviderInvalidQueryError.
     */
    Response query(const Query &query) const;

private:
    const ImageMetadata& image() const { return metadata_.images.front(); }

    Response passthrough() const;

    GimiMetadata metadata_;
    CoverageProperties properties_;
    std::vector<std::string> axes_;
    std::vector<std::string> fields_;
    std::string nativeFormat_;
};

} // namespace gimirrai

#endif // gimirrai_coverage_hpp_included_
