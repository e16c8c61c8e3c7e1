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
 * @file config.hpp
 *
 * Server configuration: server, logging, metadata and resources blocks.
 */

#ifndef gimirrai_config_hpp_included_
#define gimirrai_config_hpp_included_

#include <map>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/filesystem/path.hpp>

#include "jsoncpp/json.hpp"

#include "math/geometry_core.hpp"

#include "./provider.hpp"

namespace gimirrai {

/** Text in one or more languages. Plain strings are stored under the empty
 *  language.
 */
typedef std::map<std::string, std::string> LocalizedString;

/** Returns text in given language, the first available otherwise.
 */
std::string localized(const LocalizedString &ls
                      , const std::string &language = "en");

struct ServerConfig {
    struct Bind {
        std::string host;
        int port;

        Bind() : host("0.0.0.0"), port(5000) {}
    };

    struct Map {
        std::string url;
        std::string attribution;
    };

    Bind bind;
    std::string url;
    std::string mimetype;
    std::string encoding;
    bool gzip;
    std::vector<std::string> languages;
    bool prettyPrint;
    int limit;
    Map map;

    ServerConfig()
        : mimetype("application/json; charset=UTF-8"), encoding("utf-8")
        , gzip(false), prettyPrint(false), limit(10)
    {}
};

struct LoggingConfig {
    std::string level;
    boost::optional<std::string> logfile;

    LoggingConfig() : level("ERROR") {}
};

/** Metadata objects, kept verbatim for the host framework.
 */
struct MetadataConfig {
    Json::Value identification;
    Json::Value license;
    Json::Value provider;
    Json::Value contact;
};

struct ResourceConfig {
    struct Spatial {
        math::Extents2 bbox;
        std::string crs;

        Spatial()
            : bbox(-180.0, -90.0, 180.0, 90.0)
            , crs("http://www.opengis.net/def/crs/OGC/1.3/CRS84")
        {}
    };

    struct Temporal {
        boost::optional<std::string> begin;
        boost::optional<std::string> end;
    };

    std::string id;
    std::string type;
    LocalizedString title;
    LocalizedString description;
    std::vector<std::string> keywords;
    Spatial spatial;
    boost::optional<Temporal> temporal;
    std::vector<ProviderDefinition> providers;

    /** First provider of given type, if any.
     */
    const ProviderDefinition* provider(ProviderType type) const;

    typedef std::map<std::string, ResourceConfig> map;
};

struct Config {
    ServerConfig server;
    LoggingConfig logging;
    MetadataConfig metadata;
    ResourceConfig::map resources;

    /** Resource's provider definition of given type.
     *
     * Throws ProviderNotFoundError when there is no such resource or provider.
     */
    const ProviderDefinition& provider(const std::string &resourceId
                                       , ProviderType type) const;

    const ResourceConfig& resource(const std::string &resourceId) const;
};

/** Loads configuration from a JSON file.
 *
 * Throws std::runtime_error on I/O or format error.
 */
Config loadConfig(const boost::filesystem::path &path);

/** Parses already loaded configuration.
 *
 * Throws std::runtime_error naming the offending key.
 */
Config parseConfig(const Json::Value &value);

/** Parses single provider definition.
 */
ProviderDefinition parseProvider(const Json::Value &value);

/** Applies logging configuration to the global logger.
 */
void configureLogging(const LoggingConfig &logging);

} // namespace gimirrai

#endif // gimirrai_config_hpp_included_
