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
#include <fstream>
#include <stdexcept>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/lexical_cast.hpp>

#include "dbglog/dbglog.hpp"

#include "jsoncpp/as.hpp"
#include "jsoncpp/io.hpp"

#include "./config.hpp"

namespace fs = boost::filesystem;

namespace gimirrai {

namespace {

std::string join(const std::string &path, const std::string &key)
{
    if (path.empty()) { return key; }
    return path + "." + key;
}

/** Runs parser of given section and reports any JSON error with the
 *  section's key path.
 */
template <typename Parser>
void section(const std::string &path, Parser parser)
{
    try {
        parser();
    } catch (const Json::Error &e) {
        LOGTHROW(err2, std::runtime_error)
            << "Invalid configuration key <" << path << ">: " << e.what();
    }
}

const Json::Value& object(const Json::Value &value, const std::string &path)
{
    if (!value.isObject()) {
        LOGTHROW(err2, std::runtime_error)
            << "Configuration key <" << path << "> is not an object.";
    }
    return value;
}

std::vector<std::string> strings(const Json::Value &value
                                 , const std::string &path)
{
    std::vector<std::string> out;
    if (value.isNull()) { return out; }

    if (!value.isArray()) {
        LOGTHROW(err2, std::runtime_error)
            << "Configuration key <" << path << "> is not a list.";
    }

    for (const auto &item : value) {
        if (!item.isString()) {
            LOGTHROW(err2, std::runtime_error)
                << "Configuration key <" << path
                << "> contains a non-string value.";
        }
        out.push_back(item.asString());
    }
    return out;
}

LocalizedString localizedString(const Json::Value &value
                                , const std::string &path)
{
    LocalizedString ls;
    if (value.isNull()) { return ls; }

    if (value.isString()) {
        ls[""] = value.asString();
        return ls;
    }

    if (!value.isObject()) {
        LOGTHROW(err2, std::runtime_error)
            << "Configuration key <" << path
            << "> is neither a string nor a language map.";
    }

    for (const auto &language : value.getMemberNames()) {
        const auto &text(value[language]);
        if (!text.isString()) {
            LOGTHROW(err2, std::runtime_error)
                << "Configuration key <" << join(path, language)
                << "> is not a string.";
        }
        ls[language] = text.asString();
    }
    return ls;
}

void parse(ServerConfig &server, const Json::Value &value)
{
    const std::string path("server");
    object(value, path);

    if (value.isMember("bind")) {
        const auto &bind(object(value["bind"], join(path, "bind")));
        section(join(path, "bind"), [&]()
        {
            Json::getOpt(server.bind.host, bind, "host");
            Json::getOpt(server.bind.port, bind, "port");
        });
    }

    section(path, [&]()
    {
        Json::get(server.url, value, "url");
        Json::getOpt(server.mimetype, value, "mimetype");
        Json::getOpt(server.encoding, value, "encoding");
        Json::getOpt(server.gzip, value, "gzip");
        Json::getOpt(server.prettyPrint, value, "pretty_print");
        Json::getOpt(server.limit, value, "limit");
    });

    server.languages = strings(value["languages"], join(path, "languages"));

    if (value.isMember("map")) {
        const auto &map(object(value["map"], join(path, "map")));
        section(join(path, "map"), [&]()
        {
            Json::getOpt(server.map.url, map, "url");
            Json::getOpt(server.map.attribution, map, "attribution");
        });
    }

    if ((server.bind.port <= 0) || (server.bind.port > 65535)) {
        LOGTHROW(err2, std::runtime_error)
            << "Configuration key <server.bind.port> is out of range: "
            << server.bind.port << ".";
    }
}

void parse(LoggingConfig &logging, const Json::Value &value)
{
    object(value, "logging");
    section("logging", [&]()
    {
        Json::getOpt(logging.level, value, "level");

        std::string logfile;
        if (Json::getOpt(logfile, value, "logfile")) {
            logging.logfile = logfile;
        }
    });
}

void parse(MetadataConfig &metadata, const Json::Value &value)
{
    object(value, "metadata");

    const auto verbatim([&](Json::Value &dst, const char *name)
    {
        if (!value.isMember(name)) { return; }
        dst = object(value[name], join("metadata", name));
    });

    verbatim(metadata.identification, "identification");
    verbatim(metadata.license, "license");
    verbatim(metadata.provider, "provider");
    verbatim(metadata.contact, "contact");
}

ProviderDefinition parseProvider(const Json::Value &value
                                 , const std::string &path)
{
    object(value, path);

    ProviderDefinition pd;
    section(path, [&]()
    {
        std::string type;
        Json::get(type, value, "type");
        try {
            pd.type = boost::lexical_cast<ProviderType>(type);
        } catch (const boost::bad_lexical_cast&) {
            LOGTHROW(err2, std::runtime_error)
                << "Configuration key <" << join(path, "type")
                << "> holds unknown provider type <" << type << ">.";
        }

        Json::get(pd.name, value, "name");
        Json::get(pd.data, value, "data");

        if (value.isMember("format")) {
            const auto &format(object(value["format"], join(path, "format")));
            ProviderDefinition::Format f;
            Json::get(f.name, format, "name");
            Json::getOpt(f.mimetype, format, "mimetype");
            pd.format = f;
        }

        if (value.isMember("options")) {
            pd.options = object(value["options"], join(path, "options"));
        }
    });

    return pd;
}

void parse(ResourceConfig &resource, const Json::Value &value
           , const std::string &path)
{
    object(value, path);

    section(path, [&]()
    {
        Json::get(resource.type, value, "type");
    });

    resource.title = localizedString(value["title"], join(path, "title"));
    resource.description = localizedString(value["description"]
                                           , join(path, "description"));
    resource.keywords = strings(value["keywords"], join(path, "keywords"));

    if (value.isMember("extents")) {
        const auto extentsPath(join(path, "extents"));
        const auto &extents(object(value["extents"], extentsPath));

        if (extents.isMember("spatial")) {
            const auto spatialPath(join(extentsPath, "spatial"));
            const auto &spatial(object(extents["spatial"], spatialPath));

            section(spatialPath, [&]()
            {
                const auto &bbox(Json::check(spatial["bbox"], Json::arrayValue
                                             , "bbox"));
                if (bbox.size() != 4) {
                    LOGTHROW(err2, std::runtime_error)
                        << "Configuration key <" << join(spatialPath, "bbox")
                        << "> must hold 4 numbers.";
                }

                double b[4];
                for (int i(0); i < 4; ++i) {
                    if (!bbox[i].isNumeric()) {
                        LOGTHROW(err2, std::runtime_error)
                            << "Configuration key <"
                            << join(spatialPath, "bbox")
                            << "> holds a non-numeric value.";
                    }
                    b[i] = bbox[i].asDouble();
                }
                resource.spatial.bbox = math::Extents2(b[0], b[1], b[2], b[3]);

                Json::getOpt(resource.spatial.crs, spatial, "crs");
            });
        }

        if (extents.isMember("temporal")) {
            const auto temporalPath(join(extentsPath, "temporal"));
            const auto &temporal(object(extents["temporal"], temporalPath));

            ResourceConfig::Temporal t;
            section(temporalPath, [&]()
            {
                std::string tmp;
                if (Json::getOpt(tmp, temporal, "begin")) { t.begin = tmp; }
                if (Json::getOpt(tmp, temporal, "end")) { t.end = tmp; }
            });
            resource.temporal = t;
        }
    }

    const auto providersPath(join(path, "providers"));
    const auto &providers(value["providers"]);
    if (!providers.isNull()) {
        if (!providers.isArray()) {
            LOGTHROW(err2, std::runtime_error)
                << "Configuration key <" << providersPath
                << "> is not a list.";
        }

        for (Json::ArrayIndex i(0), e(providers.size()); i != e; ++i) {
            resource.providers.push_back
                (parseProvider(providers[i], providersPath + "["
                               + boost::lexical_cast<std::string>(i) + "]"));
        }
    }
}

const char* loggingMask(const std::string &level)
{
    const auto l(boost::algorithm::to_upper_copy(level));
    if (l == "DEBUG") { return "ALL"; }
    if (l == "INFO") { return "I2W1E1"; }
    if ((l == "WARNING") || (l == "WARN")) { return "W1E1"; }
    if (l == "ERROR") { return "E1"; }
    if (l == "CRITICAL") { return "E3"; }
    return nullptr;
}

} // namespace

std::string localized(const LocalizedString &ls, const std::string &language)
{
    if (ls.empty()) { return {}; }

    auto fls(ls.find(language));
    if (fls != ls.end()) { return fls->second; }

    fls = ls.find("");
    if (fls != ls.end()) { return fls->second; }

    return ls.begin()->second;
}

const ProviderDefinition* ResourceConfig::provider(ProviderType type) const
{
    for (const auto &pd : providers) {
        if (pd.type == type) { return &pd; }
    }
    return nullptr;
}

const ResourceConfig& Config::resource(const std::string &resourceId) const
{
    auto fresources(resources.find(resourceId));
    if (fresources == resources.end()) {
        LOGTHROW(err2, ProviderNotFoundError)
            << "No resource <" << resourceId << "> configured.";
    }
    return fresources->second;
}

const ProviderDefinition& Config::provider(const std::string &resourceId
                                           , ProviderType type) const
{
    if (const auto *pd = resource(resourceId).provider(type)) {
        return *pd;
    }

    LOGTHROW(err2, ProviderNotFoundError)
        << "Resource <" << resourceId << "> has no " << type
        << " provider.";
    throw; // never reached
}

ProviderDefinition parseProvider(const Json::Value &value)
{
    return parseProvider(value, "provider");
}

Config parseConfig(const Json::Value &value)
{
    object(value, "<root>");

    Config config;

    if (!value.isMember("server")) {
        LOGTHROW(err2, std::runtime_error)
            << "Configuration key <server> is missing.";
    }
    parse(config.server, value["server"]);

    if (value.isMember("logging")) {
        parse(config.logging, value["logging"]);
    }

    if (value.isMember("metadata")) {
        parse(config.metadata, value["metadata"]);
    }

    if (value.isMember("resources")) {
        const auto &resources(object(value["resources"], "resources"));
        for (const auto &id : resources.getMemberNames()) {
            ResourceConfig resource;
            resource.id = id;
            parse(resource, resources[id], join("resources", id));
            config.resources.insert(ResourceConfig::map::value_type
                                    (id, resource));
        }
    }

    LOG(info2) << "Parsed configuration with " << config.resources.size()
               << " resource(s).";
    return config;
}

Config loadConfig(const fs::path &path)
{
    LOG(info1) << "Loading configuration from " << path << ".";

    std::ifstream f;
    f.exceptions(std::ios::badbit | std::ios::failbit);
    try {
        f.open(path.string(), std::ios_base::in);
        f.exceptions(std::ios::badbit);
    } catch (const std::ios_base::failure &e) {
        LOGTHROW(err2, std::runtime_error)
            << "Unable to open configuration " << path << ": "
            << e.what() << ".";
    }

    Json::Value value;
    try {
        value = Json::read(f, path, "configuration");
    } catch (const Json::Error &e) {
        LOGTHROW(err2, std::runtime_error)
            << "Invalid configuration format (" << e.what()
            << "); file: " << path << ".";
    }

    return parseConfig(value);
}

void configureLogging(const LoggingConfig &logging)
{
    const auto *mask(loggingMask(logging.level));
    if (!mask) {
        LOGTHROW(err2, std::runtime_error)
            << "Configuration key <logging.level> holds unknown level <"
            << logging.level << ">.";
    }

    dbglog::set_mask(mask);

    if (logging.logfile) {
        dbglog::log_file(*logging.logfile);
        LOG(info3) << "Logging into " << *logging.logfile << ".";
    }
}

} // namespace gimirrai
