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
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "utility/streams.hpp"

#include "gimirrai/config.hpp"

#include "./support.hpp"

namespace fs = boost::filesystem;

namespace gimirrai {

namespace {

const char *SampleConfig(R"RAW({
    "server": {
        "bind": { "host": "127.0.0.1", "port": 8080 },
        "url": "http://localhost:8080",
        "languages": [ "en-US", "fr-CA" ],
        "pretty_print": true
    },
    "logging": { "level": "INFO" },
    "metadata": {
        "identification": { "title": "GIMI server" }
    },
    "resources": {
        "gimi-coverage": {
            "type": "collection",
            "title": { "en": "GIMI coverage", "fr": "Couverture GIMI" },
            "keywords": [ "gimi", "heif" ],
            "extents": {
                "spatial": { "bbox": [ 10, 49.5, 11, 50 ] },
                "temporal": { "begin": "2023-11-14T22:13:20Z" }
            },
            "providers": [
                {
                    "type": "coverage",
                    "name": "gimirrai.providers.GimiCoverageProvider",
                    "data": "/data/gimi.heif",
                    "format": { "name": "GTiff", "mimetype": "image/tiff" },
                    "options": { "native_driver": "GTiff" }
                },
                {
                    "type": "tile",
                    "name": "gimirrai.providers.GimiTileProvider",
                    "data": "/data/gimi.heif",
                    "options": { "zoom": { "min": 0, "max": 10 } }
                }
            ]
        }
    }
})RAW");

fs::path write(const test::TemporaryDirectory &tmp, const std::string &data)
{
    const auto path(tmp / "config.json");
    utility::ofstreambuf f(path.string());
    f << data;
    f.close();
    return path;
}

Json::Value minimal()
{
    Json::Value value(Json::objectValue);
    value["server"]["url"] = "http://localhost:5000";
    return value;
}

} // namespace

TEST(ConfigTest, loadsConfiguration)
{
    test::TemporaryDirectory tmp;
    const auto config(loadConfig(write(tmp, SampleConfig)));

    EXPECT_EQ("127.0.0.1", config.server.bind.host);
    EXPECT_EQ(8080, config.server.bind.port);
    EXPECT_EQ("http://localhost:8080", config.server.url);
    ASSERT_EQ(2u, config.server.languages.size());
    EXPECT_EQ("fr-CA", config.server.languages[1]);
    EXPECT_TRUE(config.server.prettyPrint);
    EXPECT_EQ("INFO", config.logging.level);
    EXPECT_EQ("GIMI server"
              , config.metadata.identification["title"].asString());

    const auto &resource(config.resource("gimi-coverage"));
    EXPECT_EQ("collection", resource.type);
    EXPECT_EQ("GIMI coverage", localized(resource.title));
    EXPECT_EQ("Couverture GIMI", localized(resource.title, "fr"));
    EXPECT_EQ(2u, resource.keywords.size());
    EXPECT_DOUBLE_EQ(49.5, resource.spatial.bbox.ll(1));
    ASSERT_TRUE(bool(resource.temporal));
    EXPECT_EQ(std::string("2023-11-14T22:13:20Z"), *resource.temporal->begin);
    EXPECT_FALSE(bool(resource.temporal->end));
}

TEST(ConfigTest, providerLookup)
{
    test::TemporaryDirectory tmp;
    const auto config(loadConfig(write(tmp, SampleConfig)));

    const auto &coverage(config.provider("gimi-coverage"
                                         , ProviderType::coverage));
    EXPECT_EQ("gimirrai.providers.GimiCoverageProvider", coverage.name);
    EXPECT_EQ("/data/gimi.heif", coverage.data);
    ASSERT_TRUE(bool(coverage.format));
    EXPECT_EQ("GTiff", coverage.format->name);
    EXPECT_EQ("image/tiff", coverage.format->mimetype);
    EXPECT_EQ("GTiff", coverage.options["native_driver"].asString());

    const auto &tile(config.provider("gimi-coverage", ProviderType::tile));
    EXPECT_EQ(10, tile.options["zoom"]["max"].asInt());
    EXPECT_FALSE(bool(tile.format));

    EXPECT_THROW(config.provider("unknown", ProviderType::tile)
                 , ProviderNotFoundError);
}

TEST(ConfigTest, defaults)
{
    const auto config(parseConfig(minimal()));

    EXPECT_EQ("0.0.0.0", config.server.bind.host);
    EXPECT_EQ(5000, config.server.bind.port);
    EXPECT_EQ(10, config.server.limit);
    EXPECT_FALSE(config.server.gzip);
    EXPECT_EQ("ERROR", config.logging.level);
    EXPECT_FALSE(bool(config.logging.logfile));
    EXPECT_TRUE(config.resources.empty());
}

TEST(ConfigTest, missingProviderType)
{
    auto value(minimal());
    auto &resource(value["resources"]["r"]);
    resource["type"] = "collection";

    Json::Value provider(Json::objectValue);
    provider["type"] = "coverage";
    provider["name"] = "gimirrai.providers.GimiCoverageProvider";
    provider["data"] = "/data/gimi.heif";
    resource["providers"].append(provider);

    const auto config(parseConfig(value));
    EXPECT_EQ(nullptr, config.resource("r").provider(ProviderType::tile));
    EXPECT_THROW(config.provider("r", ProviderType::tile)
                 , ProviderNotFoundError);
    EXPECT_NO_THROW(config.provider("r", ProviderType::coverage));
}

TEST(ConfigTest, invalidConfiguration)
{
    EXPECT_THROW(parseConfig(Json::Value(Json::objectValue))
                 , std::runtime_error);

    {
        // url is mandatory
        Json::Value value(Json::objectValue);
        value["server"] = Json::Value(Json::objectValue);
        EXPECT_THROW(parseConfig(value), std::runtime_error);
    }

    {
        auto value(minimal());
        value["server"]["bind"]["port"] = 70000;
        EXPECT_THROW(parseConfig(value), std::runtime_error);
    }

    {
        auto value(minimal());
        auto &bbox(value["resources"]["r"]["extents"]["spatial"]["bbox"]);
        value["resources"]["r"]["type"] = "collection";
        bbox.append(1.0);
        bbox.append(2.0);
        EXPECT_THROW(parseConfig(value), std::runtime_error);
    }

    {
        auto value(minimal());
        auto &resource(value["resources"]["r"]);
        resource["type"] = "collection";
        Json::Value provider(Json::objectValue);
        provider["type"] = "feature";
        provider["name"] = "x";
        provider["data"] = "y";
        resource["providers"].append(provider);
        EXPECT_THROW(parseConfig(value), std::runtime_error);
    }
}

TEST(ConfigTest, unreadableFile)
{
    test::TemporaryDirectory tmp;
    EXPECT_THROW(loadConfig(tmp / "missing.json"), std::runtime_error);
    EXPECT_THROW(loadConfig(write(tmp, "{ \"server\": ")), std::runtime_error);
}

TEST(ConfigTest, loggingLevels)
{
    LoggingConfig logging;
    logging.level = "verbose";
    EXPECT_THROW(configureLogging(logging), std::runtime_error);
}

TEST(ConfigTest, localizedFallback)
{
    LocalizedString ls;
    EXPECT_EQ("", localized(ls));

    ls["de"] = "Titel";
    EXPECT_EQ("Titel", localized(ls));

    ls[""] = "Title";
    EXPECT_EQ("Title", localized(ls, "fr"));
}

} // namespace gimirrai
