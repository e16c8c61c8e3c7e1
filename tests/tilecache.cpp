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
#include <string>

#include <boost/filesystem.hpp>

#include <gtest/gtest.h>

#include "utility/streams.hpp"

#include "gimirrai/detail/tilecache.hpp"

#include "./support.hpp"

namespace fs = boost::filesystem;

namespace gimirrai { namespace detail {

namespace {

TileCache::Entry entry(const std::string &data)
{
    TileCache::Entry e;
    e.data.assign(data.begin(), data.end());
    return e;
}

} // namespace

TEST(TileCacheTest, storeAndFetch)
{
    test::TemporaryDirectory tmp;
    TileCache cache(tmp.path());

    EXPECT_EQ(TileCache::Entry::Type::notFound
              , cache.fetch("WebMercatorQuad/3/4/2.png").type);

    cache.store("WebMercatorQuad/3/4/2.png", entry("tile data"));

    const auto e(cache.fetch("WebMercatorQuad/3/4/2.png"));
    ASSERT_EQ(TileCache::Entry::Type::valid, e.type);
    EXPECT_EQ("tile data", std::string(e.data.begin(), e.data.end()));
    EXPECT_EQ(0, e.expires);
}

TEST(TileCacheTest, emptyEntry)
{
    test::TemporaryDirectory tmp;
    TileCache cache(tmp.path());

    cache.store("a/0/0/0.png", TileCache::Entry(TileCache::Entry::Type::empty));
    const auto e(cache.fetch("a/0/0/0.png"));
    EXPECT_EQ(TileCache::Entry::Type::empty, e.type);
    EXPECT_TRUE(e.data.empty());

    // notFound entries are never stored
    cache.store("b/0/0/0.png"
                , TileCache::Entry(TileCache::Entry::Type::notFound));
    EXPECT_FALSE(fs::exists(cache.path("b/0/0/0.png")));
}

TEST(TileCacheTest, layout)
{
    test::TemporaryDirectory tmp;
    TileCache cache(tmp.path());

    const auto path(cache.path("WorldCRS84Quad/1/2/3.jpeg"));
    EXPECT_EQ(tmp.path(), path.parent_path().parent_path().parent_path());
    EXPECT_EQ(2u, path.parent_path().filename().string().size());
    EXPECT_EQ(std::string::npos, path.filename().string().find('/'));

    cache.store("WorldCRS84Quad/1/2/3.jpeg", entry("x"));
    EXPECT_TRUE(fs::exists(path));
}

TEST(TileCacheTest, expiredEntryIsRemoved)
{
    test::TemporaryDirectory tmp;
    TileCache cache(tmp.path());

    auto e(entry("old"));
    e.expires = 1;
    cache.store("k", e);
    ASSERT_TRUE(fs::exists(cache.path("k")));

    EXPECT_EQ(TileCache::Entry::Type::notFound, cache.fetch("k").type);
    EXPECT_FALSE(fs::exists(cache.path("k")));
}

TEST(TileCacheTest, ttlSetsExpiry)
{
    test::TemporaryDirectory tmp;
    TileCache cache(tmp.path(), 3600);

    cache.store("k", entry("fresh"));
    const auto e(cache.fetch("k"));
    ASSERT_EQ(TileCache::Entry::Type::valid, e.type);
    EXPECT_GT(e.expires, 0);
}

TEST(TileCacheTest, corruptEntryIsRemoved)
{
    test::TemporaryDirectory tmp;
    TileCache cache(tmp.path());

    const auto path(cache.path("k"));
    fs::create_directories(path.parent_path());
    {
        utility::ofstreambuf f(path.string());
        f << "xy";
        f.close();
    }

    EXPECT_EQ(TileCache::Entry::Type::notFound, cache.fetch("k").type);
    EXPECT_FALSE(fs::exists(path));
}

TEST(TileCacheTest, invalidTypeIsRemoved)
{
    test::TemporaryDirectory tmp;
    TileCache cache(tmp.path());

    const auto path(cache.path("k"));
    fs::create_directories(path.parent_path());
    {
        // full header with unknown type byte
        utility::ofstreambuf f(path.string());
        f << std::string(9, '\x07') << "data";
        f.close();
    }

    EXPECT_EQ(TileCache::Entry::Type::notFound, cache.fetch("k").type);
    EXPECT_FALSE(fs::exists(path));
}

TEST(TileCacheTest, emptyEntryKeepsExpiry)
{
    test::TemporaryDirectory tmp;
    TileCache cache(tmp.path(), 3600);

    cache.store("k", TileCache::Entry(TileCache::Entry::Type::empty));
    EXPECT_EQ(9u, fs::file_size(cache.path("k")));

    const auto e(cache.fetch("k"));
    EXPECT_EQ(TileCache::Entry::Type::empty, e.type);
    EXPECT_GT(e.expires, 0);
    EXPECT_TRUE(e.data.empty());
}

} } // namespace gimirrai::detail
