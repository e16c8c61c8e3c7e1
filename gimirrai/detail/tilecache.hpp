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
 * @file detail/tilecache.hpp
 *
 * On-disk cache of rendered tiles.
 *
 * Entry file: 1 byte type (0 = empty, 1 = valid), 8 byte expiry time
 * (0 = never), tile data.
 */

#ifndef gimirrai_detail_tilecache_hpp_included_
#define gimirrai_detail_tilecache_hpp_included_

#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>

namespace gimirrai { namespace detail {

class TileCache {
public:
    typedef std::vector<char> Buffer;

    struct Entry {
        enum class Type { empty, valid, notFound };

        Type type;
        Buffer data;

        /** Expiry time, 0 means never.
         */
        std::time_t expires;

        Entry(Type type = Type::valid) : type(type), expires() {}
    };

    /** Cache rooted at given directory. Entries stored with nonzero ttl
     *  (in seconds) expire after that time.
     */
    TileCache(const boost::filesystem::path &root, std::time_t ttl = 0)
        : root_(root), ttl_(ttl)
    {}

    /** Fetches entry. Missing, corrupt and expired entries are reported as
     *  notFound; corrupt and expired files are removed.
     */
    Entry fetch(const std::string &key) const;

    /** Stores entry. Failure is logged and otherwise ignored.
     */
    void store(const std::string &key, const Entry &entry) const;

    /** Path of entry's file.
     */
    boost::filesystem::path path(const std::string &key) const;

private:
    boost::filesystem::path root_;
    std::time_t ttl_;
};

} } // namespace gimirrai::detail

#endif // gimirrai_detail_tilecache_hpp_included_
