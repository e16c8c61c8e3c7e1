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
#include <istream>
#include <ostream>

#include <boost/crc.hpp>
#include <boost/format.hpp>
#include <boost/filesystem.hpp>

#include "dbglog/dbglog.hpp"
#include "utility/uri.hpp"
#include "utility/streams.hpp"
#include "utility/path.hpp"
#include "utility/binaryio.hpp"
#include "utility/time.hpp"

#include "./tilecache.hpp"

namespace fs = boost::filesystem;
namespace bio = utility::binaryio;

namespace gimirrai { namespace detail {

namespace {

const std::uint8_t EmptyEntry(0);
const std::uint8_t ValidEntry(1);

const std::size_t HeaderSize(sizeof(std::uint8_t) + sizeof(std::int64_t));

typedef TileCache::Entry Entry;

void discard(const fs::path &path)
{
    boost::system::error_code ec;
    fs::remove(path, ec);
}

std::time_t now()
{
    return std::time_t(utility::currentTime().first);
}

/** Entry header: type and expiry time, no data.
 */
struct Header {
    Entry::Type type;
    std::int64_t expires;

    Header(Entry::Type type = Entry::Type::notFound, std::int64_t expires = 0)
        : type(type), expires(expires)
    {}

    bool expired(std::time_t at) const { return expires && (at > expires); }
};

void writeHeader(std::ostream &os, const Header &header)
{
    const std::uint8_t type((header.type == Entry::Type::valid)
                            ? ValidEntry : EmptyEntry);
    bio::write(os, type);
    bio::write(os, header.expires);
}

/** Reads header of entry file of given size. Returns header with notFound
 *  type when the file is not a valid entry.
 */
Header readHeader(std::istream &is, std::size_t size, const fs::path &file)
{
    if (size < HeaderSize) {
        LOG(warn1) << "Cached tile " << file << " is truncated.";
        return {};
    }

    std::uint8_t type;
    bio::read(is, type);

    Header header;
    bio::read(is, header.expires);

    switch (type) {
    case EmptyEntry: header.type = Entry::Type::empty; break;
    case ValidEntry: header.type = Entry::Type::valid; break;
    default:
        LOG(warn1) << "Cached tile " << file << " has invalid type "
                   << int(type) << ".";
    }
    return header;
}

} // namespace

fs::path TileCache::path(const std::string &key) const
{
    const auto name(utility::urlEncode(key));

    boost::crc_32_type crc;
    crc.process_bytes(name.data(), name.size());
    const auto hash(crc.checksum());

    return root_ / str(boost::format("%02x") % ((hash >> 24) & 0xff))
        / str(boost::format("%02x") % ((hash >> 16) & 0xff))
        / name;
}

Entry TileCache::fetch(const std::string &key) const
{
    const auto file(path(key));

    boost::system::error_code ec;
    if (!fs::exists(file, ec)) { return Entry(Entry::Type::notFound); }

    LOG(debug) << "Fetching cached tile <" << key << "> from " << file << ".";

    try {
        utility::ifstreambuf f(file.string());
        f.seekg(0, std::ifstream::end);
        const std::size_t size(f.tellg());
        f.seekg(0);

        const auto header(readHeader(f, size, file));
        if (header.type == Entry::Type::notFound) {
            discard(file);
            return Entry(Entry::Type::notFound);
        }

        if (header.expired(now())) {
            LOG(debug) << "Cached tile " << file << " expired.";
            discard(file);
            return Entry(Entry::Type::notFound);
        }

        Entry entry(header.type);
        entry.expires = header.expires;
        if (entry.type == Entry::Type::valid) {
            entry.data.resize(size - HeaderSize);
            bio::read(f, entry.data.data(), entry.data.size());
        }
        f.close();
        return entry;
    } catch (const std::exception &e) {
        LOG(warn1) << "Cannot read cached tile <" << key << "> from "
                   << file << ": " << e.what() << ".";
        discard(file);
    }

    return Entry(Entry::Type::notFound);
}

void TileCache::store(const std::string &key, const Entry &entry) const
{
    if (entry.type == Entry::Type::notFound) { return; }

    Header header(entry.type, entry.expires);
    if (!header.expires && ttl_) { header.expires = now() + ttl_; }

    const auto file(path(key));
    const auto tmp(utility::addExtension(file, ".tmp"));

    LOG(debug) << "Caching tile <" << key << "> in " << file << ".";

    try {
        fs::create_directories(tmp.parent_path());

        {
            utility::ofstreambuf f(tmp.string());
            writeHeader(f, header);
            if (entry.type == Entry::Type::valid) {
                bio::write(f, entry.data.data(), entry.data.size());
            }
            f.close();
        }

        fs::rename(tmp, file);
    } catch (const std::exception &e) {
        LOG(warn2) << "Cannot cache tile <" << key << "> in "
                   << file << ": " << e.what() << ".";
        discard(tmp);
    }
}

} } // namespace gimirrai::detail
