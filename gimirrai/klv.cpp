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
#include <algorithm>
#include <stdexcept>

#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>

#include "dbglog/dbglog.hpp"

#include "./klv.hpp"

namespace gimirrai {

namespace klv {

const std::array<std::uint8_t, 16> St0601Key = {{
        0x06, 0x0e, 0x2b, 0x34, 0x02, 0x0b, 0x01, 0x01
        , 0x0e, 0x01, 0x03, 0x01, 0x01, 0x00, 0x00, 0x00
    }};

const char *St0601UriType
    ("urn:nsg:KLV:ul:060E2B34.020B0101.0E010301.01000000");

const char *ContentIdUriType
    ("urn:uuid:aac8ab7d-f519-5437-b7d3-c973d155e253");

const unsigned int MaxIterations(1000);

namespace {

namespace def {
    const double LatitudeScale(180.0 / 4294967294.0);
    const double LongitudeScale(360.0 / 4294967294.0);

    // reserved "error" value of corner coordinates
    const std::uint32_t CornerError(0x80000000);

    const std::uint64_t UsecPerDay(86400ull * 1000000ull);
} // namespace def

} // namespace

const char* tagName(unsigned int tag)
{
    switch (tag) {
    case checksum: return "checksum";
    case precisionTimeStamp: return "begin_position";
    case missionId: return "title";
    case version: return "st0601_version";
    case cornerLatitudePoint1: return "pt1_north_bound_latitude";
    case cornerLongitudePoint1: return "pt1_west_bound_longitude";
    case cornerLatitudePoint2: return "pt2_north_bound_latitude";
    case cornerLongitudePoint2: return "pt2_east_bound_longitude";
    case cornerLatitudePoint3: return "pt3_south_bound_latitude";
    case cornerLongitudePoint3: return "pt3_east_bound_longitude";
    case cornerLatitudePoint4: return "pt4_south_bound_latitude";
    case cornerLongitudePoint4: return "pt4_west_bound_longitude";
    }
    return nullptr;
}

double decodeLatitude(std::int32_t value)
{
    return def::LatitudeScale * value;
}

double decodeLongitude(std::int32_t value)
{
    return def::LongitudeScale * value;
}

boost::optional<std::string> decodeTimestamp(std::uint64_t value)
{
    namespace bg = boost::gregorian;

    const bg::date epoch(1970, 1, 1);
    const auto maxDays((bg::date(9999, 12, 31) - epoch).days());

    const auto days(value / def::UsecPerDay);
    if (days > std::uint64_t(maxDays)) {
        LOG(warn2) << "Could not decode timestamp " << value << ".";
        return boost::none;
    }

    const auto date(epoch + bg::days(long(days)));
    auto usec(value % def::UsecPerDay);
    const auto hours(usec / 3600000000ull); usec %= 3600000000ull;
    const auto minutes(usec / 60000000ull); usec %= 60000000ull;
    const auto seconds(usec / 1000000ull); usec %= 1000000ull;

    return str(boost::format("%04d-%02d-%02dT%02d:%02d:%02d.%06dZ")
               % int(date.year()) % int(date.month()) % int(date.day())
               % hours % minutes % seconds % usec);
}

std::uint16_t computeChecksum(const std::uint8_t *data, std::size_t size)
{
    std::uint16_t bcc(0);
    for (std::size_t i(0); i < size; ++i) {
        bcc += std::uint16_t(data[i] << (8 * ((i + 1) % 2)));
    }
    return bcc;
}

} // namespace klv

namespace {

/** Big-endian cursor over raw KLV data.
 */
class Reader {
public:
    Reader(const std::uint8_t *data, std::size_t size)
        : data_(data), end_(data + size)
    {}

    bool eof() const { return data_ >= end_; }
    std::size_t left() const { return end_ - data_; }
    const std::uint8_t* position() const { return data_; }

    /** Shrinks readable area to given number of bytes.
     */
    void limit(std::size_t size) {
        if (size < left()) { end_ = data_ + size; }
    }

    std::uint8_t byte() {
        check(1);
        return *data_++;
    }

    void skip(std::size_t size) {
        check(size);
        data_ += size;
    }

    /** BER length, short and long form.
     */
    std::size_t length() {
        const auto first(byte());
        if (!(first & 0x80)) { return first; }

        const auto count(first & 0x7f);
        if (!count || (count > 8)) {
            LOGTHROW(err1, std::runtime_error)
                << "Invalid BER length of " << count << " bytes.";
        }
        return std::size_t(unsignedValue(count));
    }

    /** BER-OID encoded tag.
     */
    unsigned int tag() {
        unsigned int value(0);
        for (int i(0); i < 4; ++i) {
            const auto b(byte());
            value = (value << 7) | (b & 0x7f);
            if (!(b & 0x80)) { return value; }
        }
        LOGTHROW(err1, std::runtime_error)
            << "BER-OID tag longer than 4 bytes.";
        return value;
    }

    std::uint64_t unsignedValue(std::size_t size) {
        if (size > 8) {
            LOGTHROW(err1, std::runtime_error)
                << "Integer value of " << size << " bytes not supported.";
        }
        check(size);
        std::uint64_t value(0);
        while (size--) { value = (value << 8) | *data_++; }
        return value;
    }

    std::string string(std::size_t size) {
        check(size);
        std::string value(reinterpret_cast<const char*>(data_), size);
        data_ += size;
        return value;
    }

private:
    void check(std::size_t size) const {
        if (size > left()) {
            LOGTHROW(err1, std::runtime_error)
                << "KLV value runs past end of data (" << size
                << " bytes needed, " << left() << " available).";
        }
    }

    const std::uint8_t *data_;
    const std::uint8_t *end_;
};

template <typename T>
void add(Klv &ls, unsigned int tag, const T &value)
{
    ls.items.emplace_back(klv::tagName(tag)
                          , boost::lexical_cast<std::string>(value));
}

std::string formatCoordinate(double value)
{
    return str(boost::format("%.9f") % value);
}

void corner(Klv &ls, unsigned int tag, Reader &r, std::size_t length)
{
    const auto raw(r.unsignedValue(length));
    if ((length == 4) && (raw == klv::def::CornerError)) {
        LOG(debug) << "Corner " << klv::tagName(tag) << " reports error.";
        return;
    }
    // sign-extend
    const auto value(std::int32_t(std::uint32_t(raw)));

    const int point((tag - klv::cornerLatitudePoint1) / 2);
    if (!((tag - klv::cornerLatitudePoint1) % 2)) {
        const auto lat(klv::decodeLatitude(value));
        ls.cornerLatitude[point] = lat;
        ls.items.emplace_back(klv::tagName(tag), formatCoordinate(lat));
    } else {
        const auto lon(klv::decodeLongitude(value));
        ls.cornerLongitude[point] = lon;
        ls.items.emplace_back(klv::tagName(tag), formatCoordinate(lon));
    }
}

} // namespace

Klv decodeKlv(const std::uint8_t *data, std::size_t size)
{
    Klv ls;
    Reader r(data, size);

    const bool keyed((size >= klv::St0601Key.size())
                     && std::equal(klv::St0601Key.begin()
                                   , klv::St0601Key.end(), data));
    if (keyed) {
        r.skip(klv::St0601Key.size());
        const auto length(r.length());
        if (length > r.left()) {
            LOGTHROW(err1, std::runtime_error)
                << "Local set length " << length << " exceeds available "
                << r.left() << " bytes.";
        }
        r.limit(length);
    }

    unsigned int iteration(0);
    for (; !r.eof() && (iteration < klv::MaxIterations); ++iteration) {
        const auto tag(r.tag());
        const auto length(r.length());

        switch (tag) {
        case klv::checksum: {
            // checksum covers everything up to and including its length
            const auto computed(klv::computeChecksum
                                (data, r.position() - data));
            const auto value(std::uint16_t(r.unsignedValue(length)));
            ls.checksum = value;
            add(ls, tag, value);
            ls.complete = true;

            if (keyed && (computed != value)) {
                LOG(warn2) << "KLV checksum mismatch: stored " << value
                           << ", computed " << computed << ".";
            }
            break;
        }

        case klv::precisionTimeStamp:
            ls.beginPosition = klv::decodeTimestamp(r.unsignedValue(length));
            if (ls.beginPosition) {
                add(ls, tag, *ls.beginPosition);
            }
            break;

        case klv::missionId:
            ls.title = r.string(length);
            add(ls, tag, *ls.title);
            break;

        case klv::version:
            ls.version = unsigned(r.unsignedValue(length));
            add(ls, tag, *ls.version);
            break;

        case klv::cornerLatitudePoint1:
        case klv::cornerLongitudePoint1:
        case klv::cornerLatitudePoint2:
        case klv::cornerLongitudePoint2:
        case klv::cornerLatitudePoint3:
        case klv::cornerLongitudePoint3:
        case klv::cornerLatitudePoint4:
        case klv::cornerLongitudePoint4:
            corner(ls, tag, r, length);
            break;

        default:
            LOG(debug) << "Found unknown tag: " << tag << ", skipping.";
            r.skip(length);
            continue;
        }

        LOG(debug) << "Found <" << klv::tagName(tag) << ">.";

        if (ls.complete) { break; }
    }

    if (!ls.complete) {
        LOG(warn2) << "Could not find value for checksum (read "
                   << iteration << " items); might have not read all values.";
    }

    return ls;
}

boost::optional<math::Point2> Klv::corner(int index) const
{
    if ((index < 0) || (index > 3)) { return boost::none; }
    const auto &lon(cornerLongitude[index]);
    const auto &lat(cornerLatitude[index]);
    if (!lon || !lat) { return boost::none; }
    return math::Point2(*lon, *lat);
}

boost::optional<std::array<math::Point2, 4> > Klv::corners() const
{
    std::array<math::Point2, 4> points;
    for (int i(0); i < 4; ++i) {
        const auto p(corner(i));
        if (!p) { return boost::none; }
        points[i] = *p;
    }
    return points;
}

boost::optional<std::string> Klv::item(const std::string &name) const
{
    for (const auto &i : items) {
        if (i.first == name) { return i.second; }
    }
    return boost::none;
}

} // namespace gimirrai
