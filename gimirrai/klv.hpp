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
 * @file klv.hpp
 *
 * MISB ST0601 (UAS Datalink Local Set) decoder.
 *
 * Only the subset of tags carried by GIMI image items is interpreted
 * (time stamp, mission id, image corners, version and checksum); any other
 * tag is skipped.
 */

#ifndef gimirrai_klv_hpp_included_
#define gimirrai_klv_hpp_included_

#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include <utility>

#include <boost/optional.hpp>

#include "math/geometry_core.hpp"

namespace gimirrai {

namespace klv {

/** Universal key of the ST0601 local set.
 */
extern const std::array<std::uint8_t, 16> St0601Key;

/** HEIF item URI type of ST0601 metadata items.
 */
extern const char *St0601UriType;

/** HEIF item URI type of GIMI content id items.
 */
extern const char *ContentIdUriType;

/** Maximum number of items read from one local set.
 */
extern const unsigned int MaxIterations;

enum Tag : unsigned int {
    checksum = 1
    , precisionTimeStamp = 2
    , missionId = 3
    , version = 65
    , cornerLatitudePoint1 = 82
    , cornerLongitudePoint1 = 83
    , cornerLatitudePoint2 = 84
    , cornerLongitudePoint2 = 85
    , cornerLatitudePoint3 = 86
    , cornerLongitudePoint3 = 87
    , cornerLatitudePoint4 = 88
    , cornerLongitudePoint4 = 89
};

/** Name under which the tag's value is reported, nullptr for unknown tags.
 */
const char* tagName(unsigned int tag);

/** ST0601 sections 8.82 and 8.83.
 */
double decodeLatitude(std::int32_t value);
double decodeLongitude(std::int32_t value);

/** Microseconds since 1970-01-01T00:00:00Z to ISO-8601 text. Returns none
 *  for values beyond year 9999.
 */
boost::optional<std::string> decodeTimestamp(std::uint64_t value);

/** ST0601 16-bit running checksum.
 */
std::uint16_t computeChecksum(const std::uint8_t *data, std::size_t size);

} // namespace klv

/** Decoded ST0601 local set.
 */
struct Klv {
    typedef std::pair<std::string, std::string> Item;
    typedef std::vector<Item> Items;

    boost::optional<std::string> title;
    boost::optional<std::string> beginPosition;
    boost::optional<unsigned int> version;
    boost::optional<std::uint16_t> checksum;

    /** Corner points 1 to 4: upper-left, upper-right, lower-right,
     *  lower-left.
     */
    std::array<boost::optional<double>, 4> cornerLatitude;
    std::array<boost::optional<double>, 4> cornerLongitude;

    /** Every decoded value as text, in stream order.
     */
    Items items;

    /** Local set has been terminated by the checksum item.
     */
    bool complete;

    Klv() : complete(false) {}

    bool empty() const { return items.empty(); }

    /** Corner point (lon, lat) by zero-based index.
     */
    boost::optional<math::Point2> corner(int index) const;

    boost::optional<math::Point2> upperLeft() const { return corner(0); }
    boost::optional<math::Point2> lowerRight() const { return corner(2); }

    /** Returns all four corners, only if all of them are known.
     */
    boost::optional<std::array<math::Point2, 4> > corners() const;

    /** Value of given item, if any.
     */
    boost::optional<std::string> item(const std::string &name) const;
};

/** Decodes local set from raw data. Data may start either with the
 *  universal key or directly with the first item.
 *
 * Throws std::runtime_error on truncated data.
 */
Klv decodeKlv(const std::uint8_t *data, std::size_t size);

template <typename Container>
Klv decodeKlv(const Container &data)
{
    return decodeKlv(reinterpret_cast<const std::uint8_t*>(data.data())
                     , data.size());
}

} // namespace gimirrai

#endif // gimirrai_klv_hpp_included_
