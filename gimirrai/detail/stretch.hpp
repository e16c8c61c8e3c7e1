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
 * @file detail/stretch.hpp
 *
 * Linear stretch of non-byte raster values into 0-255.
 */

#ifndef gimirrai_detail_stretch_hpp_included_
#define gimirrai_detail_stretch_hpp_included_

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace gimirrai { namespace detail {

class Stretch {
public:
    /** Empty stretch, grows by update().
     */
    Stretch()
        : min_(std::numeric_limits<double>::max())
        , max_(std::numeric_limits<double>::lowest())
    {}

    Stretch(double min, double max) : min_(min), max_(max) {}

    bool empty() const { return max_ < min_; }

    double min() const { return min_; }
    double max() const { return max_; }

    /** Widens range to cover given one as well.
     */
    Stretch& update(const Stretch &other) {
        if (other.empty()) { return *this; }
        min_ = std::min(min_, other.min_);
        max_ = std::max(max_, other.max_);
        return *this;
    }

    std::uint8_t operator()(double value) const {
        if (max_ <= min_) { return 0; }
        const auto v((value - min_) * 255.0 / (max_ - min_));
        return std::uint8_t(std::max(0.0, std::min(255.0, std::round(v))));
    }

private:
    double min_;
    double max_;
};

} } // namespace gimirrai::detail

#endif // gimirrai_detail_stretch_hpp_included_
