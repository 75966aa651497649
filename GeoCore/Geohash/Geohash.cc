//
// Geohash.cc
//
// Copyright 2014-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

/* NOTE: Portions of this code derive from Lyo Kato's geohash.c:
   https://github.com/lyokato/objc-geohash/blob/master/Classes/ARC/cgeohash.m as of 3-Nov-2014
   That code comes with the following license:

The MIT License

Copyright (c) 2011 lyo.kato@gmail.com

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in
all copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
THE SOFTWARE.
*/

#include "Geohash.hh"
#include "Error.hh"
#include "Logging.hh"
#include "StringUtil.hh"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace geocore {
    LogDomain GeohashLog("Geohash", LogLevel::Warning);
}

namespace geocore::geohash {

    using namespace std;

    static const char BASE32_ENCODE_TABLE[33] = "0123456789bcdefghjkmnpqrstuvwxyz";

    // Bit masks for the 5 bits of a character, most significant first.
    static const uint8_t kBitMasks[5] = {16, 8, 4, 2, 1};

    static const double CELL_WIDTHS[hash::kMaxLength] = {
        45.0,
        11.25,
        1.40625,
        0.3515625,
        0.0439453125,
        0.010986328125,
        0.001373291015625,
        0.00034332275390625,
        4.291534423828125e-05,
        1.0728836059570312e-05,
        1.341104507446289e-06,
        3.3527612686157227e-07,
    };

    static const double CELL_HEIGHTS[hash::kMaxLength] = {
        45.0,
        5.625,
        1.40625,
        0.17578125,
        0.0439453125,
        0.0054931640625,
        0.001373291015625,
        0.000171661376953125,
        4.291534423828125e-05,
        5.364418029785156e-06,
        1.341104507446289e-06,
        1.6763806343078613e-07,
    };

    // Approximation (Earth isn't actually a sphere), in km
    static const double kEarthRadius = 6371.0;

    // Kilometers per degree of latitude, and per degree of longitude at the equator
    static const double kKmPerDegree = 2 * M_PI * kEarthRadius / 360.0;


    static inline double sqr(double d) { return d * d; }

    static inline double deg2rad(double deg) { return deg / 180.0 * M_PI; }

    // Returns the 5-bit value of a geohash character, or -1 if it's not in the alphabet.
    static inline int decodeChar(char c) {
        if ( c == '\0' ) return -1;
        const char* p = strchr(BASE32_ENCODE_TABLE, c);
        return p ? int(p - BASE32_ENCODE_TABLE) : -1;
    }


#pragma mark - COORD


    bool coord::isValid() const { return latitude >= -90 && latitude <= 90 && longitude >= -180 && longitude <= 180; }

    double coord::distanceTo(coord c) const {
        // See http://en.wikipedia.org/wiki/Great-circle_distance
        double lat1 = deg2rad(latitude), lat2 = deg2rad(c.latitude);
        double dLon = deg2rad(c.longitude - longitude);

        double angle = atan2(sqrt(sqr(cos(lat2) * sin(dLon)) + sqr(cos(lat1) * sin(lat2) - sin(lat1) * cos(lat2) * cos(dLon))),
                             sin(lat1) * sin(lat2) + cos(lat1) * cos(lat2) * cos(dLon));
        return kEarthRadius * angle;
    }

    hash coord::encodeWithKmAccuracy(double accuracyInKm) const {
        if ( !(accuracyInKm > 0) ) error::_throw(error::InvalidParameter, "accuracy must be positive");

        // Rough approximation: start with nChars that gives small enough cell height
        double   minDegreeHeight = 2 * accuracyInKm / kKmPerDegree;
        unsigned nChars;
        for ( nChars = 1; nChars < hash::kMaxLength; nChars++ ) {
            if ( CELL_HEIGHTS[nChars - 1] <= minDegreeHeight ) break;
        }

        // Now encode with more and more characters until the encoded area's center is close enough:
        hash h;
        for ( ; nChars <= hash::kMaxLength; nChars++ ) {
            h               = encode(nChars);
            double distance = distanceTo(h.decode());
            if ( distance <= accuracyInKm ) break;
        }
        LogVerbose(GeohashLog, "Accuracy %g km at (%g, %g) needs %zu chars: %s", accuracyInKm, latitude, longitude,
                   h.length(), h.string);
        return h;
    }


#pragma mark - RANGE:


    void range::normalize() {
        if ( max < min ) std::swap(max, min);
    }

    void range::shrink(bool side) {
        double m = mid();
        if ( side ) {
            min = m;
        } else {
            max = m;
        }
    }

    // A value exactly at the midpoint goes into the lower half.
    bool range::shrink(double value) {
        bool side = value > mid();
        shrink(side);
        return side;
    }


#pragma mark - AREA:


    area::area(coord c1, coord c2) : latitude(c1.latitude, c2.latitude), longitude(c1.longitude, c2.longitude) {}

    std::string area::dump() const {
        std::stringstream out;
        out << *this;
        return out.str();
    }


#pragma mark - HASH:


    hash::hash(fleece::slice bytes) {
        if ( bytes.size > kMaxLength )
            error::_throw(error::InvalidParameter, "geohash length > %zu: \"%.*s\"", kMaxLength, SPLAT(bytes));
        if ( bytes.size > 0 ) memcpy(string, bytes.buf, bytes.size);
        string[bytes.size] = '\0';
    }

    hash::hash(const char* str) : hash(str ? fleece::slice(str) : fleece::slice()) {}

    bool hash::isValid() const {
        const char* p = &string[0];
        if ( !*p ) return false;  // empty
        for ( ; *p; ++p ) {
            if ( decodeChar(*p) < 0 ) return false;
        }
        return true;
    }

    void hash::checkValid() const {
        if ( isEmpty() ) error::_throw(error::InvalidParameter, "geohash is empty");
        for ( const char* p = &string[0]; *p; ++p ) {
            if ( decodeChar(*p) < 0 )
                error::_throw(error::InvalidParameter, "invalid character '%c' in geohash \"%s\"", *p, string);
        }
    }

    static inline void refineRange(range& r, int bits, int offset) { r.shrink((bits & kBitMasks[offset]) != 0); }

    area hash::boundingBox() const {
        checkValid();
        area   result(range(-90, 90), range(-180, 180));
        range* range1 = &result.longitude;
        range* range2 = &result.latitude;

        for ( const char* p = &string[0]; *p; ++p ) {
            int bits = decodeChar(*p);
            refineRange(*range1, bits, 0);
            refineRange(*range2, bits, 1);
            refineRange(*range1, bits, 2);
            refineRange(*range2, bits, 3);
            refineRange(*range1, bits, 4);

            // Each char holds an odd number of bits, so the next one starts on the other axis.
            std::swap(range1, range2);
        }
        return result;
    }

    static inline void setBit(uint8_t& bits, range& r, double value, int offset) {
        if ( r.shrink(value) ) bits |= kBitMasks[offset];
    }

    hash::hash(coord c, unsigned len) {
        if ( !(c.latitude >= -90.0 && c.latitude <= 90.0) )
            error::_throw(error::InvalidParameter, "Latitude %g is outside valid range of [-90,90]", c.latitude);
        if ( !(c.longitude >= -180.0 && c.longitude <= 180.0) )
            error::_throw(error::InvalidParameter, "Longitude %g is outside valid range of [-180,180]", c.longitude);
        if ( len < 1 || len > kMaxLength )
            error::_throw(error::InvalidParameter, "precision must be between 1 and %zu", kMaxLength);

        range  lat_range(-90, 90);
        range  lon_range(-180, 180);
        range* range1 = &lon_range;
        range* range2 = &lat_range;
        double val1   = c.longitude;
        double val2   = c.latitude;

        for ( unsigned i = 0; i < len; i++ ) {
            uint8_t bits = 0;
            setBit(bits, *range1, val1, 0);
            setBit(bits, *range2, val2, 1);
            setBit(bits, *range1, val1, 2);
            setBit(bits, *range2, val2, 3);
            setBit(bits, *range1, val1, 4);
            string[i] = BASE32_ENCODE_TABLE[bits];

            std::swap(val1, val2);
            std::swap(range1, range2);
        }

        string[len] = '\0';
    }

    /*static*/ unsigned hash::nCharsForDegreesAccuracy(double accuracy) {
        unsigned nChars;
        for ( nChars = 1; nChars < hash::kMaxLength; nChars++ ) {
            if ( CELL_HEIGHTS[nChars - 1] <= accuracy && CELL_WIDTHS[nChars - 1] <= accuracy ) break;
        }
        return nChars;
    }

    /*static*/ double hash::cellHeight(unsigned nChars) {
        if ( nChars < 1 || nChars > kMaxLength )
            error::_throw(error::InvalidParameter, "precision must be between 1 and %zu", kMaxLength);
        return CELL_HEIGHTS[nChars - 1];
    }

    /*static*/ double hash::cellWidth(unsigned nChars) {
        if ( nChars < 1 || nChars > kMaxLength )
            error::_throw(error::InvalidParameter, "precision must be between 1 and %zu", kMaxLength);
        return CELL_WIDTHS[nChars - 1];
    }

    hash hash::parent() const {
        checkValid();
        hash result = *this;
        result.string[length() - 1] = '\0';
        return result;
    }

    std::vector<hash> hash::children() const {
        checkValid();
        size_t len = length();
        if ( len >= kMaxLength ) error::_throw(error::InvalidParameter, "geohash length must be < %zu", kMaxLength);

        std::vector<hash> result(32, *this);
        for ( unsigned i = 0; i < 32; ++i ) {
            result[i].string[len]     = BASE32_ENCODE_TABLE[i];
            result[i].string[len + 1] = '\0';
        }
        return result;
    }

    bool hash::contains(const hash& h) const {
        return isValid() && h.isValid() && hasPrefix(h.string, string);
    }


#pragma mark - UTILITIES:


    std::ostream& operator<<(std::ostream& out, const hash& h) { return out << '"' << h.string << '"'; }

    std::ostream& operator<<(std::ostream& out, const coord& c) {
        return out << "(" << c.latitude << ", " << c.longitude << ")";
    }

    std::ostream& operator<<(std::ostream& out, const area& a) { return out << a.min() << "..." << a.max(); }

}  // namespace geocore::geohash
