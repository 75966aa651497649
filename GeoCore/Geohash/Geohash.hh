//
// Geohash.hh
//
// Copyright 2014-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#pragma once
#include "Base.hh"
#include <array>
#include <cstring>
#include <iosfwd>
#include <string>
#include <vector>

namespace geocore::geohash {

    struct hash;
    struct neighborSet;  // defined after hash

    /** A 2D geographic coordinate: (latitude, longitude). */
    struct coord {
        double latitude;
        double longitude;

        coord() : latitude(0), longitude(0) {}

        coord(double lat, double lon) : latitude(lat), longitude(lon) {}

        /** True if latitude is in [-90, 90] and longitude in [-180, 180]. */
        bool   isValid() const;
        double distanceTo(coord) const; /**< Distance in km between two coords */

        /** Compute GeoHash of given length, containing this point */
        inline hash encode(unsigned nChars) const;
        inline hash encode() const;

        /** Compute the shortest GeoHash whose center is within a given distance of this point. */
        hash encodeWithKmAccuracy(double kmAccuracy) const;

        bool operator==(const coord& c) const { return latitude == c.latitude && longitude == c.longitude; }
    };

    /** A range of a single coordinate. */
    struct range {
        double min;
        double max;

        range() : min(0), max(0) {}

        range(double _min, double _max) : min(_min), max(_max) {}

        bool isValid() const { return max > min; }

        void normalize(); /**< Swaps min/max if they're in wrong order */

        bool        contains(double n) const { return min <= n && n < max; }
        inline bool intersects(range) const;

        bool isEmpty() const { return min == max; }

        double size() const { return max - min; }

        double mid() const { return (min + max) / 2.0; }

        // internal:
        bool shrink(double);
        void shrink(bool side);
    };

    /** A 2D rectangular area, defined by ranges of latitude and longitude. */
    struct area {
        range latitude;
        range longitude;

        area() = default;

        area(range lat, range lon) : latitude(lat), longitude(lon) {}

        area(coord c1, coord c2);

        bool isValid() const { return latitude.isValid() && longitude.isValid(); }

        void normalize() {
            latitude.normalize();
            longitude.normalize();
        }

        inline bool contains(coord) const;
        inline bool intersects(area) const;

        bool isPoint() const { return latitude.isEmpty() && longitude.isEmpty(); }

        coord min() const { return {latitude.min, longitude.min}; }

        coord mid() const { return {latitude.mid(), longitude.mid()}; }

        coord max() const { return {latitude.max, longitude.max}; }

        std::string dump() const;
    };

    /** The eight compass directions a neighboring cell can lie in. */
    enum direction { NORTH = 0, NORTH_EAST, EAST, SOUTH_EAST, SOUTH, SOUTH_WEST, WEST, NORTH_WEST, kNumDirections };

    const char* nameOfDirection(direction) noexcept;

    /** A GeoHash string, 0 to 12 characters long.
        An empty hash is a legal value (e.g. the parent of a 1-character hash), but every
        operation that interprets a hash throws `error::InvalidParameter` unless it is valid:
        1 to 12 characters, all from the geohash base-32 alphabet. */
    struct hash {
        static constexpr size_t   kMaxLength     = 12;
        static constexpr unsigned kDefaultLength = 6;

        char string[kMaxLength + 1];

        hash() { (string)[0] = '\0'; }

        /** Copies a geohash string. Throws InvalidParameter if it's longer than kMaxLength;
            the characters aren't checked until the hash is used. */
        explicit hash(fleece::slice);
        explicit hash(const char* str);

        /** Geohash of the given coord. Throws InvalidParameter if the coord is out of range or
            `nChars` isn't in [1, kMaxLength]. */
        hash(coord, unsigned nChars);

        /** Returns the length of GeoHash string needed to get a specific accuracy
            measured in degrees. */
        static unsigned nCharsForDegreesAccuracy(double accuracy);

        /** Height and width, in degrees, of the cells of a given hash length. */
        static double cellHeight(unsigned nChars);
        static double cellWidth(unsigned nChars);

        operator const char*() const { return string; }

        fleece::slice asSlice() const { return {string, length()}; }

        std::string asString() const { return {string, length()}; }

        size_t length() const { return strlen(string); }

        bool isEmpty() const { return string[0] == '\0'; }

        bool isValid() const;

        /** The rectangle this hash denotes. */
        area boundingBox() const;

        /** The center point of the hash's bounding box. */
        coord decode() const { return boundingBox().mid(); }

        /** The hash minus its last character. */
        hash parent() const;

        /** The 32 hashes one character longer than this one, in alphabet order. Together they
            tile this hash's area. Throws if this hash is already kMaxLength long. */
        std::vector<hash> children() const;

        /** True if `h`'s area lies within this one's, i.e. this hash is a prefix of `h`. */
        bool contains(const hash& h) const;

        /** The hash of the same length adjacent to this one in the given direction.
            (Implemented in Neighbors.cc.) */
        hash adjacent(direction) const;

        /** All eight adjacent hashes. (Implemented in Neighbors.cc.) */
        neighborSet neighbors() const;

        bool operator<(const hash& h) const { return strcmp(string, h.string) < 0; }

        bool operator==(const hash& h) const { return strcmp(string, h.string) == 0; }

        bool operator!=(const hash& h) const { return !(*this == h); }

      private:
        void checkValid() const;
    };

    /** The eight hashes surrounding a geohash, indexed by direction. */
    struct neighborSet {
        std::array<hash, kNumDirections> cells;

        const hash& operator[](direction d) const { return cells[d]; }

        hash& operator[](direction d) { return cells[d]; }

        auto begin() const { return cells.begin(); }

        auto end() const { return cells.end(); }
    };

    std::ostream& operator<<(std::ostream&, const hash&);
    std::ostream& operator<<(std::ostream&, const coord&);
    std::ostream& operator<<(std::ostream&, const area&);

    // Inline method bodies:

    inline bool range::intersects(range r) const { return max > r.min && r.max > min; }

    inline hash coord::encode(unsigned nChars) const { return {*this, nChars}; }

    inline hash coord::encode() const { return {*this, hash::kDefaultLength}; }

    inline bool area::contains(coord c) const {
        return latitude.contains(c.latitude) && longitude.contains(c.longitude);
    }

    inline bool area::intersects(area a) const {
        return latitude.intersects(a.latitude) && longitude.intersects(a.longitude);
    }

}  // namespace geocore::geohash
