//
// Neighbors.cc
//
// Copyright 2014-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "Geohash.hh"
#include "Error.hh"
#include "Logging.hh"

namespace geocore::geohash {

    using namespace std;

    const char* nameOfDirection(direction dir) noexcept {
        static const char* const kNames[kNumDirections] = {"North", "NorthEast", "East", "SouthEast",
                                                           "South", "SouthWest", "West", "NorthWest"};
        if ( dir < 0 || dir >= kNumDirections ) return "?";
        return kNames[dir];
    }


#pragma mark - ONE-CELL STEPS:

    // Each step moves the center of `h`'s cell one cell-width along one axis, then re-encodes
    // it at the same length. Stepping past a pole reflects the latitude without changing the
    // longitude; stepping past the antimeridian wraps the longitude around.

    static hash north(const hash& h) {
        area   box     = h.boundingBox();
        double latDiff = box.latitude.size();
        double lat     = box.latitude.max + latDiff / 2;
        double lon     = box.longitude.mid();
        if ( lat > 90 ) {
            lat = (90 - (lat - 90)) * -1;
            LogVerbose(GeohashLog, "North of %s crosses the pole; continuing at latitude %g", h.string, lat);
        }
        return {coord(lat, lon), unsigned(h.length())};
    }

    static hash south(const hash& h) {
        area   box     = h.boundingBox();
        double latDiff = box.latitude.size();
        double lat     = box.latitude.min - latDiff / 2;
        double lon     = box.longitude.mid();
        if ( lat < -90 ) {
            lat = (-90 + (-90 - lat)) * -1;
            LogVerbose(GeohashLog, "South of %s crosses the pole; continuing at latitude %g", h.string, lat);
        }
        return {coord(lat, lon), unsigned(h.length())};
    }

    static hash east(const hash& h) {
        area   box     = h.boundingBox();
        double lonDiff = box.longitude.size();
        double lat     = box.latitude.mid();
        double lon     = box.longitude.max + lonDiff / 2;
        if ( lon > 180 ) {
            lon = -180 + (lon - 180);
            LogVerbose(GeohashLog, "East of %s crosses the antimeridian; continuing at longitude %g", h.string, lon);
        }
        if ( lon < -180 ) lon = -180;
        return {coord(lat, lon), unsigned(h.length())};
    }

    static hash west(const hash& h) {
        area   box     = h.boundingBox();
        double lonDiff = box.longitude.size();
        double lat     = box.latitude.mid();
        double lon     = box.longitude.min - lonDiff / 2;
        if ( lon < -180 ) {
            lon = 180 - (lon + 180);
            LogVerbose(GeohashLog, "West of %s crosses the antimeridian; continuing at longitude %g", h.string, lon);
        }
        if ( lon > 180 ) lon = 180;
        return {coord(lat, lon), unsigned(h.length())};
    }


#pragma mark - HASH:

    // Diagonals step north or south first, then east or west from that cell.
    hash hash::adjacent(direction dir) const {
        switch ( dir ) {
            case NORTH:
                return north(*this);
            case NORTH_EAST:
                return east(north(*this));
            case EAST:
                return east(*this);
            case SOUTH_EAST:
                return east(south(*this));
            case SOUTH:
                return south(*this);
            case SOUTH_WEST:
                return west(south(*this));
            case WEST:
                return west(*this);
            case NORTH_WEST:
                return west(north(*this));
            default:
                error::_throw(error::InvalidParameter, "invalid direction %d", int(dir));
        }
    }

    neighborSet hash::neighbors() const {
        neighborSet result;
        result[NORTH]      = north(*this);
        result[NORTH_WEST] = west(result[NORTH]);
        result[NORTH_EAST] = east(result[NORTH]);
        result[EAST]       = east(*this);
        result[SOUTH]      = south(*this);
        result[SOUTH_WEST] = west(result[SOUTH]);
        result[SOUTH_EAST] = east(result[SOUTH]);
        result[WEST]       = west(*this);
        LogDebug(GeohashLog, "Neighbors of %s: N=%s NE=%s E=%s SE=%s S=%s SW=%s W=%s NW=%s", string,
                 result[NORTH].string, result[NORTH_EAST].string, result[EAST].string, result[SOUTH_EAST].string,
                 result[SOUTH].string, result[SOUTH_WEST].string, result[WEST].string, result[NORTH_WEST].string);
        return result;
    }

}  // namespace geocore::geohash
