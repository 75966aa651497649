//
// GeoHashTest.cc
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
#include "GeoCoreTest.hh"
#include "StringUtil.hh"
#include <cmath>
#include <set>
#include <sstream>

using namespace geocore::geohash;
using std::make_pair;
using std::pair;
using std::set;
using std::string;
using std::stringstream;


static void verify_hash(double lat, double lon, unsigned len, const char* expected) {
    hash result(coord(lat, lon), len);
    REQUIRE(string(result.string) == string(expected));
    REQUIRE(result.length() == len);
}

TEST_CASE("Geohash Encode", "[geohash]") {
    verify_hash(45.37, -121.7, 6, "c216ne");
    verify_hash(47.6062095, -122.3320708, 12, "c23nb62w20st");
    verify_hash(35.6894875, 139.6917064, 12, "xn774c06kdtv");
    verify_hash(-33.8671390, 151.2071140, 12, "r3gx2f9tt5sn");
    verify_hash(51.5001524, -0.1262362, 12, "gcpuvpk44kpr");
    verify_hash(52.517395, 13.408813, 11, "u33dc07zzzz");
    CHECK(hasPrefix(coord(52.517395, 13.408813).encode(11).string, "u33dc0"));
}

TEST_CASE("Geohash Encode Default Length", "[geohash]") {
    hash h = coord(52.5174, 13.409).encode();
    CHECK(h.asString() == "u33dc0");
    CHECK(h.length() == hash::kDefaultLength);
    CHECK(coord(52.5174, 13.409).encode(6) == h);
}

TEST_CASE("Geohash Encode Extremes", "[geohash]") {
    verify_hash(90, 180, 6, "zzzzzz");
    verify_hash(-90, -180, 6, "000000");
    // A value exactly on a midpoint falls into the lower half:
    verify_hash(0, 0, 1, "7");
    verify_hash(0, 0, 4, "7zzz");
}

TEST_CASE("Geohash Encode Out Of Range", "[geohash]") {
    ExpectException(error::GeoCore, error::InvalidParameter,
                    "Latitude 152.517 is outside valid range of [-90,90]",
                    [] { hash(coord(152.517395, 13.408813), 12); });
    ExpectException(error::GeoCore, error::InvalidParameter,
                    "Longitude 183.409 is outside valid range of [-180,180]",
                    [] { hash(coord(52.517395, 183.408813), 12); });
    ExpectException(error::GeoCore, error::InvalidParameter, "precision must be between 1 and 12",
                    [] { coord(52.5174, 13.409).encode(0); });
    ExpectException(error::GeoCore, error::InvalidParameter, "precision must be between 1 and 12",
                    [] { coord(52.5174, 13.409).encode(13); });
    ExpectException(error::GeoCore, error::InvalidParameter, [] { hash(coord(NAN, 13.4), 6); });
    ExpectException(error::GeoCore, error::InvalidParameter, [] { hash(coord(52.5, NAN), 6); });
    CHECK_FALSE(coord(NAN, 0).isValid());
    CHECK_FALSE(coord(90.5, 0).isValid());
    CHECK_FALSE(coord(0, -180.5).isValid());
    CHECK(coord(-90, 180).isValid());
}


static void verify_area(const char* str, double lat_min, double lon_min, double lat_max, double lon_max) {
    area box = hash(str).boundingBox();
    REQUIRE(box.latitude.max == Approx(lat_max));
    REQUIRE(box.latitude.min == Approx(lat_min));
    REQUIRE(box.longitude.max == Approx(lon_max));
    REQUIRE(box.longitude.min == Approx(lon_min));
}

TEST_CASE("Geohash Bounding Box", "[geohash]") {
    verify_area("c216ne", 45.3680419921875, -121.70654296875, 45.37353515625, -121.695556640625);
    verify_area("dqcw4", 39.0234375, -76.552734375, 39.0673828125, -76.5087890625);
    verify_area("u", 45, 0, 90, 45);
    verify_area("0", -90, -180, -45, -135);
}

TEST_CASE("Geohash Decode", "[geohash]") {
    coord c = hash("u33dc07zzzzx").decode();
    CHECK(c.latitude == Approx(52.51739494).margin(1e-8));
    CHECK(c.longitude == Approx(13.40881297).margin(1e-8));

    c = hash("u33dc0").decode();
    CHECK(std::round(c.latitude * 1e4) / 1e4 == Approx(52.5174));
    CHECK(std::round(c.longitude * 1e3) / 1e3 == Approx(13.409));

    // The decoded point lies in the cell and encodes back to the same hash:
    hash h("c216ne");
    CHECK(h.boundingBox().contains(h.decode()));
    CHECK(h.decode().encode(6) == h);
}


TEST_CASE("Geohash Verification", "[geohash]") {
    CHECK(hash("dqcw5").isValid());
    CHECK(hash("dqcw7").isValid());
    CHECK(hash("bcdefghjkmnp").isValid());
    CHECK_FALSE(hash("abcwd").isValid());
    CHECK_FALSE(hash("dqcw5@").isValid());
    CHECK_FALSE(hash("DQCW4").isValid());
    CHECK_FALSE(hash("C216Ne").isValid());
    CHECK_FALSE(hash().isValid());
    CHECK_FALSE(hash((const char*)nullptr).isValid());
}

TEST_CASE("Geohash Invalid Input", "[geohash]") {
    ExpectException(error::GeoCore, error::InvalidParameter, "invalid character 'a' in geohash \"abcwd\"",
                    [] { hash("abcwd").boundingBox(); });
    ExpectException(error::GeoCore, error::InvalidParameter, "invalid character '@' in geohash \"dqcw5@\"",
                    [] { hash("dqcw5@").decode(); });
    ExpectException(error::GeoCore, error::InvalidParameter, "invalid character 'D' in geohash \"DQCW4\"",
                    [] { hash("DQCW4").neighbors(); });
    ExpectException(error::GeoCore, error::InvalidParameter, "geohash is empty", [] { hash().boundingBox(); });
    ExpectException(error::GeoCore, error::InvalidParameter, "geohash is empty",
                    [] { hash((const char*)nullptr).children(); });
    ExpectException(error::GeoCore, error::InvalidParameter, [] { hash("c23nb62w20sth"); });
    ExpectException(error::GeoCore, error::InvalidParameter, [] { hash(fleece::slice("u33dc07zzzzxy")); });

    hash full(fleece::slice("u33dc07zzzzx"));
    CHECK(full.length() == hash::kMaxLength);
}


TEST_CASE("Geohash Children", "[geohash]") {
    hash parent("u33dc");
    auto kids = parent.children();
    REQUIRE(kids.size() == 32);
    const char* alphabet = "0123456789bcdefghjkmnpqrstuvwxyz";
    area        box      = parent.boundingBox();
    for ( unsigned i = 0; i < 32; ++i ) {
        INFO("child " << kids[i]);
        CHECK(kids[i].length() == 6);
        CHECK(kids[i].string[5] == alphabet[i]);
        CHECK(kids[i].parent() == parent);
        CHECK(parent.contains(kids[i]));
        area kidBox = kids[i].boundingBox();
        CHECK(kidBox.latitude.min >= box.latitude.min);
        CHECK(kidBox.latitude.max <= box.latitude.max);
        CHECK(kidBox.longitude.min >= box.longitude.min);
        CHECK(kidBox.longitude.max <= box.longitude.max);
    }
    CHECK(kids[0].asString() == "u33dc0");
    CHECK(kids[31].asString() == "u33dcz");

    CHECK(hash("u").children().size() == 32);

    ExpectException(error::GeoCore, error::InvalidParameter, "geohash length must be < 12",
                    [] { hash("u33dc07zzzzx").children(); });
}

// Counts the distinct latitude and longitude bands among a hash's children.
static pair<size_t, size_t> childGrid(const char* str) {
    set<double> lats, lons;
    for ( auto& kid : hash(str).children() ) {
        area box = kid.boundingBox();
        lats.insert(box.latitude.min);
        lons.insert(box.longitude.min);
    }
    return {lats.size(), lons.size()};
}

TEST_CASE("Geohash Children Grid", "[geohash]") {
    // The extra character splits an odd-length parent 8 ways by latitude and 4 by longitude,
    // and an even-length parent the other way around.
    CHECK(childGrid("u") == make_pair(size_t(8), size_t(4)));
    CHECK(childGrid("u3") == make_pair(size_t(4), size_t(8)));
    CHECK(childGrid("u33dc") == make_pair(size_t(8), size_t(4)));
    CHECK(childGrid("u33dc0") == make_pair(size_t(4), size_t(8)));
}


TEST_CASE("Geohash Parent", "[geohash]") {
    CHECK(hash("u33dbc").parent().asString() == "u33db");
    CHECK(hash("u33dbc").parent().parent().asString() == "u33d");
    CHECK(hash("u").parent().isEmpty());
    ExpectException(error::GeoCore, error::InvalidParameter, "geohash is empty", [] { hash().parent(); });
}

TEST_CASE("Geohash Contains", "[geohash]") {
    hash big("u33"), small("u33dc0");
    CHECK(big.contains(small));
    CHECK(big.contains(big));
    CHECK_FALSE(small.contains(big));
    CHECK_FALSE(hash("u34").contains(small));
    CHECK_FALSE(hash().contains(small));
    CHECK_FALSE(big.contains(hash("u33@")));

    // A shorter prefix's box encloses the longer hash's box:
    area outer = big.boundingBox(), inner = small.boundingBox();
    CHECK(outer.contains(inner.min()));
    CHECK(outer.contains(inner.mid()));
    CHECK(outer.intersects(inner));
    CHECK_FALSE(hash("u34").boundingBox().intersects(inner));
}

TEST_CASE("Geohash Range And Area", "[geohash]") {
    range r(0, 10);
    CHECK(r.isValid());
    CHECK(r.contains(0));
    CHECK(r.contains(9.999));
    CHECK_FALSE(r.contains(10));
    CHECK(r.size() == 10);
    CHECK(r.mid() == 5);
    CHECK(r.intersects(range(9, 20)));
    CHECK_FALSE(r.intersects(range(10, 20)));

    range backwards(10, 0);
    CHECK_FALSE(backwards.isValid());
    backwards.normalize();
    CHECK(backwards.min == 0);
    CHECK(backwards.max == 10);

    area a(coord(10, 20), coord(-10, -20));
    CHECK_FALSE(a.isValid());
    a.normalize();
    CHECK(a.isValid());
    CHECK(a.min() == coord(-10, -20));
    CHECK(a.max() == coord(10, 20));
    CHECK(a.mid() == coord(0, 0));
    CHECK(a.contains(coord(0, 0)));
    CHECK_FALSE(a.contains(coord(10, 0)));
    CHECK_FALSE(a.isPoint());
    CHECK(area(coord(1, 2), coord(1, 2)).isPoint());
    CHECK(area(coord(1, 2), coord(3.5, 4)).dump() == "(1, 2)...(3.5, 4)");
}


TEST_CASE("Geohash DistanceTo", "[geohash]") {
    // See http://www.distance.to/New-York/San-Francisco
    static const double kMilesPerKm = 0.62137;
    const coord         sf(37.774929, -122.419418);
    const coord         nyc(40.714268, -74.005974);
    CHECK(sf.distanceTo(nyc) == Approx(2566 / kMilesPerKm).epsilon(0.01));
    CHECK(nyc.distanceTo(sf) == Approx(sf.distanceTo(nyc)));
    CHECK(sf.distanceTo(sf) == Approx(0));
    CHECK(coord(0, 0).distanceTo(coord(0, 1)) == Approx(111.195).epsilon(0.001));
}

TEST_CASE("Geohash Km Accuracy", "[geohash]") {
    const coord sf(37.774929, -122.419418);
    const coord nyc(40.714268, -74.005974);
    CHECK(sf.encodeWithKmAccuracy(0.1).asString() == "9q8yyk8");
    CHECK(nyc.encodeWithKmAccuracy(0.01).asString() == "dr5regy3z");

    hash h = sf.encodeWithKmAccuracy(1.0);
    CHECK(sf.distanceTo(h.decode()) <= 1.0);
    CHECK(h.contains(sf.encode(12)));

    ExpectException(error::GeoCore, error::InvalidParameter, "accuracy must be positive",
                    [&] { sf.encodeWithKmAccuracy(0); });
    ExpectException(error::GeoCore, error::InvalidParameter, [&] { sf.encodeWithKmAccuracy(-5); });
}

TEST_CASE("Geohash Cell Sizes", "[geohash]") {
    CHECK(hash::cellHeight(1) == 45.0);
    CHECK(hash::cellWidth(1) == 45.0);
    CHECK(hash::cellHeight(6) == 0.0054931640625);
    CHECK(hash::cellWidth(6) == 0.010986328125);
    for ( unsigned len = 1; len <= hash::kMaxLength; ++len ) {
        INFO("length " << len);
        area box = coord(52.5174, 13.409).encode(len).boundingBox();
        CHECK(box.latitude.size() == Approx(hash::cellHeight(len)));
        CHECK(box.longitude.size() == Approx(hash::cellWidth(len)));
    }
    ExpectException(error::GeoCore, error::InvalidParameter, [] { hash::cellHeight(0); });
    ExpectException(error::GeoCore, error::InvalidParameter, [] { hash::cellWidth(13); });

    CHECK(hash::nCharsForDegreesAccuracy(1.0) == 4);
    CHECK(hash::nCharsForDegreesAccuracy(45.0) == 1);
    CHECK(hash::nCharsForDegreesAccuracy(1e-9) == hash::kMaxLength);
}

TEST_CASE("Geohash Formatting", "[geohash]") {
    hash h("u33");
    CHECK(h.asString() == "u33");
    CHECK((h.asSlice() == fleece::slice("u33")));
    CHECK(string((const char*)h) == "u33");
    CHECK(hash("u33") < hash("u34"));
    CHECK(hash("u33") != hash("u34"));

    stringstream out;
    out << h << " " << coord(1.5, -2);
    CHECK(out.str() == "\"u33\" (1.5, -2)");
}
