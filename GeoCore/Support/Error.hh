//
// Error.hh
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

#include "fleece/PlatformCompat.hh"
#include <stdexcept>
#include <string>

namespace geocore {

    /** The exception GeoCore throws when it's handed a coordinate, precision, geohash or
        direction it can't work with. `what()` describes the offending value. */
    struct error : public std::runtime_error {
        enum Domain {
            GeoCore = 1,
        };

        enum GeoCoreError {
            InvalidParameter = 1,
        };

        Domain const domain;
        int const    code;

        error(Domain d, int c, const std::string& message) : std::runtime_error(message), domain(d), code(c) {}

        /** Throws an error in the GeoCore domain with a printf-style message. */
        [[noreturn]] static void _throw(GeoCoreError, const char* fmt, ...) __printflike(2, 3);

        /** If true, every error is logged at Error level on the Default domain before it's thrown. */
        static bool sWarnOnError;
    };

}  // namespace geocore
