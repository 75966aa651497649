//
// Error.cc
//
// Copyright 2014-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "Error.hh"
#include "Logging.hh"
#include "StringUtil.hh"
#include <cstdarg>

namespace geocore {

    bool error::sWarnOnError = false;

    __cold void error::_throw(GeoCoreError code, const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);
        std::string message = vformat(fmt, args);
        va_end(args);

        if ( sWarnOnError ) WarnError("Rejecting input (GeoCore error %d): %s", int(code), message.c_str());
        throw error(GeoCore, code, message);
    }

}  // namespace geocore
