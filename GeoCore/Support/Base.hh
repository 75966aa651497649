//
// Base.hh
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#pragma once

#include "fleece/PlatformCompat.hh"
#include "fleece/slice.hh"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace geocore {
    using fleece::slice;

    using std::string;
    using std::string_view;

}  // namespace geocore
