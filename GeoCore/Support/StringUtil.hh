//
// StringUtil.hh
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
#include <cstdarg>
#include <string>
#include <string_view>

namespace geocore {

    /** vsprintf into a std::string. */
    std::string vformat(const char* fmt NONNULL, va_list) __printflike(1, 0);

    bool hasPrefix(std::string_view str, std::string_view prefix) noexcept;

    /** ASCII-only case-insensitive equality. */
    bool equalIgnoringCase(std::string_view a, std::string_view b) noexcept;

}  // namespace geocore

// Expands a fleece slice into the length and pointer that a "%.*s" format consumes.
#define SPLAT(S) (int)(S).size, (const char*)(S).buf
