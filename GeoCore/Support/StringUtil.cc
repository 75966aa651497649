//
// StringUtil.cc
//
// Copyright 2014-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "StringUtil.hh"
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <new>

namespace geocore {

    std::string vformat(const char* fmt, va_list args) {
        char* buf = nullptr;
        int   len = vasprintf(&buf, fmt, args);
        if ( len < 0 ) throw std::bad_alloc();
        std::string result(buf, size_t(len));
        free(buf);
        return result;
    }

    bool hasPrefix(std::string_view str, std::string_view prefix) noexcept {
        return str.substr(0, prefix.size()) == prefix;
    }

    bool equalIgnoringCase(std::string_view a, std::string_view b) noexcept {
        if ( a.size() != b.size() ) return false;
        for ( size_t i = 0; i < a.size(); ++i ) {
            if ( tolower((unsigned char)a[i]) != tolower((unsigned char)b[i]) ) return false;
        }
        return true;
    }

}  // namespace geocore
