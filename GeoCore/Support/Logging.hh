//
// Logging.hh
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
#include <atomic>
#include <cstdarg>
#include <cstdint>

/*
    GeoCore logs through named domains. A domain is a global object:
        LogDomain GeohashLog("Geohash", LogLevel::Warning);
    and messages are written with printf-style macros:
        LogVerbose(GeohashLog, "North of %s crosses the pole", h.string);
    Log() and Warn() write to the Default domain.

    A message is emitted only if its level is at least the domain's level and the callback's
    level. Setting the environment variable GeoCoreLog<Domain> (e.g. GeoCoreLogGeohash=verbose)
    lowers a domain's level; GeoCoreLogDefault lowers the callback's level as well.
    LogDebug() compiles to nothing unless DEBUG is defined.
*/

namespace geocore {

    enum class LogLevel : int8_t { Uninitialized = -1, Debug, Verbose, Info, Warning, Error, None };

    class LogDomain {
      public:
        explicit LogDomain(const char* name, LogLevel level = LogLevel::Info);

        const char* name() const { return _name; }

        void     setLevel(LogLevel) noexcept;
        LogLevel level() const noexcept;

        /** The lowest level that will actually reach the callback. */
        LogLevel effectiveLevel() noexcept { return computeLevel(); }

        bool willLog(LogLevel lv = LogLevel::Info) const { return _effectiveLevel <= lv; }

        void log(LogLevel, const char* fmt, ...) __printflike(3, 4);
        void vlog(LogLevel, const char* fmt, va_list) __printflike(3, 0);

        using Callback_t = void (*)(const LogDomain&, LogLevel, const char* format, va_list);

        /** Writes "time| [Domain] LEVEL: message" lines to stderr. */
        static void defaultCallback(const LogDomain&, LogLevel, const char* format, va_list) __printflike(3, 0);

        static Callback_t currentCallback();

        /** Replaces the callback; nullptr silences all logging. A `preformatted` callback gets the
            finished message as its format string, with no arguments to apply. */
        static void setCallback(Callback_t, bool preformatted);

        static LogLevel callbackLogLevel() noexcept;
        static void     setCallbackLogLevel(LogLevel) noexcept;

        /** Warnings emitted since launch. */
        static unsigned warningCount() noexcept;

      private:
        LogLevel        computeLevel() noexcept;
        LogLevel        environmentLevel() const noexcept;
        static LogLevel callbackLevelLocked() noexcept;
        static void     resetEffectiveLevelsLocked() noexcept;

        std::atomic<LogLevel> _effectiveLevel{LogLevel::Uninitialized};
        std::atomic<LogLevel> _level;
        const char* const     _name;
        LogDomain* const      _next;

        static LogDomain* sFirstDomain;
    };

    extern LogDomain kGeoCore_DefaultLog;
    extern LogDomain GeohashLog;


#define LogToAt(DOMAIN, LEVEL, FMT, ...)                                                                               \
    do {                                                                                                               \
        if ( _usuallyFalse((DOMAIN).willLog(geocore::LogLevel::LEVEL)) )                                               \
            (DOMAIN).log(geocore::LogLevel::LEVEL, FMT, ##__VA_ARGS__);                                                \
    } while ( 0 )

#define LogTo(DOMAIN, FMT, ...)      LogToAt(DOMAIN, Info, FMT, ##__VA_ARGS__)
#define LogVerbose(DOMAIN, FMT, ...) LogToAt(DOMAIN, Verbose, FMT, ##__VA_ARGS__)
#define LogWarn(DOMAIN, FMT, ...)    LogToAt(DOMAIN, Warning, FMT, ##__VA_ARGS__)
#define LogError(DOMAIN, FMT, ...)   LogToAt(DOMAIN, Error, FMT, ##__VA_ARGS__)

#define Log(FMT, ...)       LogToAt(geocore::kGeoCore_DefaultLog, Info, FMT, ##__VA_ARGS__)
#define Warn(FMT, ...)      LogToAt(geocore::kGeoCore_DefaultLog, Warning, FMT, ##__VA_ARGS__)
#define WarnError(FMT, ...) LogToAt(geocore::kGeoCore_DefaultLog, Error, FMT, ##__VA_ARGS__)

#ifdef DEBUG
#    define LogDebug(DOMAIN, FMT, ...) LogToAt(DOMAIN, Debug, FMT, ##__VA_ARGS__)
#else
#    define LogDebug(DOMAIN, FMT, ...)                                                                                 \
        do {                                                                                                           \
        } while ( 0 )
#endif

}  // namespace geocore
