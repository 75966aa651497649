//
// Logging.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "Logging.hh"
#include "StringUtil.hh"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>
#include <string>

namespace geocore {

    LogDomain* LogDomain::sFirstDomain = nullptr;

    // sMutex guards the callback settings and every domain's _effectiveLevel.
    static std::mutex            sMutex;
    static LogDomain::Callback_t sCallback      = &LogDomain::defaultCallback;
    static bool                  sPreformatted  = false;
    static LogLevel              sCallbackLevel = LogLevel::Uninitialized;
    static std::atomic<unsigned> sWarnings{0};

    // Values accepted in GeoCoreLog<Domain> variables, indexed by LogLevel.
    static const char* const kEnvLevelNames[] = {"debug", "verbose", "info", "warning", "error", "none"};

    // Labels printed by the default callback, indexed by LogLevel.
    static const char* const kLevelLabels[] = {"Debug", "Verbose", "Info", "WARNING", "ERROR"};

    // An environment setting can only make logging more verbose.
    static LogLevel applyOverride(LogLevel requested, LogLevel fromEnv) {
        return fromEnv == LogLevel::Uninitialized ? requested : std::min(requested, fromEnv);
    }


    LogDomain::LogDomain(const char* name, LogLevel level) : _level(level), _name(name), _next(sFirstDomain) {
        sFirstDomain = this;
    }

    LogLevel LogDomain::environmentLevel() const noexcept {
        const char* value = getenv((std::string("GeoCoreLog") + _name).c_str());
        if ( !value ) return LogLevel::Uninitialized;
        for ( int i = 0; i <= int(LogLevel::None); ++i ) {
            if ( equalIgnoringCase(value, kEnvLevelNames[i]) ) return LogLevel(i);
        }
        return LogLevel::Info;
    }


#pragma mark - LEVELS:


    void LogDomain::setLevel(LogLevel level) noexcept {
        std::lock_guard<std::mutex> lock(sMutex);
        _level          = applyOverride(level, environmentLevel());
        _effectiveLevel = std::max(LogLevel(_level), callbackLevelLocked());
    }

    LogLevel LogDomain::computeLevel() noexcept {
        if ( _effectiveLevel == LogLevel::Uninitialized ) setLevel(_level);
        return _effectiveLevel;
    }

    LogLevel LogDomain::level() const noexcept {
        const_cast<LogDomain*>(this)->computeLevel();
        return _level;
    }

    LogLevel LogDomain::callbackLevelLocked() noexcept {
        if ( !sCallback ) return LogLevel::None;
        if ( sCallbackLevel == LogLevel::Uninitialized )
            sCallbackLevel = applyOverride(LogLevel::Info, kGeoCore_DefaultLog.environmentLevel());
        return sCallbackLevel;
    }

    void LogDomain::resetEffectiveLevelsLocked() noexcept {
        for ( LogDomain* d = sFirstDomain; d; d = d->_next ) d->_effectiveLevel = LogLevel::Uninitialized;
    }

    LogLevel LogDomain::callbackLogLevel() noexcept {
        std::lock_guard<std::mutex> lock(sMutex);
        return callbackLevelLocked();
    }

    void LogDomain::setCallbackLogLevel(LogLevel level) noexcept {
        std::lock_guard<std::mutex> lock(sMutex);
        sCallbackLevel = applyOverride(level, kGeoCore_DefaultLog.environmentLevel());
        resetEffectiveLevelsLocked();
    }


#pragma mark - CALLBACK:


    LogDomain::Callback_t LogDomain::currentCallback() {
        std::lock_guard<std::mutex> lock(sMutex);
        return sCallback;
    }

    void LogDomain::setCallback(Callback_t callback, bool preformatted) {
        std::lock_guard<std::mutex> lock(sMutex);
        sCallback     = callback;
        sPreformatted = preformatted;
        resetEffectiveLevelsLocked();
    }

    unsigned LogDomain::warningCount() noexcept { return sWarnings; }

    void LogDomain::defaultCallback(const LogDomain& domain, LogLevel level, const char* fmt, va_list args) {
        using namespace std::chrono;
        auto      now    = system_clock::now();
        time_t    secs   = system_clock::to_time_t(now);
        long      millis = long(duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000);
        struct tm local {};
        localtime_r(&secs, &local);
        char timeStr[16];
        strftime(timeStr, sizeof(timeStr), "%H:%M:%S", &local);

        fprintf(stderr, "%s.%03ld| [%s] %s: ", timeStr, millis, domain.name(), kLevelLabels[int(level)]);
        vfprintf(stderr, fmt, args);
        fputc('\n', stderr);
    }


#pragma mark - LOGGING:


    void LogDomain::log(LogLevel level, const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);
        vlog(level, fmt, args);
        va_end(args);
    }

    void LogDomain::vlog(LogLevel level, const char* fmt, va_list args) {
        if ( level < computeLevel() ) return;
        if ( level == LogLevel::Warning ) ++sWarnings;

        std::lock_guard<std::mutex> lock(sMutex);
        if ( !sCallback ) return;
        if ( sPreformatted ) {
            std::string message = vformat(fmt, args);
            va_list     none{};
            sCallback(*this, level, message.c_str(), none);
        } else {
            sCallback(*this, level, fmt, args);
        }
    }

}  // namespace geocore
