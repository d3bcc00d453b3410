#pragma once
/**
 * Logging and error reporting interface, Copyright (c) 2024, RePath authors
 * Distributed under MIT Software License
 */
#include "config.h"
#include <stdexcept>
#include <string>
#include <type_traits>

#if __GNUG__
#  pragma GCC diagnostic ignored "-Wformat-extra-args"
#endif

namespace rpath
{
    enum LogSeverity
    {
        LogSeverityInfo,  // progress of an operation, eg a second truncation pass
        LogSeverityWarn,  // input was rejected or adjusted, the call still returns
        LogSeverityError, // a failure reported to the caller
    };

    /** Receives every log message that passes the severity filter */
    using LogMessageCallback = void (*)(LogSeverity severity, const char* message, int len);

    /**
     * @brief Handles a log message on behalf of `context`
     * @param len Length of the message, which is also NUL terminated
     */
    using LogMsgHandler = void (*)(void* context, LogSeverity severity, const char* message, int len);

    /**
     * @brief Sets the single callback handler for log messages.
     *        Pass nullptr to restore the default console output.
     */
    RPATHAPI void SetLogHandler(LogMessageCallback loghandler) noexcept;

    /**
     * @brief Messages below `filter` are dropped.
     *        Defaults to LogSeverityInfo, or LogSeverityWarn in QUIETLOG builds.
     */
    RPATHAPI void SetLogSeverityFilter(LogSeverity filter) noexcept;
    RPATHAPI LogSeverity GetLogSeverityFilter() noexcept;

    /**
     * @brief Adds a handler next to the one set by SetLogHandler().
     *        Adding the same context and handler twice has no effect.
     */
    RPATHAPI void add_log_handler(void* context, LogMsgHandler handler) noexcept;

    /** @brief Stops sending log messages to a matching handler */
    RPATHAPI void remove_log_handler(void* context, LogMsgHandler handler) noexcept;

    RPATHAPI void _LogInfo    (PRINTF_FMTSTR const char* format, ...) PRINTF_CHECKFMT1;
    RPATHAPI void _LogWarning (PRINTF_FMTSTR const char* format, ...) PRINTF_CHECKFMT1;
    RPATHAPI void _LogError   (PRINTF_FMTSTR const char* format, ...) PRINTF_CHECKFMT1;

    /** Formats into a thread local buffer, which is valid until the next call */
    RPATHAPI const char* _FmtString(PRINTF_FMTSTR const char* format, ...) PRINTF_CHECKFMT1;

    /** @returns The part of `path` after the last separator */
    constexpr inline const char* shorten_filename(const char* path) noexcept
    {
        if (path == nullptr) return "(null)";
        const char* filename = path;
        for (const char* p = path; *p; ++p)
            if (*p == '/' || *p == '\\')
                filename = p + 1;
        return filename;
    }

    template<>
    struct __wrap<const char*>
    { FINLINE static constexpr const char* w(const char* arg) noexcept { return arg; } };

    template<>
    struct __wrap<std::string>
    { FINLINE static const char* w(const std::string& arg) noexcept { return arg.c_str(); } };

    template<typename T>
    using __clean_type = typename std::remove_cv<typename std::remove_reference<T>::type>::type;
}

#ifndef QUIETLOG
#define __log_format(format, file, line, func) "%s:%d %s $ " format, rpath::shorten_filename(file), line, func
#else
#define __log_format(format, file, line, func) "$ " format
#endif

// _rpath_wrap_args(a, b) ==> , __wrap<A>::w(a), __wrap<B>::w(b)
// and expands to nothing for an empty argument list
#define _rpath_get_nth_wrap_arg(zero, _8,_7,_6,_5,  _4,_3,_2,_1,  N_0, ...) N_0
#define _rpath_wrap(x) x

#define _rpath_z
#define _rpath_c ,
#define _spaces_on_empty_token(...) ,,,, ,,,,
#define _get_nth_comma(_8,_7,_6,_5,  _4,_3,_2,_1,  N_0, ...) N_0
#define _va_comma2(...) _rpath_wrap(_get_nth_comma(__VA_ARGS__,  _rpath_c,_rpath_c,_rpath_c,_rpath_c, \
                                    _rpath_c,_rpath_c,_rpath_c,_rpath_c, _rpath_z) )
#define _va_comma(...) _va_comma2(_spaces_on_empty_token __VA_ARGS__ (/*empty*/))

#define _wa0(...)
#define _wa1(z, x)       , rpath::__wrap<rpath::__clean_type<decltype(x)>>::w(x)
#define _wa2(z, x, ...)  , rpath::__wrap<rpath::__clean_type<decltype(x)>>::w(x) _rpath_wrap(_wa1(z, __VA_ARGS__))
#define _wa3(z, x, ...)  , rpath::__wrap<rpath::__clean_type<decltype(x)>>::w(x) _rpath_wrap(_wa2(z, __VA_ARGS__))
#define _wa4(z, x, ...)  , rpath::__wrap<rpath::__clean_type<decltype(x)>>::w(x) _rpath_wrap(_wa3(z, __VA_ARGS__))
#define _wa5(z, x, ...)  , rpath::__wrap<rpath::__clean_type<decltype(x)>>::w(x) _rpath_wrap(_wa4(z, __VA_ARGS__))
#define _wa6(z, x, ...)  , rpath::__wrap<rpath::__clean_type<decltype(x)>>::w(x) _rpath_wrap(_wa5(z, __VA_ARGS__))
#define _wa7(z, x, ...)  , rpath::__wrap<rpath::__clean_type<decltype(x)>>::w(x) _rpath_wrap(_wa6(z, __VA_ARGS__))
#define _wa8(z, x, ...)  , rpath::__wrap<rpath::__clean_type<decltype(x)>>::w(x) _rpath_wrap(_wa7(z, __VA_ARGS__))

#define _rpath_wrap_args_2(...) _rpath_wrap( _rpath_get_nth_wrap_arg(__VA_ARGS__,  _wa8,_wa7,_wa6,_wa5, \
                                                             _wa4,_wa3,_wa2,_wa1,  _wa0)(__VA_ARGS__) )
#define _rpath_wrap_args(...) _rpath_wrap( _rpath_wrap_args_2(0 _va_comma(__VA_ARGS__) __VA_ARGS__) )

/**
 * Logs an info message without FILE:LINE information
 */
#define LogInfo(format, ...) rpath::_LogInfo("$ " format _rpath_wrap_args(__VA_ARGS__) )

/**
 * Logs a warning prefixed with the calling file, line and function
 */
#define LogWarning(format, ...) rpath::_LogWarning(__log_format(format, __FILE__, __LINE__, __FUNCTION__) _rpath_wrap_args(__VA_ARGS__) )

/**
 * Logs an error prefixed with the calling file, line and function
 */
#define LogError(format, ...) rpath::_LogError(__log_format(format, __FILE__, __LINE__, __FUNCTION__) _rpath_wrap_args(__VA_ARGS__) )

// uses printf style formatting to build an exception message
#define ThrowErrType(exceptionClass, format, ...) do { \
    auto* __formatted_error__ = rpath::_FmtString(format _rpath_wrap_args(__VA_ARGS__) ); \
    throw exceptionClass(__formatted_error__); \
} while(0)

// throws an std::invalid_argument with a printf style message
#define ThrowInvalidArg(format, ...) ThrowErrType(std::invalid_argument, format, ##__VA_ARGS__)
