/**
 * Build configuration for RePath, Copyright (c) 2024, RePath authors
 * Distributed under MIT Software License
 */
#pragma once

#ifndef RPATHAPI
#  if _MSC_VER
#    define RPATHAPI //__declspec(dllexport)
#  else // clang/gcc
#    define RPATHAPI __attribute__((visibility("default")))
#  endif
#endif

/// @brief The host platform decides the default separator and the
///        NTFS alternate data stream checks in rpath::index_of_extension
#ifndef RPATH_SYSTEM_WINDOWS
#  if _WIN32
#    define RPATH_SYSTEM_WINDOWS 1
#  else
#    define RPATH_SYSTEM_WINDOWS 0
#  endif
#endif

/// @brief Separator used by rpath::normalize(path) without an explicit separator choice.
///        Can be overridden by the build to force a specific convention.
#ifndef RPATH_SYSTEM_SEPARATOR
#  if RPATH_SYSTEM_WINDOWS
#    define RPATH_SYSTEM_SEPARATOR u'\\'
#  else
#    define RPATH_SYSTEM_SEPARATOR u'/'
#  endif
#endif

// view accessors and the log argument adapters are trivial wrappers
#ifndef FINLINE
#  if _MSC_VER
#    define FINLINE __forceinline
#  elif __APPLE__
#    define FINLINE inline __attribute__((always_inline))
#  else
#    define FINLINE __attribute__((always_inline))
#  endif
#endif

#ifndef NOCOPY_NOMOVE
#define NOCOPY_NOMOVE(T) \
    T(T&& fwd)             = delete; \
    T& operator=(T&& fwd)  = delete; \
    T(const T&)            = delete; \
    T& operator=(const T&) = delete;
#endif

#ifndef NODISCARD
#  define NODISCARD [[nodiscard]]
#endif

// MSVC printf format string validator
#ifndef PRINTF_FMTSTR
#  if _MSC_VER
#    define PRINTF_FMTSTR _In_z_ _Printf_format_string_
#  else
#    define PRINTF_FMTSTR
#  endif
#endif

// PRINTF_CHECKFMT<N>: argument N is a printf format string, varargs follow it
#ifndef PRINTF_CHECKFMT1
#  if !_MSC_VER
#    define PRINTF_CHECKFMT1 __attribute__((__format__ (__printf__, 1, 2)))
#    define PRINTF_CHECKFMT2 __attribute__((__format__ (__printf__, 2, 3)))
#    define PRINTF_CHECKFMT4 __attribute__((__format__ (__printf__, 4, 5)))
#  else
#    define PRINTF_CHECKFMT1
#    define PRINTF_CHECKFMT2
#    define PRINTF_CHECKFMT4
#  endif
#endif

namespace rpath
{
    using byte   = unsigned char;
    using uint   = unsigned int;
    using int64  = long long;
    using uint64 = unsigned long long;

    /**
     * @brief Adapts a log or assert argument for printf style formatting.
     *        Specializations turn path strings into `const char*`.
     */
    template<class T>
    struct __wrap
    {
        FINLINE static constexpr const T& w(const T& arg) noexcept { return arg; }
    };
}
