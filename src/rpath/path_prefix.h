#pragma once
/**
 * Path prefix grammar: roots, drives, UNC hosts and home shorthand,
 * Copyright (c) 2024, RePath authors
 * Distributed under MIT Software License
 */
#include "strview.h"
#include <optional>

namespace rpath
{
    constexpr char16_t UNIX_SEPARATOR    = u'/';
    constexpr char16_t WINDOWS_SEPARATOR = u'\\';
    constexpr char16_t SYSTEM_SEPARATOR  = RPATH_SYSTEM_SEPARATOR;

    /** Prefix length sentinel for paths whose leading syntax is not valid */
    constexpr int INVALID_PREFIX = -1;

    FINLINE constexpr bool is_separator(char16_t ch) noexcept
    {
        return ch == UNIX_SEPARATOR || ch == WINDOWS_SEPARATOR;
    }

    enum class PrefixKind
    {
        Relative,        // "", "a/b"
        RootAbsolute,    // "/a/b", "\\a\\b"
        DriveRelative,   // "C:", "C:a"
        DriveAbsolute,   // "C:\\a", "C:/a"
        Unc,             // "//server/a", "\\\\server\\a"
        HomeCurrentUser, // "~", "~/a"
        HomeNamedUser,   // "~user", "~user/a"
    };

    struct path_prefix
    {
        PrefixKind kind;
        int length;

        /**
         * @returns TRUE if the prefix is longer than the path itself,
         *          which means a trailing separator must be synthesized, eg "~" ==> "~/"
         */
        NODISCARD bool is_virtual(int pathLength) const noexcept { return length > pathLength; }
    };

    /**
     * @brief Gets the length of the leading prefix of a path, such as `C:/` or `~/`.
     *        Both separator conventions are accepted in any path.
     *
     * @result ""              ==> 0
     * @result "a\\b"          ==> 0
     * @result "/a/b"          ==> 1
     * @result "C:"            ==> 2
     * @result "C:a"           ==> 2
     * @result "C:\\a\\b"      ==> 3
     * @result "//server/a"    ==> 9
     * @result "~"             ==> 2  (longer than the input)
     * @result "~user"         ==> 6  (longer than the input)
     * @result "~user/a"       ==> 6
     * @result ":"             ==> INVALID_PREFIX
     * @result "1:/a"          ==> INVALID_PREFIX
     * @result "//bad_host/a"  ==> INVALID_PREFIX
     */
    RPATHAPI int prefix_length(ustrview path) noexcept;

    /**
     * @brief UTF-8 variant of prefix_length()
     * @returns INVALID_PREFIX if `path` is not valid UTF-8
     */
    RPATHAPI int prefix_length(strview path);

    /**
     * @brief Classifies the prefix of `path`
     * @returns Prefix kind and length, or nullopt if the prefix is not valid
     */
    RPATHAPI std::optional<path_prefix> parse_prefix(ustrview path) noexcept;

    ////////////////////////////////////////////////////////////////////////////////

    /** @returns TRUE for a dotted-decimal IPv4 address without leading zeros */
    RPATHAPI bool is_ipv4_address(ustrview name) noexcept;

    /** @returns TRUE for an IPv6 address, with optional `::` and trailing IPv4 groups */
    RPATHAPI bool is_ipv6_address(ustrview name) noexcept;

    /** @returns TRUE for an RFC 3986 reg-name made of dot separated labels */
    RPATHAPI bool is_reg_name(ustrview name) noexcept;

    /** @returns TRUE if `name` may be used as the host of a UNC path */
    RPATHAPI bool is_valid_host_name(ustrview name) noexcept;

} // namespace rpath
