#pragma once
/**
 * Non-owning UTF-8 and UTF-16 string views, Copyright (c) 2024, RePath authors
 * Distributed under MIT Software License
 */
#ifndef __cplusplus
#  error <rpath/strview.h> requires C++17 or higher
#endif
#include <string>     // compatibility with std::string and std::u16string
#include <cstring>
#include <type_traits> // enable_if_t, is_same_v
#include "config.h"

namespace rpath
{
    using std::string;
    using ustring = std::u16string;

    /**
     * Read-only view of a UTF-8 string: Start pointer and Length.
     * The view never owns or modifies the string data.
     */
    struct RPATHAPI strview
    {
        const char* str; // start of string
        int len;         // length of string

        FINLINE constexpr strview()                            noexcept : str{""},  len{0} {}
        FINLINE constexpr strview(const char* str)             noexcept : str{str}, len{static_cast<int>(std::char_traits<char>::length(str))} {}
        FINLINE constexpr strview(const char* str, int len)    noexcept : str{str}, len{len} {}
        FINLINE constexpr strview(const char* str, size_t len) noexcept : str{str}, len{static_cast<int>(len)} {}
        FINLINE strview(const std::string& s)                  noexcept : str{s.c_str()}, len{static_cast<int>(s.length())} {}

        // disallow accidental init from char or bool, only an exact bool matches the template
        strview(char) = delete;
        template<class T, class = std::enable_if_t<std::is_same_v<T, bool>>>
        strview(T) = delete;

        FINLINE const char& operator[](int index) const noexcept { return str[index]; }

        FINLINE std::string to_string() const { return std::string{str, (size_t)len}; }

        NODISCARD FINLINE constexpr const char* data()  const noexcept { return str; }
        NODISCARD FINLINE constexpr int         size()  const noexcept { return len; }
        NODISCARD FINLINE constexpr int       length()  const noexcept { return len; }
        NODISCARD FINLINE constexpr bool       empty()  const noexcept { return len == 0; }
        NODISCARD FINLINE constexpr const char* begin() const noexcept { return str; }
        NODISCARD FINLINE constexpr const char* end()   const noexcept { return str + len; }

        NODISCARD FINLINE bool starts_with(strview prefix) const noexcept
        {
            return len >= prefix.len && (prefix.len == 0 || memcmp(str, prefix.str, size_t(prefix.len)) == 0);
        }

        /** @returns TRUE if this strview starts with the given prefix, case-insensitive for ASCII */
        NODISCARD bool starts_withi(strview prefix) const noexcept;

        /** @returns TRUE if both views are equal, case-insensitive for ASCII */
        NODISCARD bool equalsi(strview other) const noexcept;

        NODISCARD FINLINE bool equals(strview other) const noexcept
        {
            return len == other.len && (len == 0 || memcmp(str, other.str, size_t(len)) == 0);
        }
        NODISCARD FINLINE bool contains(strview substr) const noexcept { return find(substr) != -1; }

        /** @returns index of the first occurrence of substr, or -1 */
        NODISCARD int find(strview substr) const noexcept;

        FINLINE bool operator==(strview other) const noexcept { return equals(other); }
        FINLINE bool operator!=(strview other) const noexcept { return !equals(other); }
    };

    /**
     * Read-only view of a UTF-16 string. All path APIs operate on UTF-16 code units.
     * Indices and lengths are always measured in code units, never in code points.
     */
    struct RPATHAPI ustrview
    {
        const char16_t* str; // start of string
        int len;             // length of string in UTF-16 code units

        FINLINE constexpr ustrview()                                noexcept : str{u""}, len{0} {}
        FINLINE constexpr ustrview(const char16_t* str)             noexcept : str{str}, len{static_cast<int>(std::char_traits<char16_t>::length(str))} {}
        FINLINE constexpr ustrview(const char16_t* str, int len)    noexcept : str{str}, len{len} {}
        FINLINE constexpr ustrview(const char16_t* str, size_t len) noexcept : str{str}, len{static_cast<int>(len)} {}
        FINLINE ustrview(const char16_t* str, const char16_t* end)  noexcept : str{str}, len{static_cast<int>(end - str)} {}
        FINLINE ustrview(const ustring& s)                          noexcept : str{s.c_str()}, len{static_cast<int>(s.length())} {}

        // disallow accidental init from char16_t or bool, only an exact bool matches the template
        ustrview(char16_t) = delete;
        template<class T, class = std::enable_if_t<std::is_same_v<T, bool>>>
        ustrview(T) = delete;

        FINLINE const char16_t& operator[](int index) const noexcept { return str[index]; }

        FINLINE ustring to_string() const { return ustring{str, (size_t)len}; }

        NODISCARD FINLINE constexpr const char16_t* data()  const noexcept { return str; }
        NODISCARD FINLINE constexpr int             size()  const noexcept { return len; }
        NODISCARD FINLINE constexpr int           length()  const noexcept { return len; }
        NODISCARD FINLINE constexpr bool           empty()  const noexcept { return len == 0; }
        NODISCARD FINLINE constexpr const char16_t* begin() const noexcept { return str; }
        NODISCARD FINLINE constexpr const char16_t* end()   const noexcept { return str + len; }
        NODISCARD FINLINE constexpr char16_t        back()  const noexcept { return str[len - 1]; }

        /** @returns substring [start, start+count), clamped to the view */
        NODISCARD ustrview substr(int start, int count = -1) const noexcept;

        /** @returns index of the first ch at or after `start`, or -1 */
        NODISCARD int find(char16_t ch, int start = 0) const noexcept;
        /** @returns index of the first occurrence of substr at or after `start`, or -1 */
        NODISCARD int find(ustrview substr, int start = 0) const noexcept;
        /** @returns index of the last ch, or -1 */
        NODISCARD int rfind(char16_t ch) const noexcept;

        NODISCARD FINLINE bool contains(char16_t ch) const noexcept { return find(ch) != -1; }
        NODISCARD FINLINE bool contains(ustrview substr) const noexcept { return find(substr) != -1; }

        NODISCARD FINLINE bool starts_with(ustrview prefix) const noexcept
        {
            return len >= prefix.len && std::char_traits<char16_t>::compare(str, prefix.str, size_t(prefix.len)) == 0;
        }
        NODISCARD FINLINE bool ends_with(ustrview suffix) const noexcept
        {
            return len >= suffix.len && std::char_traits<char16_t>::compare(str + len - suffix.len, suffix.str, size_t(suffix.len)) == 0;
        }

        NODISCARD FINLINE bool equals(ustrview other) const noexcept
        {
            return len == other.len && std::char_traits<char16_t>::compare(str, other.str, size_t(len)) == 0;
        }
        /** @returns TRUE if both views are equal, ignoring case for each BMP code unit */
        NODISCARD bool equalsi(ustrview other) const noexcept;
        /** @returns TRUE if this view starts with `prefix`, ignoring case for each BMP code unit */
        NODISCARD bool starts_withi(ustrview prefix) const noexcept;

        /** @returns -1, 0 or +1 by lexicographic code unit order */
        NODISCARD int compare(ustrview other) const noexcept;

        FINLINE bool operator==(ustrview other) const noexcept { return equals(other); }
        FINLINE bool operator!=(ustrview other) const noexcept { return !equals(other); }
        FINLINE bool operator<(ustrview other) const noexcept { return compare(other) < 0; }
    };

    inline bool operator==(const ustring& a, ustrview b) noexcept { return b.equals(a); }
    inline bool operator!=(const ustring& a, ustrview b) noexcept { return !b.equals(a); }

    inline namespace literals
    {
        FINLINE constexpr strview operator "" _sv(const char* str, std::size_t len) noexcept
        {
            return { str, len };
        }
        FINLINE constexpr ustrview operator "" _sv(const char16_t* str, std::size_t len) noexcept
        {
            return { str, len };
        }
    }

    ////////////////////////////////////////////////////////////////////////////////

    constexpr char16_t MIN_HIGH_SURROGATE = 0xD800;
    constexpr char16_t MAX_HIGH_SURROGATE = 0xDBFF;
    constexpr char16_t MIN_LOW_SURROGATE  = 0xDC00;
    constexpr char16_t MAX_LOW_SURROGATE  = 0xDFFF;
    constexpr char32_t MAX_CODE_POINT     = 0x10FFFF;

    FINLINE constexpr bool is_high_surrogate(char16_t ch) noexcept { return MIN_HIGH_SURROGATE <= ch && ch <= MAX_HIGH_SURROGATE; }
    FINLINE constexpr bool is_low_surrogate(char16_t ch)  noexcept { return MIN_LOW_SURROGATE <= ch && ch <= MAX_LOW_SURROGATE; }
    FINLINE constexpr bool is_surrogate(char16_t ch)      noexcept { return MIN_HIGH_SURROGATE <= ch && ch <= MAX_LOW_SURROGATE; }

    /**
     * @brief Reads the code point starting at s[index] and advances index past it.
     *        An unpaired surrogate is returned as its own code unit value.
     */
    RPATHAPI char32_t next_code_point(ustrview s, int& index) noexcept;

    /**
     * @brief Appends a code point as one or two UTF-16 code units
     */
    RPATHAPI void append_code_point(ustring& out, char32_t cp);

    /**
     * @returns Index of the first unpaired surrogate, or -1 if `s` is well-formed UTF-16
     */
    RPATHAPI int index_of_malformed_utf16(ustrview s) noexcept;

    inline bool is_valid_utf16(ustrview s) noexcept { return index_of_malformed_utf16(s) == -1; }

    ////////////////////////////////////////////////////////////////////////////////

    /**
     * @brief Converts UTF-16 to UTF-8.
     * @param ok [optional] set to FALSE if the input was not well-formed UTF-16
     * @returns UTF-8 string, or an empty string if the conversion failed
     */
    RPATHAPI std::string to_string(const char16_t* utf16, int utf16len, bool* ok = nullptr);
    inline std::string to_string(ustrview utf16, bool* ok = nullptr) { return to_string(utf16.str, utf16.len, ok); }

    /**
     * @brief Converts UTF-8 to UTF-16.
     * @param ok [optional] set to FALSE if the input was not valid UTF-8
     * @returns UTF-16 string, or an empty string if the conversion failed
     */
    RPATHAPI ustring to_ustring(const char* utf8, int utf8len, bool* ok = nullptr);
    inline ustring to_ustring(strview utf8, bool* ok = nullptr) { return to_ustring(utf8.str, utf8.len, ok); }

    ////////////////////////////////////////////////////////////////////////////////

    template<>
    struct __wrap<strview>
    {
        // strview is not null terminated, so it has to be copied for printf
        struct cstr : std::string
        {
            /*implicit*/cstr(strview s) : std::string{s.str, size_t(s.len)} {}
        };
        FINLINE static const char* w(const cstr& s) noexcept { return s.c_str(); }
    };

    // UTF-16 printing adapter -- it has to allocate a temporary UTF-8 array
    struct Utf8Printable : std::string
    {
        /*implicit*/Utf8Printable(ustrview s) : std::string{to_string(s)} {}
        /*implicit*/Utf8Printable(const ustring& s) : std::string{to_string(s)} {}
    };

    template<>
    struct __wrap<ustrview>
    { FINLINE static const char* w(const Utf8Printable& s) noexcept { return s.c_str(); } };

    template<>
    struct __wrap<ustring>
    { FINLINE static const char* w(const Utf8Printable& s) noexcept { return s.c_str(); } };
}
