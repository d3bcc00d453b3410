#include "strview.h"
#include <cwctype> // towupper
#include <locale>

#define _SILENCE_CXX17_CODECVT_HEADER_DEPRECATION_WARNING 1
#include <codecvt> // codecvt_utf8_utf16

#if __GNUG__
#  pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#endif

namespace rpath
{
    static inline char ascii_upper(char ch) noexcept
    {
        return ('a' <= ch && ch <= 'z') ? char(ch - ('a' - 'A')) : ch;
    }

    bool strview::starts_withi(strview prefix) const noexcept
    {
        if (len < prefix.len) return false;
        for (int i = 0; i < prefix.len; ++i)
            if (ascii_upper(str[i]) != ascii_upper(prefix.str[i]))
                return false;
        return true;
    }

    bool strview::equalsi(strview other) const noexcept
    {
        return len == other.len && starts_withi(other);
    }

    int strview::find(strview substr) const noexcept
    {
        if (substr.len == 0) return 0;
        for (int i = 0; i + substr.len <= len; ++i)
            if (memcmp(str + i, substr.str, size_t(substr.len)) == 0)
                return i;
        return -1;
    }

    ////////////////////////////////////////////////////////////////////////////////

    ustrview ustrview::substr(int start, int count) const noexcept
    {
        if (start < 0) start = 0;
        if (start > len) start = len;
        int remaining = len - start;
        if (count < 0 || count > remaining) count = remaining;
        return { str + start, count };
    }

    int ustrview::find(char16_t ch, int start) const noexcept
    {
        for (int i = start < 0 ? 0 : start; i < len; ++i)
            if (str[i] == ch) return i;
        return -1;
    }

    int ustrview::find(ustrview substr, int start) const noexcept
    {
        if (start < 0) start = 0;
        for (int i = start; i + substr.len <= len; ++i)
            if (std::char_traits<char16_t>::compare(str + i, substr.str, size_t(substr.len)) == 0)
                return i;
        return -1;
    }

    int ustrview::rfind(char16_t ch) const noexcept
    {
        for (int i = len - 1; i >= 0; --i)
            if (str[i] == ch) return i;
        return -1;
    }

    // surrogates are compared as-is, everything else in the BMP is case folded
    static inline bool equalsi_unit(char16_t a, char16_t b) noexcept
    {
        if (a == b) return true;
        if (is_surrogate(a) || is_surrogate(b)) return false;
        return std::towupper(wint_t(a)) == std::towupper(wint_t(b))
            || std::towlower(wint_t(a)) == std::towlower(wint_t(b));
    }

    bool ustrview::starts_withi(ustrview prefix) const noexcept
    {
        if (len < prefix.len) return false;
        for (int i = 0; i < prefix.len; ++i)
            if (!equalsi_unit(str[i], prefix.str[i]))
                return false;
        return true;
    }

    bool ustrview::equalsi(ustrview other) const noexcept
    {
        return len == other.len && starts_withi(other);
    }

    int ustrview::compare(ustrview other) const noexcept
    {
        int n = len < other.len ? len : other.len;
        int c = std::char_traits<char16_t>::compare(str, other.str, size_t(n));
        if (c != 0) return c < 0 ? -1 : +1;
        return len == other.len ? 0 : (len < other.len ? -1 : +1);
    }

    ////////////////////////////////////////////////////////////////////////////////

    char32_t next_code_point(ustrview s, int& index) noexcept
    {
        char16_t hi = s.str[index++];
        if (is_high_surrogate(hi) && index < s.len && is_low_surrogate(s.str[index]))
        {
            char16_t lo = s.str[index++];
            return 0x10000 + ((char32_t(hi) - MIN_HIGH_SURROGATE) << 10) + (char32_t(lo) - MIN_LOW_SURROGATE);
        }
        return hi;
    }

    void append_code_point(ustring& out, char32_t cp)
    {
        if (cp < 0x10000)
        {
            out.push_back(char16_t(cp));
        }
        else
        {
            cp -= 0x10000;
            out.push_back(char16_t(MIN_HIGH_SURROGATE + (cp >> 10)));
            out.push_back(char16_t(MIN_LOW_SURROGATE + (cp & 0x3FF)));
        }
    }

    int index_of_malformed_utf16(ustrview s) noexcept
    {
        for (int i = 0; i < s.len; ++i)
        {
            char16_t ch = s.str[i];
            if (is_high_surrogate(ch))
            {
                if (i + 1 >= s.len || !is_low_surrogate(s.str[i + 1]))
                    return i;
                ++i; // skip the low half
            }
            else if (is_low_surrogate(ch))
            {
                return i;
            }
        }
        return -1;
    }

    ////////////////////////////////////////////////////////////////////////////////

    std::string to_string(const char16_t* utf16, int utf16len, bool* ok)
    {
        if (ok) *ok = true;
        if (utf16len < 0) utf16len = static_cast<int>(std::char_traits<char16_t>::length(utf16));
        if (utf16len == 0) return std::string{};

        // the facet itself does not reject unpaired surrogates on all standard libs
        if (index_of_malformed_utf16({utf16, utf16len}) != -1)
        {
            if (ok) *ok = false;
            return std::string{};
        }

        std::codecvt_utf8_utf16<char16_t> cvt;
        std::mbstate_t state = std::mbstate_t();
        std::string out;
        out.resize(size_t(utf16len) * 3);
        char* to_next;
        const char16_t* from_next;
        auto res = cvt.out(state, utf16, utf16 + utf16len, from_next,
                           &out[0], &out[0] + out.size(), to_next);
        if (res != std::codecvt_base::ok || from_next != utf16 + utf16len)
        {
            if (ok) *ok = false;
            return std::string{};
        }
        out.resize(size_t(to_next - out.data()));
        return out;
    }

    ustring to_ustring(const char* utf8, int utf8len, bool* ok)
    {
        if (ok) *ok = true;
        if (utf8len < 0) utf8len = int(strlen(utf8));
        if (utf8len == 0) return ustring{};

        std::codecvt_utf8_utf16<char16_t> cvt;
        std::mbstate_t state = std::mbstate_t();
        ustring out;
        out.resize(size_t(utf8len));
        char16_t* to_next;
        const char* from_next;
        auto res = cvt.in(state, utf8, utf8 + utf8len, from_next,
                          &out[0], &out[0] + out.size(), to_next);
        if (res != std::codecvt_base::ok || from_next != utf8 + utf8len)
        {
            if (ok) *ok = false;
            return ustring{};
        }
        out.resize(size_t(to_next - out.data()));
        return out;
    }
}
