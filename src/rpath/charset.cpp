#include "charset.h"
#include "debugging.h"
#include <locale>

#define _SILENCE_CXX17_CODECVT_HEADER_DEPRECATION_WARNING 1
#include <codecvt> // codecvt_utf8_utf16

#if __GNUG__
#  pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#endif

namespace rpath
{
    ////////////////////////////////////////////////////////////////////////////////

    const charset& charset::utf8() noexcept
    {
        static const charset cs { Encoding::Utf8, "UTF-8", 3 };
        return cs;
    }
    const charset& charset::us_ascii() noexcept
    {
        static const charset cs { Encoding::UsAscii, "US-ASCII", 1 };
        return cs;
    }
    const charset& charset::iso_8859_1() noexcept
    {
        static const charset cs { Encoding::Iso8859_1, "ISO-8859-1", 1 };
        return cs;
    }
    const charset& charset::utf16le() noexcept
    {
        static const charset cs { Encoding::Utf16LE, "UTF-16LE", 2 };
        return cs;
    }
    const charset& charset::utf16be() noexcept
    {
        static const charset cs { Encoding::Utf16BE, "UTF-16BE", 2 };
        return cs;
    }
    const charset& charset::default_charset() noexcept
    {
        return utf8();
    }

    const charset* charset::for_name(strview name) noexcept
    {
        struct alias { strview name; const charset& (*get)() noexcept; };
        static const alias aliases[] = {
            { "UTF-8",      &charset::utf8 },
            { "UTF8",       &charset::utf8 },
            { "US-ASCII",   &charset::us_ascii },
            { "ASCII",      &charset::us_ascii },
            { "ISO-8859-1", &charset::iso_8859_1 },
            { "ISO8859-1",  &charset::iso_8859_1 },
            { "LATIN1",     &charset::iso_8859_1 },
            { "UTF-16LE",   &charset::utf16le },
            { "UTF-16BE",   &charset::utf16be },
            { "UTF-16",     &charset::utf16be },
        };
        for (const alias& a : aliases)
            if (a.name.equalsi(name))
                return &a.get();

        LogWarning("unsupported charset '%s'", name);
        return nullptr;
    }

    ////////////////////////////////////////////////////////////////////////////////

    int charset::code_point_length(char32_t cp) const noexcept
    {
        if (cp > MAX_CODE_POINT || (MIN_HIGH_SURROGATE <= cp && cp <= MAX_LOW_SURROGATE))
            return -1;
        switch (enc)
        {
            case Encoding::Utf8:
                if (cp < 0x80)    return 1;
                if (cp < 0x800)   return 2;
                if (cp < 0x10000) return 3;
                return 4;
            case Encoding::UsAscii:   return cp < 0x80  ? 1 : -1;
            case Encoding::Iso8859_1: return cp < 0x100 ? 1 : -1;
            case Encoding::Utf16LE:
            case Encoding::Utf16BE:
                return cp < 0x10000 ? 2 : 4;
        }
        return -1;
    }

    bool charset::can_encode(ustrview s) const noexcept
    {
        return encoded_length(s) != -1;
    }

    int charset::encoded_length(ustrview s) const noexcept
    {
        int total = 0;
        for (int i = 0; i < s.len; )
        {
            char16_t unit = s.str[i];
            if (is_surrogate(unit) && (!is_high_surrogate(unit) || i + 1 >= s.len || !is_low_surrogate(s.str[i + 1])))
                return -1;
            int n = code_point_length(next_code_point(s, i));
            if (n < 0)
                return -1;
            total += n;
        }
        return total;
    }

    static int encode_utf8(const char16_t* from, int units, char* out, int outLen) noexcept
    {
        std::codecvt_utf8_utf16<char16_t> cvt;
        std::mbstate_t state = std::mbstate_t();
        const char16_t* from_next;
        char* to_next;
        auto res = cvt.out(state, from, from + units, from_next, out, out + outLen, to_next);
        if (res != std::codecvt_base::ok || from_next != from + units)
            return -1;
        return int(to_next - out);
    }

    CoderResult charset::encode(const char16_t*& from, const char16_t* end, char*& to, char* toEnd) const noexcept
    {
        while (from < end)
        {
            char16_t unit = *from;
            int units = 1;
            if (is_high_surrogate(unit))
            {
                if (from + 1 >= end || !is_low_surrogate(from[1]))
                    return CoderResult::Malformed;
                units = 2;
            }
            else if (is_low_surrogate(unit))
            {
                return CoderResult::Malformed;
            }

            int index = 0;
            char32_t cp = next_code_point(ustrview{from, units}, index);
            int n = code_point_length(cp);
            if (n < 0)
                return CoderResult::Unmappable;
            if (toEnd - to < n)
                return CoderResult::Overflow;

            switch (enc)
            {
                case Encoding::Utf8:
                    if (encode_utf8(from, units, to, n) != n)
                        return CoderResult::Malformed;
                    break;
                case Encoding::UsAscii:
                case Encoding::Iso8859_1:
                    to[0] = char(byte(cp));
                    break;
                case Encoding::Utf16LE:
                    for (int i = 0; i < units; ++i) {
                        to[i*2 + 0] = char(byte(from[i] & 0xFF));
                        to[i*2 + 1] = char(byte(from[i] >> 8));
                    }
                    break;
                case Encoding::Utf16BE:
                    for (int i = 0; i < units; ++i) {
                        to[i*2 + 0] = char(byte(from[i] >> 8));
                        to[i*2 + 1] = char(byte(from[i] & 0xFF));
                    }
                    break;
            }
            to += n;
            from += units;
        }
        return CoderResult::Underflow;
    }

    std::string charset::encode(ustrview s, bool* ok) const
    {
        if (ok) *ok = true;
        int len = encoded_length(s);
        if (len < 0)
        {
            if (ok) *ok = false;
            return std::string{};
        }

        std::string out;
        out.resize(size_t(len));
        const char16_t* from = s.begin();
        char* to = out.data();
        if (encode(from, s.end(), to, out.data() + out.size()) != CoderResult::Underflow)
        {
            if (ok) *ok = false;
            return std::string{};
        }
        return out;
    }

} // namespace rpath
