#include "sprint.h"
#include <cstdarg> // va_start
#include <cstdlib> // malloc/free/realloc

namespace rpath
{
    ////////////////////////////////////////////////////////////////////////////////

    string_buffer::~string_buffer() noexcept
    {
        if (cap > SIZE) free(ptr);
    }

    void string_buffer::clear() noexcept
    {
        ptr[len = 0] = '\0';
    }

    void string_buffer::reserve(int count) noexcept
    {
        int newlen = len + count + 1;
        if (newlen > cap)
        {
            int align = SIZE;
            int newcap = newlen + align;
            if (int rem = newcap % align)
                newcap += align - rem;

            if (cap == SIZE)
                ptr = (char*)memcpy(malloc(newcap), buf, len + 1);
            else
                ptr = (char*)realloc(ptr, newcap);
            cap = newcap;
        }
    }

    void string_buffer::append(const char* str, int slen) noexcept
    {
        reserve(slen);
        memcpy(ptr + len, str, (size_t)slen);
        len += slen;
        ptr[len] = '\0';
    }

    void string_buffer::writef(const char* format, ...) noexcept
    {
        char buffer[4096];
        va_list ap; va_start(ap, format);
        int n = vsnprintf(buffer, sizeof(buffer), format, ap);
        va_end(ap);
        if (n < 0 || n >= (int)sizeof(buffer))
            n = sizeof(buffer) - 1;
        append(buffer, n);
    }

    void string_buffer::write(std::nullptr_t) noexcept { write("null"_sv); }
    void string_buffer::writeln() noexcept     { write('\n'); }
    void string_buffer::write_quote() noexcept { write('"');  }

    void string_buffer::write(strview s) noexcept { append(s.str, s.len); }

    void string_buffer::write(char value) noexcept
    {
        reserve(1);
        ptr[len++] = value;
        ptr[len] = '\0';
    }

    void string_buffer::write(bool value) noexcept { write(value ? "true"_sv : "false"_sv); }
    void string_buffer::write(int value)    noexcept { writef("%d", value);   }
    void string_buffer::write(uint value)   noexcept { writef("%u", value);   }
    void string_buffer::write(long value)   noexcept { writef("%ld", value);  }
    void string_buffer::write(unsigned long value) noexcept { writef("%lu", value); }
    void string_buffer::write(int64 value)  noexcept { writef("%lld", value); }
    void string_buffer::write(uint64 value) noexcept { writef("%llu", value); }
    void string_buffer::write(double value) noexcept { writef("%g", value);   }

    void string_buffer::write(char16_t value) noexcept
    {
        write(char32_t(value));
    }

    void string_buffer::write(char32_t value) noexcept
    {
        if (0x20 <= value && value < 0x7F)
            writef("'%c'", char(value));
        else
            writef("U+%04X", unsigned(value));
    }

    void string_buffer::write_utf16_as_utf8(const char16_t* utf16, int utflength) noexcept
    {
        ustrview s { utf16, utflength };
        int start = 0;
        while (start < s.len)
        {
            int bad = index_of_malformed_utf16(s.substr(start));
            int end = bad == -1 ? s.len : start + bad;
            if (end > start)
                write(to_string(s.substr(start, end - start)));
            if (bad == -1)
                break;
            writef("\\u%04X", unsigned(s.str[end]));
            start = end + 1;
        }
    }
}
