#pragma once
/**
 * String buffer for printing values, Copyright (c) 2024, RePath authors
 * Distributed under MIT Software License
 */
#include "strview.h"
#include "debugging.h"

#include <cstdio>      // snprintf
#include <optional>    // std::optional support
#include <type_traits>

namespace rpath
{
    /**
     * Always null terminated string builder, which is compatible with strview.
     * Used by the unit test framework to print mismatching values.
     * Not intended for copying.
     */
    struct RPATHAPI string_buffer
    {
        static constexpr int SIZE = 512;
        char* ptr = nullptr;
        int len = 0;
        int cap = SIZE;
        char buf[SIZE];

        string_buffer() noexcept { ptr = buf; buf[0] = '\0'; } // NOLINT
        explicit string_buffer(strview text) noexcept : string_buffer{}
        {
            write(text);
        }
        ~string_buffer() noexcept;

        string_buffer(const string_buffer&)            = delete;
        string_buffer& operator=(const string_buffer&) = delete;

        FINLINE int size() const noexcept { return len; }
        FINLINE const char* c_str() const noexcept { return ptr; }
        FINLINE const char* data()  const noexcept { return ptr; }
        FINLINE strview     view()  const noexcept { return { ptr, len }; }
        FINLINE std::string str()   const noexcept { return { ptr, ptr+len }; }

        void clear() noexcept;
        void reserve(int count) noexcept;

        /** @brief Append a string to this buffer */
        void append(const char* str, int slen) noexcept;
        void writef(PRINTF_FMTSTR const char* format, ...) noexcept PRINTF_CHECKFMT2;

        FINLINE void write(const std::string& value) noexcept { this->write(strview{ value }); }
        FINLINE void write(const char* value) noexcept { this->write(strview{ value }); }

        void write(strview s) noexcept;
        void write(char value) noexcept;
        void write(bool   value) noexcept;
        void write(int    value) noexcept;
        void write(uint   value) noexcept;
        void write(long   value) noexcept;
        void write(unsigned long value) noexcept;
        void write(int64  value) noexcept;
        void write(uint64 value) noexcept;
        void write(double value) noexcept;

        /** Writes a single UTF-16 unit as 'x' or U+XXXX if it is not printable ASCII */
        void write(char16_t value) noexcept;
        /** Writes a code point as 'x' or U+XXXX if it is not printable ASCII */
        void write(char32_t value) noexcept;

        /** UTF-16 input is converted to UTF-8, unpaired surrogates are written as \uXXXX */
        void write_utf16_as_utf8(const char16_t* utf16, int utflength) noexcept;
        FINLINE void write(const ustring& value)  noexcept { write_utf16_as_utf8(value.data(), static_cast<int>(value.size())); }
        FINLINE void write(ustrview value)        noexcept { write_utf16_as_utf8(value.data(), value.size()); }
        FINLINE void write(const char16_t* value) noexcept { write(ustrview{ value }); }

        void write(std::nullptr_t) noexcept;
        FINLINE void write(std::nullopt_t) noexcept { write("nullopt"_sv); }

        template<class T> void write(const std::optional<T>& value) noexcept
        {
            if (value) write(*value);
            else       write(std::nullopt);
        }

        /**
         * @brief Generic fallback for enums and types with a to_string() member
         */
        template<class T> void write(const T& value) noexcept
        {
            if constexpr (std::is_enum_v<T>)
            {
                this->write(static_cast<int>(value));
            }
            else
            {
                this->write(value.to_string());
            }
        }

        void writeln() noexcept; // \n
        void write_quote() noexcept; // <">

        template<class T> FINLINE void writeln(const T& value) noexcept
        {
            write(value);
            writeln();
        }
    };

    template<class T> FINLINE string_buffer& operator<<(string_buffer& sb, const T& value) noexcept
    {
        sb.write(value);
        return sb;
    }
}
