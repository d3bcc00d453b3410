#pragma once
/**
 * Character sets for measuring encoded file names, Copyright (c) 2024, RePath authors
 * Distributed under MIT Software License
 */
#include "strview.h"

namespace rpath
{
    enum class Encoding
    {
        Utf8,
        UsAscii,
        Iso8859_1,
        Utf16LE,
        Utf16BE,
    };

    /**
     * Result of an incremental charset::encode() step
     */
    enum class CoderResult
    {
        Underflow,  // all input was consumed
        Overflow,   // output is full, `from` points to the first code point that did not fit
        Malformed,  // `from` points to an unpaired surrogate
        Unmappable, // `from` points to a code point the charset cannot represent
    };

    /**
     * @brief Encoder for the handful of character sets that file systems measure
     *        names in. Instances are immutable singletons.
     */
    class RPATHAPI charset
    {
        Encoding enc;
        strview cs_name;
        int max_bytes;

        constexpr charset(Encoding enc, strview name, int maxBytes) noexcept
            : enc{enc}, cs_name{name}, max_bytes{maxBytes} {}
    public:
        charset(const charset&) = delete;
        charset& operator=(const charset&) = delete;

        static const charset& utf8() noexcept;
        static const charset& us_ascii() noexcept;
        static const charset& iso_8859_1() noexcept;
        static const charset& utf16le() noexcept;
        static const charset& utf16be() noexcept;

        /** @returns The charset used when the caller does not supply one: UTF-8 */
        static const charset& default_charset() noexcept;

        /**
         * @brief Looks up a charset by name, case-insensitive.
         *        Accepts the common aliases: "UTF8", "ASCII", "LATIN1", "UTF-16" (as BE) etc.
         * @returns nullptr if the name is not known
         */
        static const charset* for_name(strview name) noexcept;

        NODISCARD Encoding encoding() const noexcept { return enc; }
        NODISCARD strview name() const noexcept { return cs_name; }

        /** @returns Worst case number of bytes produced per UTF-16 code unit */
        NODISCARD int max_bytes_per_char() const noexcept { return max_bytes; }

        /** @returns Number of bytes used to encode `cp`, or -1 if it cannot be encoded */
        NODISCARD int code_point_length(char32_t cp) const noexcept;

        NODISCARD bool can_encode(char32_t cp) const noexcept { return code_point_length(cp) > 0; }

        /** @returns TRUE if `s` is well-formed UTF-16 and every code point is mappable */
        NODISCARD bool can_encode(ustrview s) const noexcept;

        /** @returns Number of bytes `s` encodes to, or -1 if it cannot be encoded */
        NODISCARD int encoded_length(ustrview s) const noexcept;

        /**
         * @brief Encodes UTF-16 input into the output byte range, one code point at a time.
         *        Encoding stops at the first code point that is malformed, unmappable
         *        or does not fit completely, so a code point is never split.
         * @param from [in/out] Next input code unit
         * @param end End of the input
         * @param to [in/out] Next output byte
         * @param toEnd End of the output buffer
         */
        CoderResult encode(const char16_t*& from, const char16_t* end, char*& to, char* toEnd) const noexcept;

        /**
         * @brief Encodes the whole string
         * @param ok [optional] set to FALSE if the string could not be encoded
         */
        NODISCARD std::string encode(ustrview s, bool* ok = nullptr) const;
    };

} // namespace rpath
