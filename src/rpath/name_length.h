#pragma once
/**
 * File name length measurement and truncation, Copyright (c) 2024, RePath authors
 * Distributed under MIT Software License
 */
#include "charset.h"
#include <climits> // INT_MAX

namespace rpath
{
    /**
     * The unit a file system uses for its name length limit
     */
    enum class LengthUnit
    {
        Bytes,      // encoded bytes in a caller supplied charset
        Utf16Units, // UTF-16 code units
    };

    /** Measured length of a name that cannot be encoded: it exceeds every limit */
    constexpr int NAME_UNMEASURABLE = INT_MAX;

    /**
     * @brief Measures and truncates file names in a single LengthUnit.
     *        Truncation never splits a surrogate pair or an encoded multi-byte sequence,
     *        and keeps the extension: everything from the first `.` after index 0.
     */
    struct RPATHAPI name_length_strategy
    {
        LengthUnit unit;

        /**
         * @returns Length of `name` in this unit, or NAME_UNMEASURABLE
         *          if a Bytes name cannot be encoded with `cs`
         */
        NODISCARD int measure(ustrview name, const charset& cs) const noexcept;

        NODISCARD bool fits(ustrview name, int limit, const charset& cs) const noexcept
        {
            return measure(name, cs) <= limit;
        }

        /**
         * @brief Truncates `name` to at most `limit` units, keeping its extension.
         *        Names that already fit are returned unchanged.
         *
         *        The base name may be cut down to nothing if only the extension fits.
         *
         * @result Bytes(13)      aaaaaaaaaa.txt  ==> aaaaaaaaa.txt
         * @result Utf16Units(10) .aaaaaaaaaa     ==> .aaaaaaaaa
         * @result Utf16Units(4)  abcdef.ext      ==> .ext
         *
         * @throws std::invalid_argument if a Bytes name cannot be encoded with `cs`,
         *         or if the extension alone exceeds `limit`
         */
        NODISCARD ustring truncate(ustrview name, int limit, const charset& cs) const;

        NODISCARD strview unit_name() const noexcept
        {
            return unit == LengthUnit::Bytes ? strview{"bytes"} : strview{"UTF-16 code units"};
        }
    };

    /** @returns Index where the extension starts (the first `.` after index 0), or -1 */
    RPATHAPI int index_of_name_extension(ustrview name) noexcept;

} // namespace rpath
