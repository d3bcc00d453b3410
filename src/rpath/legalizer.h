#pragma once
/**
 * File name legality checks and sanitizing, Copyright (c) 2024, RePath authors
 * Distributed under MIT Software License
 */
#include "file_system.h"

namespace rpath
{
    /**
     * @brief Checks whether `candidate` can be used as a single file name on `fs`.
     *        A legal name is not empty, fits fs.max_name_length() in the unit of the file system,
     *        is not a reserved name and has no illegal code points.
     *        Names that cannot be encoded with `cs` are never legal on byte measured file systems.
     * @code
     *     is_legal_file_name(u"CON.txt", filesystem_profile::windows()); // false
     *     is_legal_file_name(u"a:b", filesystem_profile::windows());     // false
     * @endcode
     */
    RPATHAPI bool is_legal_file_name(ustrview candidate, const filesystem_profile& fs, const charset& cs) noexcept;

    /** @brief Same as is_legal_file_name(candidate, fs, cs) with charset::default_charset() */
    RPATHAPI bool is_legal_file_name(ustrview candidate, const filesystem_profile& fs) noexcept;

    /**
     * @brief UTF-8 variant. Input that is not valid UTF-8 is never legal.
     */
    RPATHAPI bool is_legal_file_name(strview candidate, const filesystem_profile& fs, const charset& cs);

    /**
     * @brief Converts `candidate` into a legal file name for `fs`:
     *        it is truncated to the length limit first, then every illegal code point is
     *        replaced with `replacement`. If a wide replacement pushes the name over the
     *        limit again, the name is truncated once more.
     * @note Reserved names are not checked. "CON" stays "CON" on Windows, and a '.'
     *       replacement may even produce one, eg CON<x ==> CON.x. Check the result
     *       with is_legal_file_name() where a reserved name must be ruled out.
     * @result Windows: a<b>c with '_' ==> a_b_c
     * @throws std::invalid_argument if `candidate` is empty, if `replacement` is illegal
     *         on `fs` or if the name cannot be truncated (see name_length_strategy::truncate)
     */
    RPATHAPI ustring to_legal_file_name(ustrview candidate, char32_t replacement,
                                        const filesystem_profile& fs, const charset& cs);

    RPATHAPI ustring to_legal_file_name(ustrview candidate, char32_t replacement,
                                        const filesystem_profile& fs);

} // namespace rpath
