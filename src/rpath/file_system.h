#pragma once
/**
 * Per-platform file system naming rules, Copyright (c) 2024, RePath authors
 * Distributed under MIT Software License
 */
#include "name_length.h"
#include <span>

namespace rpath
{
    enum class FileSystemType
    {
        Generic,
        Linux,
        MacOSX,
        Windows,
    };

    /**
     * @brief Immutable naming rules of a file system: limits, illegal characters
     *        and reserved names. One instance exists per FileSystemType.
     */
    class RPATHAPI filesystem_profile
    {
        FileSystemType fs_type;
        strview fs_name;
        int blockSize;
        bool caseSensitive;
        bool casePreserving;
        int maxNameLength;
        int maxPathLength;
        LengthUnit lengthUnit;
        std::span<const char32_t> illegalCodePoints; // sorted ascending
        std::span<const ustrview> reservedNames;     // sorted ascending
        bool reservedNameExtensions;
        bool driveLetter;
        char16_t nameSeparator;

    public:
        struct traits
        {
            FileSystemType type;
            strview name;
            int block_size;
            bool case_sensitive;
            bool case_preserving;
            int max_name_length;
            int max_path_length;
            LengthUnit length_unit;
            std::span<const char32_t> illegal_code_points;
            std::span<const ustrview> reserved_names;
            bool reserved_name_extensions;
            bool supports_drive_letter;
            char16_t name_separator;
        };

        explicit filesystem_profile(const traits& t) noexcept;
        NOCOPY_NOMOVE(filesystem_profile)

        static const filesystem_profile& get(FileSystemType type) noexcept;
        static const filesystem_profile& generic() noexcept;
        static const filesystem_profile& linux_fs() noexcept;
        static const filesystem_profile& mac_osx() noexcept;
        static const filesystem_profile& windows() noexcept;

        FileSystemType type() const noexcept { return fs_type; }
        strview name() const noexcept { return fs_name; }
        int block_size() const noexcept { return blockSize; }
        bool is_case_sensitive() const noexcept { return caseSensitive; }
        bool is_case_preserving() const noexcept { return casePreserving; }
        int max_name_length() const noexcept { return maxNameLength; }
        int max_path_length() const noexcept { return maxPathLength; }
        LengthUnit length_unit() const noexcept { return lengthUnit; }
        name_length_strategy length_strategy() const noexcept { return { lengthUnit }; }
        std::span<const char32_t> illegal_code_points() const noexcept { return illegalCodePoints; }
        std::span<const ustrview> reserved_names() const noexcept { return reservedNames; }
        bool has_reserved_name_extensions() const noexcept { return reservedNameExtensions; }
        bool supports_drive_letter() const noexcept { return driveLetter; }
        char16_t name_separator() const noexcept { return nameSeparator; }

        NODISCARD bool is_illegal_code_point(char32_t cp) const noexcept;

        /**
         * @brief Checks against the reserved device names of this file system.
         *        Case-insensitive file systems compare with ASCII case folding.
         *        If the file system reserves names with any extension, everything
         *        from the first `.` after index 0 is ignored.
         * @result Windows: CON      ==> true
         * @result Windows: con.txt  ==> true
         * @result Windows: CONSOLE  ==> false
         * @result Linux:   CON      ==> false
         */
        NODISCARD bool is_reserved_name(ustrview candidate) const noexcept;

        /**
         * @brief Converts all separators to the name_separator() of this file system
         */
        NODISCARD ustring normalize_separators(ustrview path) const;
    };

    /**
     * @brief Maps an OS name to a file system profile by case-insensitive prefix:
     *        "Linux", "Mac" and "Windows". Anything else is Generic.
     */
    RPATHAPI const filesystem_profile& resolve_profile(strview osName) noexcept;

    /** @returns Name of the host OS, eg "Linux", "Mac OS X" or "Windows" */
    RPATHAPI std::string os_name();

    /**
     * @brief File system profile of the host OS, resolved once on first use
     */
    RPATHAPI const filesystem_profile& current_profile() noexcept;

} // namespace rpath
