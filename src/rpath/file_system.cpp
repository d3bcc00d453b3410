#include "file_system.h"
#include "path_prefix.h"
#include "debugging.h"
#include <algorithm> // std::binary_search

#if !_WIN32
#  include <sys/utsname.h> // uname
#endif

namespace rpath
{
    ////////////////////////////////////////////////////////////////////////////////

    // KEEP THESE TABLES SORTED! Lookups are binary searches.

    static constexpr char32_t GENERIC_ILLEGAL[] = { 0 };
    static constexpr char32_t LINUX_ILLEGAL[]   = { 0, '/' };
    static constexpr char32_t MAC_OSX_ILLEGAL[] = { 0, '/', ':' };
    static constexpr char32_t WINDOWS_ILLEGAL[] = {
        0,
        // 1-31 may be allowed in file streams
        1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15, 16, 17, 18, 19, 20, 21, 22, 23, 24, 25, 26, 27, 28,
        29, 30, 31,
        '"', '*', '/', ':', '<', '>', '?', '\\', '|',
    };

    static constexpr ustrview WINDOWS_RESERVED[] = {
        u"AUX",
        u"COM1", u"COM2", u"COM3", u"COM4", u"COM5", u"COM6", u"COM7", u"COM8", u"COM9",
        u"COM\u00b2", u"COM\u00b3", u"COM\u00b9", // superscript 2 3 1 in code point order
        u"CON", u"CONIN$", u"CONOUT$",
        u"LPT1", u"LPT2", u"LPT3", u"LPT4", u"LPT5", u"LPT6", u"LPT7", u"LPT8", u"LPT9",
        u"LPT\u00b2", u"LPT\u00b3", u"LPT\u00b9",
        u"NUL", u"PRN",
    };

    filesystem_profile::filesystem_profile(const traits& t) noexcept
        : fs_type{t.type}
        , fs_name{t.name}
        , blockSize{t.block_size}
        , caseSensitive{t.case_sensitive}
        , casePreserving{t.case_preserving}
        , maxNameLength{t.max_name_length}
        , maxPathLength{t.max_path_length}
        , lengthUnit{t.length_unit}
        , illegalCodePoints{t.illegal_code_points}
        , reservedNames{t.reserved_names}
        , reservedNameExtensions{t.reserved_name_extensions}
        , driveLetter{t.supports_drive_letter}
        , nameSeparator{t.name_separator}
    {
    }

    const filesystem_profile& filesystem_profile::generic() noexcept
    {
        static const filesystem_profile fs { traits{
            .type = FileSystemType::Generic, .name = "Generic",
            .block_size = 4096, .case_sensitive = false, .case_preserving = false,
            .max_name_length = 1020, .max_path_length = 1024 * 1024,
            .length_unit = LengthUnit::Bytes,
            .illegal_code_points = GENERIC_ILLEGAL, .reserved_names = {},
            .reserved_name_extensions = false, .supports_drive_letter = false,
            .name_separator = UNIX_SEPARATOR,
        }};
        return fs;
    }

    const filesystem_profile& filesystem_profile::linux_fs() noexcept
    {
        static const filesystem_profile fs { traits{
            .type = FileSystemType::Linux, .name = "Linux",
            .block_size = 8192, .case_sensitive = true, .case_preserving = true,
            .max_name_length = 255, .max_path_length = 4096,
            .length_unit = LengthUnit::Bytes,
            .illegal_code_points = LINUX_ILLEGAL, .reserved_names = {},
            .reserved_name_extensions = false, .supports_drive_letter = false,
            .name_separator = UNIX_SEPARATOR,
        }};
        return fs;
    }

    const filesystem_profile& filesystem_profile::mac_osx() noexcept
    {
        static const filesystem_profile fs { traits{
            .type = FileSystemType::MacOSX, .name = "MacOSX",
            .block_size = 4096, .case_sensitive = true, .case_preserving = true,
            .max_name_length = 255, .max_path_length = 1024,
            .length_unit = LengthUnit::Utf16Units,
            .illegal_code_points = MAC_OSX_ILLEGAL, .reserved_names = {},
            .reserved_name_extensions = false, .supports_drive_letter = false,
            .name_separator = UNIX_SEPARATOR,
        }};
        return fs;
    }

    const filesystem_profile& filesystem_profile::windows() noexcept
    {
        static const filesystem_profile fs { traits{
            .type = FileSystemType::Windows, .name = "Windows",
            .block_size = 4096, .case_sensitive = false, .case_preserving = true,
            .max_name_length = 255, .max_path_length = 32767,
            .length_unit = LengthUnit::Utf16Units,
            .illegal_code_points = WINDOWS_ILLEGAL, .reserved_names = WINDOWS_RESERVED,
            .reserved_name_extensions = true, .supports_drive_letter = true,
            .name_separator = WINDOWS_SEPARATOR,
        }};
        return fs;
    }

    const filesystem_profile& filesystem_profile::get(FileSystemType type) noexcept
    {
        switch (type)
        {
            case FileSystemType::Linux:   return linux_fs();
            case FileSystemType::MacOSX:  return mac_osx();
            case FileSystemType::Windows: return windows();
            case FileSystemType::Generic: break;
        }
        return generic();
    }

    ////////////////////////////////////////////////////////////////////////////////

    bool filesystem_profile::is_illegal_code_point(char32_t cp) const noexcept
    {
        return std::binary_search(illegalCodePoints.begin(), illegalCodePoints.end(), cp);
    }

    static inline char16_t ascii_upper(char16_t ch) noexcept
    {
        return (u'a' <= ch && ch <= u'z') ? char16_t(ch - (u'a' - u'A')) : ch;
    }

    // code unit order after folding ASCII letters to upper case
    static bool less_ignore_ascii_case(ustrview a, ustrview b) noexcept
    {
        const int n = a.len < b.len ? a.len : b.len;
        for (int i = 0; i < n; ++i)
        {
            char16_t ca = ascii_upper(a.str[i]);
            char16_t cb = ascii_upper(b.str[i]);
            if (ca != cb)
                return ca < cb;
        }
        return a.len < b.len;
    }

    bool filesystem_profile::is_reserved_name(ustrview candidate) const noexcept
    {
        if (reservedNames.empty())
            return false;

        ustrview test = candidate;
        if (reservedNameExtensions)
        {
            int dot = candidate.find(u'.', 1);
            if (dot != -1)
                test = candidate.substr(0, dot);
        }

        if (caseSensitive)
            return std::binary_search(reservedNames.begin(), reservedNames.end(), test);
        // the reserved names are stored upper case, so folding keeps the table sorted
        return std::binary_search(reservedNames.begin(), reservedNames.end(), test, less_ignore_ascii_case);
    }

    ustring filesystem_profile::normalize_separators(ustrview path) const
    {
        const char16_t other = nameSeparator == UNIX_SEPARATOR ? WINDOWS_SEPARATOR : UNIX_SEPARATOR;
        ustring result = path.to_string();
        for (char16_t& ch : result)
            if (ch == other)
                ch = nameSeparator;
        return result;
    }

    ////////////////////////////////////////////////////////////////////////////////

    const filesystem_profile& resolve_profile(strview osName) noexcept
    {
        if (osName.starts_withi("Linux"))   return filesystem_profile::linux_fs();
        if (osName.starts_withi("Mac"))     return filesystem_profile::mac_osx();
        if (osName.starts_withi("Windows")) return filesystem_profile::windows();
        return filesystem_profile::generic();
    }

    std::string os_name()
    {
    #if _WIN32
        return "Windows";
    #elif __APPLE__
        return "Mac OS X";
    #else
        struct utsname info;
        if (uname(&info) != 0)
        {
            LogWarning("uname() failed, host OS is unknown");
            return std::string{};
        }
        return info.sysname;
    #endif
    }

    const filesystem_profile& current_profile() noexcept
    {
        static const filesystem_profile& current = []() -> const filesystem_profile&
        {
            std::string os = os_name();
            const filesystem_profile& fs = resolve_profile(os);
            LogInfo("host OS '%s' uses the %s file system profile", os, fs.name());
            return fs;
        }();
        return current;
    }

} // namespace rpath
