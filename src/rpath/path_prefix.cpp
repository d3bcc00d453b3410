#include "path_prefix.h"
#include <vector>

namespace rpath
{
    static constexpr int IPV4_MAX_OCTET_VALUE = 255;
    static constexpr int IPV6_MAX_HEX_GROUPS = 8;
    static constexpr int IPV6_MAX_HEX_DIGITS_PER_GROUP = 4;

    static inline bool is_ascii_digit(char16_t ch) noexcept { return u'0' <= ch && ch <= u'9'; }
    static inline bool is_ascii_letter(char16_t ch) noexcept
    {
        return (u'a' <= ch && ch <= u'z') || (u'A' <= ch && ch <= u'Z');
    }
    static inline bool is_hex_digit(char16_t ch) noexcept
    {
        return is_ascii_digit(ch) || (u'a' <= ch && ch <= u'f') || (u'A' <= ch && ch <= u'F');
    }

    // first separator of either kind at or after `start`
    static int index_of_separator(ustrview path, int start) noexcept
    {
        int posUnix = path.find(UNIX_SEPARATOR, start);
        int posWin  = path.find(WINDOWS_SEPARATOR, start);
        if (posUnix == -1) return posWin;
        if (posWin == -1)  return posUnix;
        return posUnix < posWin ? posUnix : posWin;
    }

    int prefix_length(ustrview path) noexcept
    {
        const int len = path.len;
        if (len == 0)
            return 0;

        char16_t ch0 = path[0];
        if (ch0 == u':')
            return INVALID_PREFIX;

        if (len == 1)
        {
            if (ch0 == u'~')
                return 2; // virtual "~/"
            return is_separator(ch0) ? 1 : 0;
        }

        if (ch0 == u'~')
        {
            int pos = index_of_separator(path, 1);
            return pos == -1 ? len + 1 : pos + 1;
        }

        char16_t ch1 = path[1];
        if (ch1 == u':')
        {
            if (is_ascii_letter(ch0))
            {
                if (len == 2 || !is_separator(path[2]))
                    return 2;
                return 3;
            }
            if (ch0 == UNIX_SEPARATOR)
                return 1;
            return INVALID_PREFIX;
        }

        if (is_separator(ch0) && is_separator(ch1))
        {
            int posUnix = path.find(UNIX_SEPARATOR, 2);
            int posWin  = path.find(WINDOWS_SEPARATOR, 2);
            if ((posUnix == -1 && posWin == -1) || posUnix == 2 || posWin == 2)
                return INVALID_PREFIX;
            int pos = index_of_separator(path, 2) + 1;
            ustrview host = path.substr(2, pos - 3);
            return is_valid_host_name(host) ? pos : INVALID_PREFIX;
        }

        return is_separator(ch0) ? 1 : 0;
    }

    int prefix_length(strview path)
    {
        bool ok;
        ustring upath = to_ustring(path, &ok);
        if (!ok)
            return INVALID_PREFIX;
        return prefix_length(ustrview{upath});
    }

    std::optional<path_prefix> parse_prefix(ustrview path) noexcept
    {
        int length = prefix_length(path);
        if (length == INVALID_PREFIX)
            return std::nullopt;
        if (length == 0)
            return path_prefix{ PrefixKind::Relative, 0 };

        if (path[0] == u'~')
        {
            bool currentUser = path.len == 1 || is_separator(path[1]);
            return path_prefix{ currentUser ? PrefixKind::HomeCurrentUser
                                            : PrefixKind::HomeNamedUser, length };
        }
        if (path.len >= 2 && path[1] == u':' && is_ascii_letter(path[0]))
        {
            return path_prefix{ length == 2 ? PrefixKind::DriveRelative
                                            : PrefixKind::DriveAbsolute, length };
        }
        if (length > 1) // only a valid UNC prefix is longer than a root separator
            return path_prefix{ PrefixKind::Unc, length };
        return path_prefix{ PrefixKind::RootAbsolute, length };
    }

    ////////////////////////////////////////////////////////////////////////////////

    // splits on `sep` and drops trailing empty parts, unless `sep` never occurs
    static std::vector<ustrview> split_drop_trailing(ustrview s, char16_t sep)
    {
        std::vector<ustrview> parts;
        if (s.find(sep) == -1)
        {
            parts.push_back(s);
            return parts;
        }
        int start = 0;
        for (int i = 0; i <= s.len; ++i)
        {
            if (i == s.len || s[i] == sep)
            {
                parts.push_back(s.substr(start, i - start));
                start = i + 1;
            }
        }
        while (!parts.empty() && parts.back().empty())
            parts.pop_back();
        return parts;
    }

    bool is_ipv4_address(ustrview name) noexcept
    {
        int groups = 0;
        int start = 0;
        for (int i = 0; i <= name.len; ++i)
        {
            if (i < name.len && name[i] != u'.')
                continue;

            ustrview group = name.substr(start, i - start);
            if (group.len < 1 || group.len > 3)
                return false;
            int value = 0;
            for (char16_t ch : group)
            {
                if (!is_ascii_digit(ch))
                    return false;
                value = value * 10 + (ch - u'0');
            }
            if (value > IPV4_MAX_OCTET_VALUE)
                return false;
            if (group.len > 1 && group[0] == u'0')
                return false;
            if (++groups > 4)
                return false;
            start = i + 1;
        }
        return groups == 4;
    }

    bool is_ipv6_address(ustrview name) noexcept
    {
        const int compressed = name.find(u"::"_sv);
        const bool containsCompressedZeroes = compressed != -1;
        if (containsCompressedZeroes && name.find(u"::"_sv, compressed + 1) != -1)
            return false;

        if ((name.starts_with(u":"_sv) && !name.starts_with(u"::"_sv)) ||
            (name.ends_with(u":"_sv) && !name.ends_with(u"::"_sv)))
            return false;

        std::vector<ustrview> groups = split_drop_trailing(name, u':');
        if (containsCompressedZeroes)
        {
            if (name.ends_with(u"::"_sv))
                groups.push_back(ustrview{});
            else if (name.starts_with(u"::"_sv) && !groups.empty())
                groups.erase(groups.begin());
        }

        if ((int)groups.size() > IPV6_MAX_HEX_GROUPS)
            return false;

        int validGroups = 0;
        int emptyGroups = 0;
        for (size_t index = 0; index < groups.size(); ++index)
        {
            ustrview group = groups[index];
            if (group.empty())
            {
                if (++emptyGroups > 1)
                    return false;
            }
            else
            {
                emptyGroups = 0;
                if (index == groups.size() - 1 && group.contains(u'.'))
                {
                    if (!is_ipv4_address(group))
                        return false;
                    validGroups += 2;
                    continue;
                }
                if (group.len > IPV6_MAX_HEX_DIGITS_PER_GROUP)
                    return false;
                for (char16_t ch : group)
                    if (!is_hex_digit(ch))
                        return false;
            }
            ++validGroups;
        }
        return validGroups <= IPV6_MAX_HEX_GROUPS
            && (validGroups >= IPV6_MAX_HEX_GROUPS || containsCompressedZeroes);
    }

    // [A-Za-z0-9][A-Za-z0-9-]*
    static bool is_reg_name_label(ustrview label) noexcept
    {
        if (label.empty())
            return false;
        if (!is_ascii_letter(label[0]) && !is_ascii_digit(label[0]))
            return false;
        for (char16_t ch : label)
            if (!is_ascii_letter(ch) && !is_ascii_digit(ch) && ch != u'-')
                return false;
        return true;
    }

    bool is_reg_name(ustrview name) noexcept
    {
        int start = 0;
        for (int i = 0; i <= name.len; ++i)
        {
            if (i < name.len && name[i] != u'.')
                continue;

            ustrview label = name.substr(start, i - start);
            if (label.empty())
                return i == name.len; // only a single trailing dot is allowed
            if (!is_reg_name_label(label))
                return false;
            start = i + 1;
        }
        return true;
    }

    bool is_valid_host_name(ustrview name) noexcept
    {
        return is_ipv4_address(name) || is_ipv6_address(name) || is_reg_name(name);
    }

} // namespace rpath
