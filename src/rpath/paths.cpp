#include "paths.h"
#include "debugging.h"

namespace rpath
{
    ////////////////////////////////////////////////////////////////////////////////

    static void fail_if_null_byte_present(ustrview path)
    {
        if (path.contains(u'\0'))
        {
            ThrowErrType(unsanitized_path_error,
                "Null byte present in file/path name. There are no known legitimate use cases"
                " for such data, but several injection attacks may use it");
        }
    }

    // moves `count` units from `src` to `dst` inside the working buffer
    static inline void shift(char16_t* array, int src, int dst, int count) noexcept
    {
        std::char_traits<char16_t>::move(array + dst, array + src, size_t(count));
    }

    static std::optional<ustring> do_normalize(ustrview path, char16_t separator, bool keepSeparator)
    {
        fail_if_null_byte_present(path);

        int size = path.len;
        if (size == 0)
            return ustring{};

        const int prefix = prefix_length(path);
        if (prefix < 0)
            return std::nullopt;

        // +1 for a possible trailing separator, +1 for the shifts that copy one past the end
        ustring buffer(size_t(size + 2), u'\0');
        char16_t* array = buffer.data();
        std::char_traits<char16_t>::copy(array, path.str, size_t(size));

        const char16_t otherSeparator = separator == UNIX_SEPARATOR ? WINDOWS_SEPARATOR : UNIX_SEPARATOR;
        for (int i = 0; i < size; ++i)
            if (array[i] == otherSeparator)
                array[i] = separator;

        bool lastIsDirectory = true;
        if (array[size - 1] != separator)
        {
            array[size++] = separator;
            lastIsDirectory = false;
        }

        // adjoining separators
        for (int i = (prefix != 0) ? prefix : 1; i < size; ++i)
        {
            if (array[i] == separator && array[i - 1] == separator)
            {
                shift(array, i, i - 1, size - i);
                --size;
                --i;
            }
        }

        // dot separator
        for (int i = prefix + 1; i < size; ++i)
        {
            if (array[i] == separator && array[i - 1] == u'.' &&
                (i == prefix + 1 || array[i - 2] == separator))
            {
                if (i == size - 1)
                    lastIsDirectory = true;
                shift(array, i + 1, i - 1, size - i);
                size -= 2;
                --i;
            }
        }

        // double dot separator
        for (int i = prefix + 2; i < size; ++i)
        {
            if (!(array[i] == separator && array[i - 1] == u'.' && array[i - 2] == u'.' &&
                  (i == prefix + 2 || array[i - 3] == separator)))
                continue;

            if (i == prefix + 2) // nothing left to step out of
                return std::nullopt;
            if (i == size - 1)
                lastIsDirectory = true;

            int j = i - 4;
            for (; j >= prefix; --j)
                if (array[j] == separator)
                    break;

            if (j >= prefix) // a/b/../c ==> a/c
            {
                shift(array, i + 1, j + 1, size - i);
                size -= i - j;
                i = j + 1;
            }
            else // a/../c ==> c
            {
                shift(array, i + 1, prefix, size - i);
                size -= i + 1 - prefix;
                i = prefix + 1;
            }
        }

        if (size <= 0)
            return ustring{};
        if (size <= prefix)
            return ustring(array, size_t(size));
        if (lastIsDirectory && keepSeparator)
            return ustring(array, size_t(size));
        return ustring(array, size_t(size - 1));
    }

    std::optional<ustring> normalize(ustrview path, bool unixSeparator)
    {
        return do_normalize(path, unixSeparator ? UNIX_SEPARATOR : WINDOWS_SEPARATOR, true);
    }
    std::optional<ustring> normalize(ustrview path)
    {
        return do_normalize(path, SYSTEM_SEPARATOR, true);
    }
    std::optional<ustring> normalize_no_end_separator(ustrview path, bool unixSeparator)
    {
        return do_normalize(path, unixSeparator ? UNIX_SEPARATOR : WINDOWS_SEPARATOR, false);
    }
    std::optional<ustring> normalize_no_end_separator(ustrview path)
    {
        return do_normalize(path, SYSTEM_SEPARATOR, false);
    }

    std::optional<ustring> concat(ustrview basePath, ustrview pathToAdd)
    {
        const int prefix = prefix_length(pathToAdd);
        if (prefix < 0)
            return std::nullopt;
        if (prefix > 0)
            return normalize(pathToAdd);
        if (basePath.empty())
            return normalize(pathToAdd);

        ustring joined;
        joined.reserve(size_t(basePath.len + 1 + pathToAdd.len));
        joined.append(basePath.str, size_t(basePath.len));
        if (!is_separator(basePath.back()))
            joined.push_back(UNIX_SEPARATOR);
        joined.append(pathToAdd.str, size_t(pathToAdd.len));
        return normalize(joined);
    }

    ////////////////////////////////////////////////////////////////////////////////

    static bool utf8_to_path(strview path, ustring& out)
    {
        bool ok;
        out = to_ustring(path, &ok);
        if (!ok)
            LogWarning("rejected path with invalid UTF-8: '%s'", path);
        return ok;
    }

    static std::optional<string> path_to_utf8(const std::optional<ustring>& path)
    {
        if (!path)
            return std::nullopt;
        return to_string(*path);
    }

    std::optional<string> normalize(strview path, bool unixSeparator)
    {
        ustring upath;
        if (!utf8_to_path(path, upath)) return std::nullopt;
        return path_to_utf8(normalize(ustrview{upath}, unixSeparator));
    }
    std::optional<string> normalize(strview path)
    {
        ustring upath;
        if (!utf8_to_path(path, upath)) return std::nullopt;
        return path_to_utf8(normalize(ustrview{upath}));
    }
    std::optional<string> normalize_no_end_separator(strview path, bool unixSeparator)
    {
        ustring upath;
        if (!utf8_to_path(path, upath)) return std::nullopt;
        return path_to_utf8(normalize_no_end_separator(ustrview{upath}, unixSeparator));
    }
    std::optional<string> normalize_no_end_separator(strview path)
    {
        ustring upath;
        if (!utf8_to_path(path, upath)) return std::nullopt;
        return path_to_utf8(normalize_no_end_separator(ustrview{upath}));
    }
    std::optional<string> concat(strview basePath, strview pathToAdd)
    {
        ustring ubase, uadd;
        if (!utf8_to_path(basePath, ubase) || !utf8_to_path(pathToAdd, uadd))
            return std::nullopt;
        return path_to_utf8(concat(ustrview{ubase}, ustrview{uadd}));
    }

    ////////////////////////////////////////////////////////////////////////////////

    std::optional<ustring> get_prefix(ustrview path)
    {
        const int len = prefix_length(path);
        if (len < 0)
            return std::nullopt;

        ustring prefix;
        if (len > path.len)
        {
            prefix = path.to_string();
            prefix.push_back(UNIX_SEPARATOR);
        }
        else
        {
            prefix = path.substr(0, len).to_string();
        }
        fail_if_null_byte_present(prefix);
        return prefix;
    }

    static std::optional<ustring> do_get_path(ustrview path, int separatorAdd)
    {
        const int prefix = prefix_length(path);
        if (prefix < 0)
            return std::nullopt;

        const int index = index_of_last_separator(path);
        const int end = index + separatorAdd;
        if (prefix >= path.len || index < 0 || prefix >= end)
            return ustring{};

        ustrview dir = path.substr(prefix, end - prefix);
        fail_if_null_byte_present(dir);
        return dir.to_string();
    }

    std::optional<ustring> get_path(ustrview path)
    {
        return do_get_path(path, 1);
    }
    std::optional<ustring> get_path_no_end_separator(ustrview path)
    {
        return do_get_path(path, 0);
    }

    static std::optional<ustring> do_get_full_path(ustrview path, bool includeSeparator)
    {
        const int prefix = prefix_length(path);
        if (prefix < 0)
            return std::nullopt;

        if (prefix >= path.len)
        {
            if (includeSeparator)
                return get_prefix(path); // adds the separator of a virtual prefix
            return path.to_string();
        }

        const int index = index_of_last_separator(path);
        if (index < 0)
            return path.substr(0, prefix).to_string();

        int end = index + (includeSeparator ? 1 : 0);
        if (end == 0)
            ++end;
        return path.substr(0, end).to_string();
    }

    std::optional<ustring> get_full_path(ustrview path)
    {
        return do_get_full_path(path, true);
    }
    std::optional<ustring> get_full_path_no_end_separator(ustrview path)
    {
        return do_get_full_path(path, false);
    }

    ustring get_name(ustrview path)
    {
        fail_if_null_byte_present(path);
        return path.substr(index_of_last_separator(path) + 1).to_string();
    }

    ustring get_base_name(ustrview path)
    {
        return remove_extension(get_name(path));
    }

    ustring get_extension(ustrview path)
    {
        const int index = index_of_extension(path);
        if (index == -1)
            return ustring{};
        return path.substr(index + 1).to_string();
    }

    ustring remove_extension(ustrview path)
    {
        fail_if_null_byte_present(path);
        const int index = index_of_extension(path);
        if (index == -1)
            return path.to_string();
        return path.substr(0, index).to_string();
    }

    int index_of_last_separator(ustrview path) noexcept
    {
        const int lastUnixPos = path.rfind(UNIX_SEPARATOR);
        const int lastWindowsPos = path.rfind(WINDOWS_SEPARATOR);
        return lastUnixPos > lastWindowsPos ? lastUnixPos : lastWindowsPos;
    }

    int index_of_extension(ustrview path)
    {
    #if RPATH_SYSTEM_WINDOWS
        // NTFS alternate data streams are addressed as "name:stream"
        const int nameStart = index_of_last_separator(path) + 1;
        if (path.find(u':', nameStart) != -1)
            ThrowInvalidArg("NTFS ADS separator (':') in file name is forbidden.");
    #endif
        const int extensionPos = path.rfind(EXTENSION_SEPARATOR);
        const int lastSeparator = index_of_last_separator(path);
        return lastSeparator > extensionPos ? -1 : extensionPos;
    }

    static ustring replace_separators(ustrview path, char16_t from, char16_t to)
    {
        ustring result = path.to_string();
        for (char16_t& ch : result)
            if (ch == from)
                ch = to;
        return result;
    }

    ustring separators_to_unix(ustrview path)
    {
        return replace_separators(path, WINDOWS_SEPARATOR, UNIX_SEPARATOR);
    }
    ustring separators_to_windows(ustrview path)
    {
        return replace_separators(path, UNIX_SEPARATOR, WINDOWS_SEPARATOR);
    }
    ustring separators_to_system(ustrview path)
    {
        return SYSTEM_SEPARATOR == WINDOWS_SEPARATOR ? separators_to_windows(path)
                                                     : separators_to_unix(path);
    }

    ////////////////////////////////////////////////////////////////////////////////

    bool is_case_sensitive(IOCase ioCase) noexcept
    {
        switch (ioCase)
        {
            case IOCase::Sensitive:   return true;
            case IOCase::Insensitive: return false;
            case IOCase::System:      return !RPATH_SYSTEM_WINDOWS;
        }
        return true;
    }

    static bool check_equals(ustrview a, ustrview b, IOCase ioCase) noexcept
    {
        return is_case_sensitive(ioCase) ? a.equals(b) : a.equalsi(b);
    }

    bool equals(ustrview path1, ustrview path2, bool normalized, IOCase ioCase)
    {
        if (!normalized)
            return check_equals(path1, path2, ioCase);

        std::optional<ustring> norm1 = normalize(path1);
        if (!norm1)
            return false;
        std::optional<ustring> norm2 = normalize(path2);
        if (!norm2)
            return false;
        return check_equals(*norm1, *norm2, ioCase);
    }

    bool is_extension(ustrview path, ustrview extension)
    {
        fail_if_null_byte_present(path);
        if (extension.empty())
            return index_of_extension(path) == -1;
        return get_extension(path) == extension;
    }

    template<class Extensions>
    static bool is_any_extension(ustrview path, const Extensions& extensions)
    {
        fail_if_null_byte_present(path);
        if (extensions.size() == 0)
            return index_of_extension(path) == -1;

        ustring fileExt = get_extension(path);
        for (const auto& extension : extensions)
            if (fileExt == ustrview{extension})
                return true;
        return false;
    }

    bool is_extension(ustrview path, std::initializer_list<ustrview> extensions)
    {
        return is_any_extension(path, extensions);
    }
    bool is_extension(ustrview path, const std::vector<ustring>& extensions)
    {
        return is_any_extension(path, extensions);
    }

    bool directory_contains(ustrview canonicalParent, ustrview canonicalChild)
    {
        if (canonicalParent.empty() || canonicalChild.empty())
            return false;
        if (check_equals(canonicalParent, canonicalChild, IOCase::System))
            return false;

        // "/foo" must not contain "/foobar"
        const char16_t separator = canonicalParent[0] == UNIX_SEPARATOR ? UNIX_SEPARATOR : WINDOWS_SEPARATOR;
        ustring parent = canonicalParent.to_string();
        if (parent.back() != separator)
            parent.push_back(separator);

        return is_case_sensitive(IOCase::System)
            ? canonicalChild.starts_with(parent)
            : canonicalChild.starts_withi(parent);
    }

} // namespace rpath
