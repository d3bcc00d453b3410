#pragma once
/**
 * Path normalization and filename utilities, Copyright (c) 2024, RePath authors
 * Distributed under MIT Software License
 */
#include "path_prefix.h"
#include <optional>
#include <stdexcept>
#include <initializer_list>
#include <vector>

namespace rpath
{
    using std::string;

    /**
     * @brief Thrown when a path contains an embedded NUL character.
     *        There are no legitimate uses for such paths, but injection attacks use them.
     */
    class RPATHAPI unsanitized_path_error : public std::invalid_argument
    {
    public:
        using std::invalid_argument::invalid_argument;
    };

    constexpr char16_t EXTENSION_SEPARATOR = u'.';

    ////////////////////////////////////////////////////////////////////////////////

    /**
     * @brief Normalizes a path, removing double and single dot segments
     *        and duplicate separators. Both separator conventions are accepted,
     *        and the output uses the requested one.
     *        A trailing separator is kept if the input had one.
     *
     * @note Does not touch the file system, so symbolic links are not resolved.
     * @throws unsanitized_path_error if `path` contains a NUL character
     *
     * @result /foo//               ==> /foo/
     * @result /foo/./              ==> /foo/
     * @result /foo/../bar          ==> /bar
     * @result /foo/../bar/         ==> /bar/
     * @result /foo/../bar/../baz   ==> /baz
     * @result //foo//./bar         ==> //foo/bar
     * @result /../                 ==> nullopt
     * @result ../foo               ==> nullopt
     * @result foo/bar/..           ==> foo/
     * @result foo/../../bar        ==> nullopt
     * @result foo/../bar           ==> bar
     * @result //server/foo/../bar  ==> //server/bar
     * @result //server/../bar      ==> nullopt
     * @result C:\\foo\\..\\bar     ==> C:\\bar
     * @result C:\\..\\bar          ==> nullopt
     * @result ~/foo/../bar/        ==> ~/bar/
     * @result ~/../bar             ==> nullopt
     *
     * @param unixSeparator If TRUE, output uses `/`, otherwise `\\`
     * @returns Normalized path, or nullopt if the prefix is invalid or
     *          a double dot would step above the prefix
     */
    RPATHAPI std::optional<ustring> normalize(ustrview path, bool unixSeparator);

    /** @brief Normalizes a path using the system separator, see normalize(path, unixSeparator) */
    RPATHAPI std::optional<ustring> normalize(ustrview path);

    /**
     * @brief Same as normalize(), except the trailing separator is always removed
     * @result /foo/../bar/ ==> /bar
     * @result foo/bar/..   ==> foo
     */
    RPATHAPI std::optional<ustring> normalize_no_end_separator(ustrview path, bool unixSeparator);
    RPATHAPI std::optional<ustring> normalize_no_end_separator(ustrview path);

    /**
     * @brief Appends `pathToAdd` to `basePath` and normalizes the result.
     *        If `pathToAdd` is absolute (has a prefix), it replaces `basePath`.
     *
     * @result /foo/ + bar        ==> /foo/bar
     * @result /foo  + bar        ==> /foo/bar
     * @result /foo  + /bar       ==> /bar
     * @result /foo  + C:/bar     ==> C:/bar
     * @result /foo/a/ + ../bar   ==> /foo/bar
     * @result /foo/ + ../../bar  ==> nullopt
     *
     * @returns Concatenated normalized path, or nullopt if either part is invalid
     */
    RPATHAPI std::optional<ustring> concat(ustrview basePath, ustrview pathToAdd);

    /**
     * UTF-8 variants. Input that is not valid UTF-8 is logged and returns nullopt.
     */
    RPATHAPI std::optional<string> normalize(strview path, bool unixSeparator);
    RPATHAPI std::optional<string> normalize(strview path);
    RPATHAPI std::optional<string> normalize_no_end_separator(strview path, bool unixSeparator);
    RPATHAPI std::optional<string> normalize_no_end_separator(strview path);
    RPATHAPI std::optional<string> concat(strview basePath, strview pathToAdd);

    ////////////////////////////////////////////////////////////////////////////////

    /**
     * @brief Gets the prefix of a path, eg `C:/` or `~/`.
     *        A home prefix without its separator gets one appended.
     * @result C:\\a\\b    ==> C:\\
     * @result ~user       ==> ~user/
     * @result a/b/c.txt   ==> ""
     * @result 1:/a        ==> nullopt
     */
    RPATHAPI std::optional<ustring> get_prefix(ustrview path);

    /**
     * @brief Gets the directory part of a path, without the prefix,
     *        including the trailing separator.
     * @result C:\\a\\b\\c.txt ==> a\\b\\
     * @result ~/a/b/c.txt     ==> a/b/
     * @result a.txt           ==> ""
     * @result a/b/c           ==> a/b/
     * @result a/b/c/          ==> a/b/c/
     */
    RPATHAPI std::optional<ustring> get_path(ustrview path);

    /**
     * @brief Same as get_path(), but without the trailing separator
     * @result a/b/c/ ==> a/b/c
     */
    RPATHAPI std::optional<ustring> get_path_no_end_separator(ustrview path);

    /**
     * @brief Gets the directory part of a path, including the prefix
     *        and the trailing separator.
     * @result C:\\a\\b\\c.txt ==> C:\\a\\b\\
     * @result ~/a/b/c.txt     ==> ~/a/b/
     * @result a.txt           ==> ""
     * @result C:              ==> C:
     * @result ~               ==> ~/
     */
    RPATHAPI std::optional<ustring> get_full_path(ustrview path);
    RPATHAPI std::optional<ustring> get_full_path_no_end_separator(ustrview path);

    /**
     * @result a/b/c.txt ==> c.txt
     * @result a/b/c     ==> c
     * @result a/b/c/    ==> ""
     */
    RPATHAPI ustring get_name(ustrview path);

    /**
     * @result a/b/c.txt ==> c
     * @result a/b/c/    ==> ""
     */
    RPATHAPI ustring get_base_name(ustrview path);

    /**
     * @result foo.txt      ==> txt
     * @result a/b/c.jpg    ==> jpg
     * @result a/b.txt/c    ==> ""
     * @result a/b/c        ==> ""
     * @throws std::invalid_argument on Windows if the name has an NTFS stream separator `:`
     */
    RPATHAPI ustring get_extension(ustrview path);

    /**
     * @result a/b/c.txt ==> a/b/c
     * @result a.b/c     ==> a.b/c
     */
    RPATHAPI ustring remove_extension(ustrview path);

    /** @returns Index of the last `/` or `\\`, or -1 */
    RPATHAPI int index_of_last_separator(ustrview path) noexcept;

    /**
     * @returns Index of the extension dot in the file name part, or -1
     * @throws std::invalid_argument on Windows if the name has an NTFS stream separator `:`
     */
    RPATHAPI int index_of_extension(ustrview path);

    RPATHAPI ustring separators_to_unix(ustrview path);
    RPATHAPI ustring separators_to_windows(ustrview path);
    RPATHAPI ustring separators_to_system(ustrview path);

    ////////////////////////////////////////////////////////////////////////////////

    enum class IOCase
    {
        Sensitive,
        Insensitive,
        System, // insensitive on Windows, sensitive elsewhere
    };

    RPATHAPI bool is_case_sensitive(IOCase ioCase) noexcept;

    /**
     * @brief Compares two paths
     * @param normalized If TRUE, both paths are normalized first.
     *                   Paths that fail to normalize are never equal.
     */
    RPATHAPI bool equals(ustrview path1, ustrview path2, bool normalized = false, IOCase ioCase = IOCase::Sensitive);

    inline bool equals_on_system(ustrview path1, ustrview path2)
    {
        return equals(path1, path2, false, IOCase::System);
    }
    inline bool equals_normalized(ustrview path1, ustrview path2)
    {
        return equals(path1, path2, true, IOCase::Sensitive);
    }
    inline bool equals_normalized_on_system(ustrview path1, ustrview path2)
    {
        return equals(path1, path2, true, IOCase::System);
    }

    /**
     * @brief Checks the extension of the file name. Comparison is case-sensitive.
     * @param extension Extension without the dot. Empty checks for "no extension".
     */
    RPATHAPI bool is_extension(ustrview path, ustrview extension);
    RPATHAPI bool is_extension(ustrview path, std::initializer_list<ustrview> extensions);
    RPATHAPI bool is_extension(ustrview path, const std::vector<ustring>& extensions);

    /**
     * @brief Checks whether a canonical directory path contains a canonical child path,
     *        using the system case rules. A directory does not contain itself.
     * @note Paths are compared as strings. Use normalized paths.
     */
    RPATHAPI bool directory_contains(ustrview canonicalParent, ustrview canonicalChild);

} // namespace rpath
