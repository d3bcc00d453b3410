#include "legalizer.h"
#include "sprint.h"
#include "debugging.h"

namespace rpath
{
    static bool has_illegal_code_point(ustrview name, const filesystem_profile& fs) noexcept
    {
        for (int i = 0; i < name.len; )
            if (fs.is_illegal_code_point(next_code_point(name, i)))
                return true;
        return false;
    }

    bool is_legal_file_name(ustrview candidate, const filesystem_profile& fs, const charset& cs) noexcept
    {
        if (candidate.empty())
            return false;
        if (!fs.length_strategy().fits(candidate, fs.max_name_length(), cs))
            return false;
        if (fs.is_reserved_name(candidate))
            return false;
        return !has_illegal_code_point(candidate, fs);
    }

    bool is_legal_file_name(ustrview candidate, const filesystem_profile& fs) noexcept
    {
        return is_legal_file_name(candidate, fs, charset::default_charset());
    }

    bool is_legal_file_name(strview candidate, const filesystem_profile& fs, const charset& cs)
    {
        bool ok;
        ustring name = to_ustring(candidate, &ok);
        return ok && is_legal_file_name(ustrview{name}, fs, cs);
    }

    ////////////////////////////////////////////////////////////////////////////////

    // "'_'" or "'\0'" or "U+2603"
    static void write_code_point(string_buffer& sb, char32_t cp)
    {
        if (cp == 0) sb.write("'\\0'");
        else         sb.write(cp);
    }

    static std::string illegal_code_points_str(const filesystem_profile& fs)
    {
        string_buffer sb;
        sb.write('[');
        bool first = true;
        for (char32_t cp : fs.illegal_code_points())
        {
            if (!first) sb.write(", ");
            sb.write(uint(cp));
            first = false;
        }
        sb.write(']');
        return sb.str();
    }

    static ustring replace_illegal(ustrview name, char32_t replacement, const filesystem_profile& fs)
    {
        ustring result;
        result.reserve(size_t(name.len));
        for (int i = 0; i < name.len; )
        {
            int start = i;
            char32_t cp = next_code_point(name, i);
            if (fs.is_illegal_code_point(cp))
                append_code_point(result, replacement);
            else
                result.append(name.str + start, size_t(i - start));
        }
        return result;
    }

    ustring to_legal_file_name(ustrview candidate, char32_t replacement,
                               const filesystem_profile& fs, const charset& cs)
    {
        if (candidate.empty())
            ThrowInvalidArg("The candidate file name is empty");

        if (replacement > MAX_CODE_POINT || (MIN_HIGH_SURROGATE <= replacement && replacement <= MAX_LOW_SURROGATE))
            ThrowInvalidArg("The replacement U+%04X is not a valid code point", uint(replacement));

        if (fs.is_illegal_code_point(replacement))
        {
            string_buffer sb;
            write_code_point(sb, replacement);
            std::string illegal = illegal_code_points_str(fs);
            ThrowInvalidArg("The replacement character %s cannot be one of the %s illegal characters: %s",
                            sb.str(), fs.name(), illegal);
        }

        const name_length_strategy strategy = fs.length_strategy();
        const int limit = fs.max_name_length();

        ustring legal = replace_illegal(strategy.truncate(candidate, limit, cs), replacement, fs);
        if (!strategy.fits(legal, limit, cs))
        {
            LogWarning("replacement U+%04X grew '%s' over the %d %s limit of %s, truncating again",
                       uint(replacement), legal, limit, strategy.unit_name(), fs.name());
            legal = strategy.truncate(legal, limit, cs);
        }
        return legal;
    }

    ustring to_legal_file_name(ustrview candidate, char32_t replacement, const filesystem_profile& fs)
    {
        return to_legal_file_name(candidate, replacement, fs, charset::default_charset());
    }

} // namespace rpath
