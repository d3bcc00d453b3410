#include "name_length.h"
#include "debugging.h"
#include <vector>

namespace rpath
{
    int index_of_name_extension(ustrview name) noexcept
    {
        return name.find(u'.', 1); // a leading dot marks a hidden file, not an extension
    }

    int name_length_strategy::measure(ustrview name, const charset& cs) const noexcept
    {
        if (unit == LengthUnit::Utf16Units)
            return name.len;
        int bytes = cs.encoded_length(name);
        return bytes < 0 ? NAME_UNMEASURABLE : bytes;
    }

    static ustring join(ustrview base, ustrview extension)
    {
        ustring result;
        result.reserve(size_t(base.len + extension.len));
        result.append(base.str, size_t(base.len));
        result.append(extension.str, size_t(extension.len));
        return result;
    }

    static void fail_extension_too_long(ustrview extension, int extLength, int limit, strview unitName)
    {
        ThrowInvalidArg("File name extension '%s' of %d %s exceeds the limit of %d %s",
                        extension, extLength, unitName, limit, unitName);
    }

    static ustring truncate_utf16(ustrview name, int limit, strview unitName)
    {
        if (name.len <= limit)
            return name.to_string();

        int extStart = index_of_name_extension(name);
        ustrview base      = extStart == -1 ? name : name.substr(0, extStart);
        ustrview extension = extStart == -1 ? ustrview{} : name.substr(extStart);
        if (extension.len > limit)
            fail_extension_too_long(extension, extension.len, limit, unitName);

        int cut = limit - extension.len;
        if (cut > 0 && is_high_surrogate(base[cut - 1])) // never split a surrogate pair
            --cut;
        return join(base.substr(0, cut), extension);
    }

    static ustring truncate_bytes(ustrview name, int limit, const charset& cs)
    {
        if (!cs.can_encode(name))
        {
            ThrowInvalidArg("File name contains characters that cannot be encoded with charset %s",
                            cs.name());
        }

        // every code unit fits even in the worst case
        if (name.len <= limit / cs.max_bytes_per_char())
            return name.to_string();
        if (cs.encoded_length(name) <= limit)
            return name.to_string();

        int extStart = index_of_name_extension(name);
        ustrview base      = extStart == -1 ? name : name.substr(0, extStart);
        ustrview extension = extStart == -1 ? ustrview{} : name.substr(extStart);
        const int extBytes = cs.encoded_length(extension);
        if (extBytes > limit)
            fail_extension_too_long(extension, extBytes, limit, "bytes");

        std::vector<char> out(size_t(limit - extBytes));
        const char16_t* from = base.begin();
        char* to = out.data();
        CoderResult result = cs.encode(from, base.end(), to, out.data() + out.size());
        if (result == CoderResult::Malformed || result == CoderResult::Unmappable)
        {
            ThrowInvalidArg("File name contains characters that cannot be encoded with charset %s",
                            cs.name());
        }
        return join(base.substr(0, int(from - base.begin())), extension);
    }

    ustring name_length_strategy::truncate(ustrview name, int limit, const charset& cs) const
    {
        if (unit == LengthUnit::Utf16Units)
            return truncate_utf16(name, limit, unit_name());
        return truncate_bytes(name, limit, cs);
    }

} // namespace rpath
