#pragma once
#include <rpath/strview.h>

// single characters by their UTF-8 size
static const rpath::ustrview CHAR_1B = u"a";
static const rpath::ustrview CHAR_2B = u"\u00E9";   // e acute
static const rpath::ustrview CHAR_3B = u"\u2605";   // black star
static const rpath::ustrview CHAR_4B = u"\U0001F600"; // grinning face, a surrogate pair

// woman with light skin and red hair, ZWJ, man, ZWJ, girl, ZWJ, boy:
// 69 UTF-8 bytes and 31 UTF-16 code units
static const rpath::ustrview FAMILY_69B =
    u"\U0001F469\U0001F3FB\u200D\U0001F9B0"
    u"\u200D"
    u"\U0001F468\U0001F3FF\u200D\U0001F9B2"
    u"\u200D"
    u"\U0001F467\U0001F3FD\u200D\U0001F9B1"
    u"\u200D"
    u"\U0001F466\U0001F3FC\u200D\U0001F9B3";

inline rpath::ustring repeat(rpath::ustrview s, int count)
{
    rpath::ustring result;
    result.reserve(size_t(s.len * count));
    for (int i = 0; i < count; ++i)
        result.append(s.str, size_t(s.len));
    return result;
}

inline rpath::ustring cat(rpath::ustrview a, rpath::ustrview b)
{
    rpath::ustring result = a.to_string();
    result.append(b.str, size_t(b.len));
    return result;
}

// 255 UTF-8 bytes each
inline rpath::ustring name_255_bytes_1b() { return repeat(CHAR_1B, 255); }
inline rpath::ustring name_255_bytes_2b() { return cat(repeat(CHAR_2B, 127), CHAR_1B); }
inline rpath::ustring name_255_bytes_3b() { return repeat(CHAR_3B, 85); }
inline rpath::ustring name_255_bytes_4b() { return cat(repeat(CHAR_4B, 63), CHAR_3B); }

// 255 UTF-16 code units each
inline rpath::ustring name_255_units_1b() { return repeat(CHAR_1B, 255); }
inline rpath::ustring name_255_units_2b() { return repeat(CHAR_2B, 255); }
inline rpath::ustring name_255_units_3b() { return repeat(CHAR_3B, 255); }
inline rpath::ustring name_255_units_4b() { return cat(repeat(CHAR_4B, 127), CHAR_3B); }
