#include <rpath/charset.h>
#include <rpath/tests.h>
using namespace rpath;

TestImpl(test_charset)
{
    TestInit(test_charset)
    {
    }

    TestCase(names_and_lookup)
    {
        AssertThat(charset::utf8().name(), "UTF-8");
        AssertThat(charset::us_ascii().name(), "US-ASCII");
        AssertThat(charset::iso_8859_1().name(), "ISO-8859-1");
        AssertThat(charset::utf16le().name(), "UTF-16LE");
        AssertThat(charset::utf16be().name(), "UTF-16BE");
        AssertThat(charset::default_charset().encoding(), Encoding::Utf8);

        AssertTrue(charset::for_name("utf-8") == &charset::utf8());
        AssertTrue(charset::for_name("UTF8") == &charset::utf8());
        AssertTrue(charset::for_name("ascii") == &charset::us_ascii());
        AssertTrue(charset::for_name("Latin1") == &charset::iso_8859_1());
        AssertTrue(charset::for_name("UTF-16") == &charset::utf16be());
        AssertTrue(charset::for_name("EBCDIC") == nullptr);
    }

    TestCase(code_point_lengths)
    {
        const charset& utf8 = charset::utf8();
        AssertThat(utf8.code_point_length(U'a'), 1);
        AssertThat(utf8.code_point_length(U'\u00e9'), 2);
        AssertThat(utf8.code_point_length(U'\u2605'), 3);
        AssertThat(utf8.code_point_length(U'\U0001F600'), 4);
        AssertThat(utf8.code_point_length(char32_t(0xD800)), -1);
        AssertThat(utf8.code_point_length(char32_t(0x110000)), -1);

        AssertThat(charset::us_ascii().code_point_length(U'\x7f'), 1);
        AssertThat(charset::us_ascii().code_point_length(U'\u00e9'), -1);
        AssertThat(charset::iso_8859_1().code_point_length(U'\u00ff'), 1);
        AssertThat(charset::iso_8859_1().code_point_length(U'\u0100'), -1);
        AssertThat(charset::utf16le().code_point_length(U'\u2605'), 2);
        AssertThat(charset::utf16be().code_point_length(U'\U0001F600'), 4);
    }

    TestCase(encoded_lengths)
    {
        const char16_t lone[] = { u'a', 0xDC00 };
        AssertThat(charset::utf8().encoded_length(u"a\u00e9\u2605\U0001F600"), 10);
        AssertThat(charset::utf8().encoded_length(ustrview{lone, 2}), -1);
        AssertThat(charset::us_ascii().encoded_length(u"plain.txt"), 9);
        AssertThat(charset::us_ascii().encoded_length(u"caf\u00e9"), -1);
        AssertThat(charset::iso_8859_1().encoded_length(u"caf\u00e9"), 4);
        AssertThat(charset::utf16le().encoded_length(u"a\U0001F600"), 6);

        AssertTrue(charset::iso_8859_1().can_encode(u"caf\u00e9"));
        AssertFalse(charset::iso_8859_1().can_encode(u"\u2605"));
        AssertFalse(charset::utf8().can_encode(ustrview{lone, 2}));
    }

    TestCase(encode_whole_strings)
    {
        bool ok = false;
        AssertThat(charset::utf8().encode(u"\u00e9\U0001F600", &ok), "\xc3\xa9\xf0\x9f\x98\x80");
        AssertTrue(ok);
        AssertThat(charset::iso_8859_1().encode(u"caf\u00e9", &ok), "caf\xe9");
        AssertTrue(ok);
        AssertThat(charset::utf16le().encode(u"A", &ok), std::string("A\0", 2));
        AssertThat(charset::utf16be().encode(u"A", &ok), std::string("\0A", 2));

        AssertThat(charset::us_ascii().encode(u"caf\u00e9", &ok), "");
        AssertFalse(ok);
    }

    TestCase(encode_stops_before_a_split_code_point)
    {
        ustrview input = u"ab\U0001F600c";
        char out[5];
        const char16_t* from = input.begin();
        char* to = out;

        AssertThat(charset::utf8().encode(from, input.end(), to, out + 5), CoderResult::Overflow);
        AssertThat(int(from - input.begin()), 2);
        AssertThat(int(to - out), 2);

        char big[16];
        from = input.begin();
        to = big;
        AssertThat(charset::utf8().encode(from, input.end(), to, big + 16), CoderResult::Underflow);
        AssertThat(int(to - big), 7);
    }

    TestCase(encode_reports_bad_input)
    {
        char out[16];
        const char16_t lone[] = { u'a', 0xD800, u'b' };
        const char16_t* from = lone;
        char* to = out;
        AssertThat(charset::utf8().encode(from, lone + 3, to, out + 16), CoderResult::Malformed);
        AssertThat(int(from - lone), 1);

        ustrview star = u"x\u2605";
        from = star.begin();
        to = out;
        AssertThat(charset::us_ascii().encode(from, star.end(), to, out + 16), CoderResult::Unmappable);
        AssertThat(int(from - star.begin()), 1);
        AssertThat(out[0], 'x');
    }
};
