#include <rpath/strview.h>
#include <rpath/tests.h>
using namespace rpath;

static int view_width(strview)  { return 8; }
static int view_width(ustrview) { return 16; }

static_assert(!std::is_convertible_v<bool, strview>,  "bool must not turn into a strview");
static_assert(!std::is_convertible_v<bool, ustrview>, "bool must not turn into a ustrview");
static_assert(!std::is_convertible_v<char, strview>,  "char must not turn into a strview");

TestImpl(test_strview)
{
    TestInit(test_strview)
    {
    }

    TestCase(basic_init)
    {
        strview str = "hello";
        AssertThat(str.length(), 5);
        AssertThat(str, "hello");
        AssertNotEqual(str, "heihi");
        AssertThat(str[0], 'h');
        AssertThat(str[4], 'o');

        std::string stdstr = "hello";
        strview str2 = stdstr;
        AssertThat(str2, str);
        AssertThat(str2.to_string(), stdstr);
        AssertTrue(strview{}.empty());
    }

    TestCase(strview_search)
    {
        strview str = "C:\\Windows\\system32";
        AssertThat(str.find("Windows"), 3);
        AssertThat(str.find("linux"), -1);
        AssertTrue(str.contains("system"));
        AssertTrue(str.starts_with("C:"));
        AssertFalse(str.starts_with("c:"));
        AssertTrue(str.starts_withi("c:\\windows"));
        AssertTrue(strview{"WINDOWS"}.equalsi("windows"));
        AssertFalse(strview{"WINDOWS"}.equalsi("window"));
        AssertTrue(str.starts_with(""));
    }

    TestCase(ustrview_init)
    {
        ustrview str = u"a/b/c.txt";
        AssertThat(str.length(), 9);
        AssertThat(str, u"a/b/c.txt");
        AssertThat(str.back(), u't');

        ustring owned = str.to_string();
        AssertThat(ustrview{owned}, str);
        AssertThat(owned, str);

        const char16_t withNull[] = { u'a', 0, u'b' };
        ustrview nul { withNull, 3 };
        AssertThat(nul.length(), 3);
        AssertTrue(nul.contains(u'\0'));
    }

    TestCase(ustrview_search)
    {
        ustrview str = u"/foo/bar.tar.gz";
        AssertThat(str.find(u'/'), 0);
        AssertThat(str.find(u'/', 1), 4);
        AssertThat(str.rfind(u'.'), 12);
        AssertThat(str.rfind(u'x'), -1);
        AssertThat(str.find(u"bar"_sv), 5);
        AssertThat(str.find(u"bar"_sv, 6), -1);
        AssertThat(str.substr(5), u"bar.tar.gz");
        AssertThat(str.substr(5, 3), u"bar");
        AssertTrue(str.starts_with(u"/foo"));
        AssertTrue(str.ends_with(u".gz"));
        AssertFalse(str.ends_with(u"/foo"));
    }

    TestCase(ustrview_ignore_case)
    {
        AssertTrue(ustrview{u"File.TXT"}.equalsi(u"file.txt"));
        AssertFalse(ustrview{u"File.TXT"}.equalsi(u"file.txt2"));
        AssertTrue(ustrview{u"C:\\Foo\\bar"}.starts_withi(u"c:\\foo\\"));
        AssertFalse(ustrview{u"C:\\Foo"}.starts_withi(u"c:\\foo\\"));
        // only ASCII letters fold
        AssertFalse(ustrview{u"\u00c9"}.equalsi(u"\u00e9"));
    }

    TestCase(ustrview_ordering)
    {
        AssertLess(ustrview{u"AUX"}.compare(u"CON"), 0);
        AssertGreater(ustrview{u"CONIN$"}.compare(u"CON"), 0);
        AssertThat(ustrview{u"CON"}.compare(u"CON"), 0);
        AssertTrue(ustrview{u"COM9"} < ustrview{u"COM\u00b2"});
        AssertFalse(ustrview{u"\uFFFF"} < ustrview{u"\U0001F600"}); // code unit order
    }

    TestCase(code_points)
    {
        ustrview text = u"a\u00e9\U0001F600";
        int i = 0;
        AssertThat(next_code_point(text, i), U'a');
        AssertThat(i, 1);
        AssertThat(next_code_point(text, i), U'\u00e9');
        AssertThat(i, 2);
        AssertThat(next_code_point(text, i), U'\U0001F600');
        AssertThat(i, 4);

        const char16_t lone[] = { 0xD83D, u'x' };
        int j = 0;
        AssertThat(next_code_point(ustrview{lone, 2}, j), char32_t(0xD83D));
        AssertThat(j, 1);

        ustring out;
        append_code_point(out, U'a');
        append_code_point(out, U'\U0001F600');
        AssertThat(out, u"a\U0001F600");
    }

    TestCase(malformed_utf16)
    {
        const char16_t highOnly[] = { u'a', 0xD800 };
        const char16_t lowFirst[] = { 0xDC00, 0xD800 };
        AssertThat(index_of_malformed_utf16(u"plain \U0001F600"), -1);
        AssertThat(index_of_malformed_utf16(ustrview{highOnly, 2}), 1);
        AssertThat(index_of_malformed_utf16(ustrview{lowFirst, 2}), 0);
        AssertTrue(is_valid_utf16(u""));
        AssertFalse(is_valid_utf16(ustrview{highOnly, 2}));
    }

    TestCase(utf_conversions)
    {
        bool ok = false;
        AssertThat(to_string(u"\u2605.txt", &ok), "\xe2\x98\x85.txt");
        AssertTrue(ok);
        AssertThat(to_ustring("\xf0\x9f\x98\x80", &ok), u"\U0001F600");
        AssertTrue(ok);

        ustring bad = to_ustring(strview{"\xff\xfe", 2}, &ok);
        AssertFalse(ok);
        AssertTrue(bad.empty());

        const char16_t lone[] = { 0xD800 };
        (void)to_string(ustrview{lone, 1}, &ok);
        AssertFalse(ok);
    }

    TestCase(overloads_pick_the_view_width)
    {
        std::string utf8 = "a";
        ustring utf16 = u"a";
        AssertThat(view_width("a"), 8);
        AssertThat(view_width(u"a"), 16);
        AssertThat(view_width(utf8), 8);
        AssertThat(view_width(utf16), 16);
        AssertThat(view_width(strview{}), 8);
        AssertThat(view_width(ustrview{}), 16);
    }

    TestCase(conversions_may_throw_bad_alloc)
    {
        AssertFalse(noexcept(to_string(ustrview{})));
        AssertFalse(noexcept(to_ustring(strview{})));
        AssertTrue(noexcept(is_valid_utf16(ustrview{})));
    }
};
