#include <rpath/path_prefix.h>
#include <rpath/tests.h>
using namespace rpath;

TestImpl(test_path_prefix)
{
    TestInit(test_path_prefix)
    {
    }

    TestCase(invalid_prefixes)
    {
        AssertThat(prefix_length(u":"), INVALID_PREFIX);
        AssertThat(prefix_length(u"1:\\a\\b\\c.txt"), INVALID_PREFIX);
        AssertThat(prefix_length(u"1:"), INVALID_PREFIX);
        AssertThat(prefix_length(u"1:a"), INVALID_PREFIX);
        AssertThat(prefix_length(u"\\\\\\a\\b\\c.txt"), INVALID_PREFIX);
        AssertThat(prefix_length(u"\\\\a"), INVALID_PREFIX);
        AssertThat(prefix_length(u"///a/b/c.txt"), INVALID_PREFIX);
    }

    TestCase(short_inputs)
    {
        AssertThat(prefix_length(u""), 0);
        AssertThat(prefix_length(u"\\"), 1);
        AssertThat(prefix_length(u"/"), 1);
        AssertThat(prefix_length(u"a"), 0);
        AssertThat(prefix_length(u"C:"), 2);
        AssertThat(prefix_length(u"C:\\"), 3);
        AssertThat(prefix_length(u"//server/"), 9);
    }

    TestCase(home_directories)
    {
        AssertThat(prefix_length(u"~"), 2); // virtual
        AssertThat(prefix_length(u"~/"), 2);
        AssertThat(prefix_length(u"~user"), 6); // virtual
        AssertThat(prefix_length(u"~user/"), 6);
        AssertThat(prefix_length(u"~user/x"), 6);
        AssertThat(prefix_length(u"~/a/b/c.txt"), 2);
        AssertThat(prefix_length(u"~\\a\\b\\c.txt"), 2);
        AssertThat(prefix_length(u"~user/a/b/c.txt"), 6);
        AssertThat(prefix_length(u"~user\\a\\b\\c.txt"), 6);
    }

    TestCase(windows_paths)
    {
        AssertThat(prefix_length(u"a\\b\\c.txt"), 0);
        AssertThat(prefix_length(u"a\\b"), 0);
        AssertThat(prefix_length(u"\\a\\b\\c.txt"), 1);
        AssertThat(prefix_length(u"C:a\\b\\c.txt"), 2);
        AssertThat(prefix_length(u"C:\\a\\b\\c.txt"), 3);
        AssertThat(prefix_length(u"C:\\a\\b"), 3);
        AssertThat(prefix_length(u"c:/a/b/c.txt"), 3);
        AssertThat(prefix_length(u"\\\\server\\a\\b\\c.txt"), 9);
    }

    TestCase(unix_paths)
    {
        AssertThat(prefix_length(u"a/b/c.txt"), 0);
        AssertThat(prefix_length(u"/a/b/c.txt"), 1);
        AssertThat(prefix_length(u"C:/a/b/c.txt"), 3);
        AssertThat(prefix_length(u"//server/a/b/c.txt"), 9);
        AssertThat(prefix_length(u"/:foo"), 1);
        AssertThat(prefix_length(u"/:/"), 1);
        AssertThat(prefix_length(u"/:::::::.txt"), 1);
    }

    TestCase(unc_host_names)
    {
        AssertThat(prefix_length(u"\\\\127.0.0.1\\a\\b\\c.txt"), 12);
        AssertThat(prefix_length(u"\\\\::1\\a\\b\\c.txt"), 6);
        AssertThat(prefix_length(u"\\\\server.example.org\\a\\b\\c.txt"), 21);
        AssertThat(prefix_length(u"\\\\server.\\a\\b\\c.txt"), 10);

        AssertThat(prefix_length(u"\\\\-server\\a\\b\\c.txt"), INVALID_PREFIX);
        AssertThat(prefix_length(u"\\\\.\\a\\b\\c.txt"), INVALID_PREFIX);
        AssertThat(prefix_length(u"\\\\..\\a\\b\\c.txt"), INVALID_PREFIX);
        AssertThat(prefix_length(u"//../foo"), INVALID_PREFIX);
    }

    TestCase(utf8_input)
    {
        AssertThat(prefix_length("C:\\a\\b"), 3);
        AssertThat(prefix_length("~user/x"), 6);
        AssertThat(prefix_length(""), 0);
        AssertThat(prefix_length(strview{"\xff\xfe/a", 4}), INVALID_PREFIX);
    }

    TestCase(ipv4_addresses)
    {
        AssertTrue(is_ipv4_address(u"127.0.0.1"));
        AssertTrue(is_ipv4_address(u"0.0.0.0"));
        AssertTrue(is_ipv4_address(u"255.255.255.255"));
        AssertFalse(is_ipv4_address(u"127.0.0.256"));
        AssertFalse(is_ipv4_address(u"127.0.0.01"));
        AssertFalse(is_ipv4_address(u"127.0..1"));
        AssertFalse(is_ipv4_address(u"127.0.0"));
        AssertFalse(is_ipv4_address(u"1.2.3.4.5"));
        AssertFalse(is_ipv4_address(u"1.2.3.a"));
        AssertFalse(is_ipv4_address(u""));
    }

    TestCase(ipv6_addresses)
    {
        AssertTrue(is_ipv6_address(u"::1"));
        AssertTrue(is_ipv6_address(u"1::"));
        AssertTrue(is_ipv6_address(u"::"));
        AssertTrue(is_ipv6_address(u"1:2:3:4:5:6:7:8"));
        AssertTrue(is_ipv6_address(u"fe80::abcd:EF01"));
        AssertTrue(is_ipv6_address(u"1::127.0.0.1"));
        AssertTrue(is_ipv6_address(u"1:2:3:4:5:6:127.0.0.1"));

        AssertFalse(is_ipv6_address(u"::1::2"));
        AssertFalse(is_ipv6_address(u":1"));
        AssertFalse(is_ipv6_address(u"1:"));
        AssertFalse(is_ipv6_address(u"1:2:3:4:5:6:7:8:9"));
        AssertFalse(is_ipv6_address(u"g:2:3:4:5:6:7:8"));
        AssertFalse(is_ipv6_address(u"1ffff:2:3:4:5:6:7:8"));
        AssertFalse(is_ipv6_address(u"1:2"));
        AssertFalse(is_ipv6_address(u"+1::2"));
        AssertFalse(is_ipv6_address(u"1::256.0.0.1"));
    }

    TestCase(reg_names)
    {
        AssertTrue(is_reg_name(u"server"));
        AssertTrue(is_reg_name(u"server.example.org"));
        AssertTrue(is_reg_name(u"server."));
        AssertTrue(is_reg_name(u"my-server1"));
        AssertTrue(is_reg_name(u"127.0.0.256"));
        AssertFalse(is_reg_name(u"-server"));
        AssertFalse(is_reg_name(u"."));
        AssertFalse(is_reg_name(u".."));
        AssertFalse(is_reg_name(u"server..org"));
        AssertFalse(is_reg_name(u"under_score"));

        AssertTrue(is_valid_host_name(u"127.0.0.01")); // as a reg-name
        AssertFalse(is_valid_host_name(u"127.0..1"));
    }

    TestCase(parse_prefix_kinds)
    {
        auto kind_of = [](ustrview path) { return parse_prefix(path)->kind; };
        auto length_of = [](ustrview path) { return parse_prefix(path)->length; };

        AssertThat(kind_of(u""), PrefixKind::Relative);
        AssertThat(length_of(u""), 0);
        AssertThat(kind_of(u"a/b"), PrefixKind::Relative);

        AssertThat(kind_of(u"~"), PrefixKind::HomeCurrentUser);
        AssertThat(length_of(u"~"), 2);
        AssertThat(kind_of(u"~/x"), PrefixKind::HomeCurrentUser);
        AssertThat(length_of(u"~/x"), 2);
        AssertThat(kind_of(u"~user"), PrefixKind::HomeNamedUser);
        AssertThat(length_of(u"~user"), 6);
        AssertThat(kind_of(u"~user/x"), PrefixKind::HomeNamedUser);

        AssertThat(kind_of(u"C:"), PrefixKind::DriveRelative);
        AssertThat(kind_of(u"C:a"), PrefixKind::DriveRelative);
        AssertThat(length_of(u"C:a"), 2);
        AssertThat(kind_of(u"C:\\a"), PrefixKind::DriveAbsolute);
        AssertThat(length_of(u"C:\\a"), 3);

        AssertThat(kind_of(u"/:"), PrefixKind::RootAbsolute);
        AssertThat(length_of(u"/:"), 1);
        AssertThat(kind_of(u"/x"), PrefixKind::RootAbsolute);
        AssertThat(kind_of(u"//host/x"), PrefixKind::Unc);
        AssertThat(length_of(u"//host/x"), 7);

        AssertFalse(parse_prefix(u":").has_value());
        AssertFalse(parse_prefix(u"//../x").has_value());
    }

    TestCase(virtual_prefix)
    {
        AssertTrue(parse_prefix(u"~")->is_virtual(1));
        AssertTrue(parse_prefix(u"~user")->is_virtual(5));
        AssertFalse(parse_prefix(u"~user/")->is_virtual(6));
        AssertFalse(parse_prefix(u"C:")->is_virtual(2));
    }
};
