#include <rpath/debugging.h>
#include <rpath/strview.h>
#include <rpath/tests.h>
#include <cstdarg>
using namespace rpath;

static std::string log_output;

#define STRINGIZE(x) STRINGIZE2(x)
#define STRINGIZE2(x) #x
#define LINE_STR STRINGIZE(__LINE__)

struct log_counter
{
    int messages = 0;
    LogSeverity last = LogSeverityInfo;

    static void handler(void* context, LogSeverity severity, const char*, int)
    {
        auto* self = static_cast<log_counter*>(context);
        ++self->messages;
        self->last = severity;
    }
};

// stands in for rpath::test and keeps the AssertMsg text
struct assert_message_capture
{
    std::string message;

    void assert_failed(const char* file, int line, const char* fmt, ...)
    {
        (void)file; (void)line;
        char buf[512];
        va_list ap; va_start(ap, fmt);
        vsnprintf(buf, sizeof(buf), fmt, ap);
        va_end(ap);
        message = buf;
    }

    void expect_first_index(strview fsName, ustrview path, size_t index)
    {
        AssertMsg(index == 0, "%s '%s' at %zu", fsName, path, index);
    }

    void expect_nonempty(ustrview path)
    {
        AssertMsg(!path.empty(), "empty path");
    }
};

TestImpl(test_debugging)
{
    LogSeverity defaultFilter = GetLogSeverityFilter();

    TestInit(test_debugging)
    {
        SetLogSeverityFilter(LogSeverityInfo); // QUIETLOG builds filter out LogInfo
        SetLogHandler([](LogSeverity severity, const char* message, int len)
        {
            (void)severity;
            log_output = std::string{message, message+len};
        });
    }

    TestCleanup()
    {
        SetLogHandler(nullptr);
        SetLogSeverityFilter(defaultFilter);
    }

    TestCase(debug_api)
    {
        std::string a = "string";
        rpath::strview b = "strview";
        int   c = 42;
        float d = 42.0f;
        char  e = '4';

        log_output.clear();

        LogInfo("Log(0)");
        AssertThat(log_output, "$ Log(0)");

        LogInfo("Log(1): '%s'", a);
        AssertThat(log_output, "$ Log(1): 'string'");

        LogInfo("Log(2): '%s', '%s'", a, b);
        AssertThat(log_output, "$ Log(2): 'string', 'strview'");

        LogInfo("Log(3): '%s', '%s', %d", a, b, c);
        AssertThat(log_output, "$ Log(3): 'string', 'strview', 42");

        LogInfo("Log(4): '%s', '%s', %d, %.1f", a, b, c, d);
        AssertThat(log_output, "$ Log(4): 'string', 'strview', 42, 42.0");

        LogInfo("Log(5): '%s', '%s', %d, %.1f, `%c`", a, b, c, d, e);
        AssertThat(log_output, "$ Log(5): 'string', 'strview', 42, 42.0, `4`");

        LogInfo("Log(8): '%s', '%s', %d, %.1f, `%c`, '%s', '%s', %d", a, b, c, d, e, a, b, c);
        AssertThat(log_output, "$ Log(8): 'string', 'strview', 42, 42.0, `4`, 'string', 'strview', 42");

    #ifndef QUIETLOG
        LogWarning("Warn(0):"); AssertThat(log_output, "test_debugging.cpp:" LINE_STR " test_debug_api $ Warn(0):");
        LogWarning("Warn(1): '%s'", a); AssertThat(log_output, "test_debugging.cpp:" LINE_STR " test_debug_api $ Warn(1): 'string'");
        LogWarning("Warn(2): '%s', '%s'", a, b); AssertThat(log_output, "test_debugging.cpp:" LINE_STR " test_debug_api $ Warn(2): 'string', 'strview'");
        LogWarning("Warn(3): '%s', '%s', %d", a, b, c); AssertThat(log_output, "test_debugging.cpp:" LINE_STR " test_debug_api $ Warn(3): 'string', 'strview', 42");
    #else
        LogWarning("Warn(1): '%s'", a); AssertThat(log_output, "$ Warn(1): 'string'");
    #endif
    }

    TestCase(utf16_arguments)
    {
        ustrview path = u"C:\\temp\\\u2605.txt";
        ustring name = u"\u00e9t\u00e9";

        LogInfo("path '%s' name '%s'", path, name);
        AssertThat(log_output, "$ path 'C:\\temp\\\xe2\x98\x85.txt' name '\xc3\xa9t\xc3\xa9'");
    }

    TestCase(severity_filter)
    {
        LogSeverity previous = GetLogSeverityFilter();
        SetLogSeverityFilter(LogSeverityError);

        log_output = "unchanged";
        LogInfo("info is filtered");
        LogWarning("warning is filtered");
        AssertThat(log_output, "unchanged");

        LogError("error passes");
        AssertTrue(strview{log_output}.contains("error passes"));

        SetLogSeverityFilter(previous);
        AssertThat(GetLogSeverityFilter(), previous);
    }

    TestCase(extra_log_handlers)
    {
        log_counter counter;
        add_log_handler(&counter, &log_counter::handler);
        LogInfo("first");
        LogWarning("second");
        remove_log_handler(&counter, &log_counter::handler);
        LogInfo("third");

        AssertThat(counter.messages, 2);
        AssertThat(counter.last, LogSeverityWarn);
        AssertThat(log_output, "$ third");
    }

    TestCase(throw_invalid_arg)
    {
        try
        {
            ThrowInvalidArg("bad value %d for '%s'", 42, u"name"_sv);
        }
        catch (const std::invalid_argument& e)
        {
            AssertThat(std::string{e.what()}, "bad value 42 for 'name'");
            return;
        }
        assert_failed(__FILE__, __LINE__, "ThrowInvalidArg did not throw");
    }

    TestCase(assert_message_arguments)
    {
        assert_message_capture capture;
        capture.expect_first_index("Windows", u"C:\\x"_sv, 3);
        AssertThat(capture.message, "index == 0 $ Windows 'C:\\x' at 3");

        capture.message.clear();
        capture.expect_first_index("Windows", u"C:\\x"_sv, 0);
        AssertThat(capture.message, "");

        capture.expect_nonempty(ustrview{});
        AssertThat(capture.message, "!path.empty() $ empty path");
    }

    TestCaseExpectedEx(must_throw, std::runtime_error)
    {
        throw std::runtime_error{"This error is expected"};
    }

    TestCase(assert_throws)
    {
        AssertThrows(throw std::runtime_error{"error!"}, std::runtime_error);
    }
};
