#include "tests.h"
#include <cstdarg>
#include <cstdio>
#include <cstdlib> // std::exit

#ifdef _WIN32
#  include <io.h> // _isatty
#  define isatty _isatty
#  define fileno _fileno
#else
#  include <unistd.h> // isatty
#endif

namespace rpath
{
    ///////////////////////////////////////////////////////////////////////////

    struct registered_test
    {
        strview name;
        test_factory factory;
        strview case_filter; // selected cases, empty for all of them
        bool enabled = true;
    };

    static std::vector<registered_test>*& registered_tests_ptr()
    {
        static std::vector<registered_test>* tests = nullptr;
        return tests;
    }

    // the registry is allocated on first use, since suites register during static init
    static std::vector<registered_test>& registered_tests()
    {
        auto*& tests = registered_tests_ptr();
        if (!tests) tests = new std::vector<registered_test>{};
        return *tests;
    }

    void register_test(strview name, test_factory factory)
    {
        registered_tests().push_back(registered_test{ name, factory, {}, true });
    }

    static bool Verbose = false;

    ///////////////////////////////////////////////////////////////////////////

    struct test_failure
    {
        strview suite;
        strview testcase;
        std::string message;
        std::string file;
        int line;
    };

    struct test_results
    {
        int suites_run = 0;
        int suites_failed = 0;
        std::vector<test_failure> failures;
    };

    struct test::test_func
    {
        strview name;
        std::function<void()> func;
        size_t expectedExType = 0;
        bool success = false;
    };

    struct test::test_impl
    {
        std::vector<std::unique_ptr<test_func>> test_functions;
        test_results* current_results = nullptr;
        strview current_case;
    };

    ///////////////////////////////////////////////////////////////////////////

    test::test(strview name) : name{ name }
    {
        impl = new test_impl();
    }
    test::~test() noexcept
    {
        delete impl;
    }

    enum ConsoleColor { Default, Green, Yellow, Red, };

    static void consolef(ConsoleColor color, const char* fmt, ...) PRINTF_CHECKFMT2;
    static void consolef(ConsoleColor color, const char* fmt, ...)
    {
        static const bool stdoutIsAtty = isatty(fileno(stdout));
        static const bool stderrIsAtty = isatty(fileno(stderr));
        static constexpr const char* colors[] = { "\x1b[0m", "\x1b[32m", "\x1b[33m", "\x1b[31m" };

        FILE* out = (color == Red) ? stderr : stdout;
        bool colored = color != Default && ((color == Red) ? stderrIsAtty : stdoutIsAtty);

        if (colored) fputs(colors[color], out);
        va_list ap; va_start(ap, fmt);
        vfprintf(out, fmt, ap);
        va_end(ap);
        if (colored) fputs(colors[Default], out);
        fflush(out);
    }

    void test::assert_failed(const char* file, int line, const char* fmt, ...)
    {
        char msg[8192];
        va_list ap; va_start(ap, fmt);
        int len = vsnprintf(msg, sizeof(msg), fmt, ap);
        va_end(ap);
        if (len < 0 || len >= (int)sizeof(msg))
            len = (int)sizeof(msg) - 1;

        const char* filename = shorten_filename(file);
        if (Verbose)
            consolef(Red, "FAILED ASSERTION %12s:%d    %.*s\n", filename, line, len, msg);
        add_failure(filename, line, std::string{msg, msg + len});
    }

    void test::add_failure(const char* file, int line, std::string message)
    {
        if (!impl->current_results)
            return;
        impl->current_results->failures.push_back(
            test_failure{ name, impl->current_case, std::move(message), file, line });
    }

    bool test::run_init()
    {
        impl->current_case = "init";
        try
        {
            init_test();
            return true;
        }
        catch (const std::exception& e)
        {
            add_failure("", 0, std::string{"EXCEPTION in TestInit(): "} + e.what());
            return false;
        }
    }

    void test::run_cleanup()
    {
        impl->current_case = "cleanup";
        try
        {
            cleanup_test();
        }
        catch (const std::exception& e)
        {
            add_failure("", 0, std::string{"EXCEPTION in TestCleanup(): "} + e.what());
        }
    }

    bool test::run_test(test_results& results, strview caseFilter)
    {
        impl->current_results = &results;
        if (Verbose)
            consolef(Yellow, "--------  running '%s'  --------\n", name.str);

        int numRun = 0;
        int numFailed = 0;
        if (run_init())
        {
            for (auto& fn : impl->test_functions)
            {
                if (!caseFilter.empty() && !fn->name.contains(caseFilter))
                    continue;
                ++numRun;
                if (!run_test_func(*fn))
                    ++numFailed;
            }
            if (numRun == 0)
                consolef(Yellow, "No test cases matching '%.*s' in %s\n", caseFilter.len, caseFilter.str, name.str);
        }
        else
        {
            numFailed = 1;
        }
        run_cleanup();

        const bool allSuccess = numFailed == 0 && numRun > 0;
        if (allSuccess)
            consolef(Green, "TEST %-32s  %d/%d  [OK]\n", name.str, numRun, numRun);
        else
            consolef(Red,   "TEST %-32s  %d/%d  [FAILED]\n", name.str, numFailed, numRun);

        impl->current_results = nullptr;
        return allSuccess;
    }

    bool test::run_test_func(test_func& test)
    {
        if (Verbose)
            consolef(Default, "%s::%s\n", name.str, test.name.str);

        impl->current_case = test.name;
        size_t failuresBefore = impl->current_results->failures.size();
        try
        {
            test.func();
            if (test.expectedExType)
                add_failure("", 0, "expected EXCEPTION was NOT THROWN");
        }
        catch (const std::exception& e)
        {
            if (test.expectedExType != typeid(e).hash_code())
                add_failure("", 0, std::string{"EXCEPTION: "} + e.what());
        }
        test.success = impl->current_results->failures.size() == failuresBefore;
        return test.success;
    }

    int test::add_test_func(strview name, std::function<void()> fn, size_t expectedExHash)
    {
        auto func = std::make_unique<test_func>();
        func->name = name;
        func->func = std::move(fn);
        func->expectedExType = expectedExHash;
        impl->test_functions.emplace_back(std::move(func));
        return static_cast<int>(impl->test_functions.size()) - 1;
    }

    void test::cleanup_all_tests()
    {
        auto*& tests = registered_tests_ptr();
        delete tests;
        tests = nullptr;
    }

    ///////////////////////////////////////////////////////////////////////////

    static bool containsi(strview haystack, strview needle) noexcept
    {
        for (int i = 0; i + needle.len <= haystack.len; ++i)
            if (strview{haystack.str + i, needle.len}.equalsi(needle))
                return true;
        return false;
    }

    static void print_help()
    {
        consolef(Default, "Usage: RePathTests [-v] [testname] [-testname] [test:testname] [testname.testcase]\n");
    }

    // "-testname" entries disable suites, any other entry selects suites to run
    static void select_tests(const std::vector<strview>& args)
    {
        std::vector<registered_test>& tests = registered_tests();
        bool anySelected = false;
        for (strview arg : args)
        {
            if (!arg.empty() && arg[0] == '-')
                continue;
            if (!anySelected)
            {
                for (registered_test& t : tests) t.enabled = false;
                anySelected = true;
            }
        }

        for (strview arg : args)
        {
            int dot = arg.find(".");
            strview suite  = dot == -1 ? arg : strview{arg.str, dot};
            strview filter = dot == -1 ? strview{} : strview{arg.str + dot + 1, arg.len - dot - 1};

            const bool disable = !suite.empty() && suite[0] == '-';
            if (disable) suite = strview{suite.str + 1, suite.len - 1};

            const bool exact = suite.starts_withi("test:");
            if (exact) suite = strview{suite.str + 5, suite.len - 5};

            bool match = false;
            for (registered_test& t : tests)
            {
                if (exact ? t.name.equalsi(suite) : containsi(t.name, suite))
                {
                    t.enabled = !disable;
                    t.case_filter = filter;
                    match = true;
                }
            }
            if (!match)
                consolef(Red, "  No matching test for '%.*s'\n", suite.len, suite.str);
        }
    }

    static int print_summary(const test_results& results)
    {
        if (!results.failures.empty() || results.suites_failed > 0)
        {
            consolef(Red, "\nWARNING: %d/%d tests failed with %d assertions!\n",
                     results.suites_failed, results.suites_run, (int)results.failures.size());
            for (const test_failure& f : results.failures)
            {
                if (f.line) consolef(Red, "    %s:%d  %s::%s:  %s\n", f.file.c_str(), f.line, f.suite.str, f.testcase.str, f.message.c_str());
                else        consolef(Red, "    %s::%s:  %s\n", f.suite.str, f.testcase.str, f.message.c_str());
            }
            return results.failures.empty() ? results.suites_failed : (int)results.failures.size();
        }
        if (results.suites_run == 0)
        {
            consolef(Yellow, "\nNOTE: No tests were run! (out of %d available)\n", (int)registered_tests().size());
            return 1;
        }
        consolef(Green, "\nSUCCESS: All %d tests passed!\n", results.suites_run);
        return 0;
    }

    int test::run_tests(int argc, char* argv[])
    {
        std::vector<strview> args;
        for (int i = 1; i < argc; ++i)
        {
            strview arg { argv[i] };
            if (arg == "-h" || arg == "--help")
            {
                print_help();
                std::exit(0);
            }
            if (arg == "-v")
                Verbose = true;
            else if (!arg.empty())
                args.push_back(arg);
        }
        if (!args.empty())
            select_tests(args);

        test_results results;
        for (registered_test& t : registered_tests())
        {
            if (!t.enabled)
                continue;
            ++results.suites_run;
            std::unique_ptr<test> suite = t.factory(t.name);
            if (!suite->run_test(results, t.case_filter))
                ++results.suites_failed;
        }
        return print_summary(results);
    }

} // namespace rpath
