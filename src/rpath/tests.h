#pragma once
/**
 * Minimal Unit Testing Framework, Copyright (c) 2024, RePath authors
 * Distributed under MIT Software License
 */
#include <cmath>   // fabs
#include <cfloat>  // DBL_EPSILON
#include <vector>
#include <memory>
#include <functional>
#include <typeinfo>
#include <rpath/sprint.h>    // printing of mismatching values
#include <rpath/debugging.h> // AssertMsg arguments are adapted like log arguments

namespace rpath
{
    struct test;
    struct test_results;

    using test_factory = std::unique_ptr<test> (*)(strview name);

    /** Registers a test suite, done by TestInit() before main() runs */
    RPATHAPI void register_test(strview name, test_factory factory);

    struct RPATHAPI test
    {
        struct test_func;
        struct test_impl;

        strview name;
    private:
        test_impl* impl = nullptr;

    public:
        explicit test(strview name);
        virtual ~test() noexcept;
        test(const test&) = delete;
        test& operator=(const test&) = delete;

        /** Records a failed assertion of the running test case */
        void assert_failed(const char* file, int line, const char* fmt, ...) PRINTF_CHECKFMT4;
    private:
        void add_failure(const char* file, int line, std::string message);

    public:
        /**
         * Runs the test cases of this suite.
         * A non-empty caseFilter selects only the cases whose name contains it.
         * @return TRUE if every selected case passed
         */
        bool run_test(test_results& results, strview caseFilter = {});
    private:
        bool run_test_func(test_func& test);
        bool run_init();
        void run_cleanup();

    public:
        virtual void init_test() {}
        virtual void cleanup_test() {}

        /**
         * Expects program argc and argv from main()
         * argv[1...] select the suites to run:
         *   test_paths          -- All suites that contain "test_paths"
         *   test:test_paths     -- Exactly the "test_paths" suite
         *   paths.normalize     -- Only 'normalize' cases of suites that contain "paths"
         *   -test_charset       -- All suites except test_charset
         * @return 0 on success, number of failed assertions otherwise
         */
        static int run_tests(int argc, char* argv[]);

        /** Frees the registered suites, call this after run_tests() */
        static void cleanup_all_tests();

        template<class T> static std::string as_short_string(const T& obj, int maxLen = 512)
        {
            rpath::string_buffer sb;
            sb << obj;
            std::string s = sb.str();
            if ((int)s.size() > maxLen)
            {
                s.resize(size_t(maxLen));
                s += "...";
            }
            return s;
        }

        template<class Actual, class Expected>
        void assumption_failed(const char* file, int line,
            const char* expr, const Actual& actual, const char* why, const Expected& expected)
        {
            std::string sActual = as_short_string(actual);
            std::string sExpect = as_short_string(expected);
            assert_failed(file, line, "%s => '%s' %s '%s'", expr, sActual.c_str(), why, sExpect.c_str());
        }

        int add_test_func(strview name, std::function<void()> fn, size_t expectedExHash);

        template<class TestClass>
        static int add_test_func(TestClass* self, strview name, void (TestClass::*test_method)(),
                                 const std::type_info* ti = nullptr)
        {
            size_t expectedExHash = ti ? ti->hash_code() : 0;
            return self->add_test_func(name, [self, test_method] { (self->*test_method)(); }, expectedExHash);
        }
    };

    struct Compare
    {
        template<class Expr, class Expected> static bool eq(const Expr& expr, const Expected& expected)
        {
            return expr == expected;
        }
        static bool eq(unsigned int expr, int expected) noexcept { return expr == (unsigned int)expected; }
        static bool eq(long unsigned int expr, int expected) noexcept { return expr == (long unsigned int)expected; }
        static bool eq(long unsigned int expr, long int expected) noexcept { return expr == (long unsigned int)expected; }
        static bool eq(double expr, double expected) noexcept { return fabs(expr - expected) < (DBL_EPSILON*2); }

        template<class Expr, class Than> static bool gt(const Expr& expr, const Than& than) noexcept
        {
            return expr > than;
        }
        static bool gt(unsigned int expr, int than) noexcept { return expr > (unsigned int)than; }
        static bool gt(long unsigned int expr, int than) noexcept { return expr > (long unsigned int)than; }

        template<class Expr, class Than> static bool lt(const Expr& expr, const Than& than) noexcept
        {
            return expr < than;
        }
        static bool lt(unsigned int expr, int than) noexcept { return expr < (unsigned int)than; }
        static bool lt(long unsigned int expr, int than) noexcept { return expr < (long unsigned int)than; }
    };


#undef Assert
#undef AssertTrue
#undef AssertFalse
#undef AssertMsg
#undef AssertThat
#undef AssertEqual
#undef AssertThrows
#undef AssertNotEqual
#undef AssertGreater
#undef AssertLess
#undef TestImpl
#undef TestInit
#undef TestCleanup
#undef TestCase
#undef TestCaseExpectedEx

#define Assert(expr) do { \
    if (!(expr)) { assumption_failed(__FILE__, __LINE__, #expr, false, "but expected", true); } \
}while(0)

#define AssertTrue Assert
#define AssertFalse(expr) do { \
    if ((expr)) { assumption_failed(__FILE__, __LINE__, #expr, true, "but expected", false); } \
}while(0)

// message arguments are adapted like LogInfo() arguments, so strview and ustrview print as %s
#define AssertMsg(expr, fmt, ...) do { \
    if (!(expr)) { assert_failed(__FILE__, __LINE__, #expr " $ " fmt _rpath_wrap_args(__VA_ARGS__)); } \
}while(0)

#define AssertThat(expr, expected) do { \
    const auto& __expr   = expr;        \
    const auto& __expect = expected;    \
    if (!rpath::Compare::eq(__expr, __expect)) { \
        assumption_failed(__FILE__, __LINE__, #expr, __expr, "but expected", __expect); \
    } \
}while(0)

#define AssertEqual AssertThat

#define AssertThrows(expr, exceptionType) do { \
    try {                                      \
        expr;                                  \
        assert_failed(__FILE__, __LINE__, "%s => expected exception of type %s", #expr, #exceptionType); \
    } catch (const exceptionType&) {} \
}while(0)

#define AssertNotEqual(expr, mustNotEqual) do { \
    const auto& __expr    = expr;               \
    const auto& __mustnot = mustNotEqual;       \
    if (rpath::Compare::eq(__expr, __mustnot)) { \
        assumption_failed(__FILE__, __LINE__, #expr, __expr, "must not equal", __mustnot); \
    } \
}while(0)

#define AssertGreater(expr, than) do { \
    const auto& __expr = expr;         \
    const auto& __than = than;         \
    if (!rpath::Compare::gt(__expr, __than)) { \
        assumption_failed(__FILE__, __LINE__, #expr, __expr, "must be greater than", __than); \
    } \
}while(0)

#define AssertLess(expr, than) do { \
    const auto& __expr = expr;      \
    const auto& __than = than;      \
    if (!rpath::Compare::lt(__expr, __than)) { \
        assumption_failed(__FILE__, __LINE__, #expr, __expr, "must be less than", __than); \
    } \
}while(0)

#define TestImpl(testclass) struct testclass : public rpath::test

#define TestInit(testclass)                                           \
    explicit testclass(rpath::strview name) : rpath::test{name} {}    \
    static std::unique_ptr<test> __create(rpath::strview name)        \
    { return std::unique_ptr<test>{ new testclass{name} }; }          \
    inline static bool __registered = [] {                            \
        rpath::register_test(#testclass, &__create);                  \
        return true;                                                  \
    }();                                                              \
    using ClassType = testclass;                                      \
    ClassType* self() { return this; }                                \
    void init_test() override

#define TestCleanup() void cleanup_test() override

#define TestCase(testname) \
    const int _test_##testname = add_test_func(self(), #testname, &ClassType::test_##testname ); \
    void test_##testname()

#define TestCaseExpectedEx(testname, expectedExceptionType) \
    const int _test_##testname = add_test_func(self(), #testname, &ClassType::test_##testname, &typeid(expectedExceptionType)); \
    void test_##testname()

}
