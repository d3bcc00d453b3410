#include <rpath/tests.h>
#include <cstdio>

int main(int argc, char** argv)
{
    printf("==== RePath Tests ====\n");
    for (int i = 0; i < argc; ++i)
        printf("  -- arg %d: %s\n", i, argv[i]);

    int result = rpath::test::run_tests(argc, argv);
    rpath::test::cleanup_all_tests();
    return result;
}
