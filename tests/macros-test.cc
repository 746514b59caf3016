#include <ring-core/macros.hh>

#include <nexus/test.hh>

#if defined(RC_DEBUG) + defined(RC_RELEASE) + defined(RC_RELWITHDEBINFO) > 1
#error "At most one build configuration macro may be defined"
#endif

#if RC_ASSERT_ENABLED != 0 && RC_ASSERT_ENABLED != 1
#error "RC_ASSERT_ENABLED must be 0 or 1"
#endif

#if defined(RC_DEBUG) && !RC_ASSERT_ENABLED
#error "Debug builds must have assertions enabled"
#endif

TEST("macros - assertion configuration")
{
#if defined(RC_ENABLE_ASSERT_IN_RELEASE) || defined(RC_RELWITHDEBINFO)
    CHECK(RC_ASSERT_ENABLED == 1);
#endif
    CHECK((RC_ASSERT_ENABLED == 0 || RC_ASSERT_ENABLED == 1));
}

TEST("macros - RC_UNUSED does not evaluate its argument")
{
    auto calls = 0;
    auto const count = [&]
    {
        ++calls;
        return 1;
    };

    RC_UNUSED(count());
    CHECK(calls == 0);
}
