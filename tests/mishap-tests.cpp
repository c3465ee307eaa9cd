#include "boost-unit-test.hpp"

#include <mishap/error/backtrace.hpp>

#if defined BOOST_COMP_GNUC_AVAILABLE
#pragma GCC diagnostic ignored "-Wmissing-declarations"
#endif

using namespace boost::unit_test;

// BOOST_TEST_MODULE isn't used in order to pin the process wide state before
// any test case runs
bool init_unit_test()
{
    // the test cases enable capturing where they need it, this way the result
    // doesn't depend on the environment the tests are run in
    mishap::backtrace::set_capture_enabled(false);

    framework::master_test_suite().p_name.value = "mishap test suite";
    return true;
}

int main(int argc, char *argv[])
{
    return unit_test_main(&init_unit_test, argc, argv);
}
