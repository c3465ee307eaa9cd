#include "mishap/result.hpp"

#include <string>
#include <string_view>

#include "boost-unit-test.hpp"
#include "test-utils.hpp"

using namespace mishap_tests;

namespace
{

auto reserve_space(int bytes) -> mishap::result<int>
{
    if (bytes > 1024)
    {
        return mishap::failure(mishap::error(disk_full{1024}));
    }
    return bytes;
}

auto append_record(int bytes) -> mishap::result<int>
{
    MISHAP_TRY(reserved, reserve_space(bytes));
    return reserved + 1;
}

auto flush() -> mishap::result<void>
{
    MISHAP_TRY(append_record(4096));
    return mishap::success();
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(result_tests, backtrace_toggle_fixture)

BOOST_AUTO_TEST_CASE(success_value)
{
    auto rx = append_record(16);
    TEST_RESULT_REQUIRE(rx);
    BOOST_TEST(rx.assume_value() == 17);
}

BOOST_AUTO_TEST_CASE(try_propagates_the_failure)
{
    auto rx = append_record(2048);
    BOOST_TEST_REQUIRE(rx.has_error());
    BOOST_TEST(rx.assume_error().is<disk_full>());
    BOOST_TEST(rx.assume_error().try_get<disk_full>()->freeBytes == 1024);
}

BOOST_AUTO_TEST_CASE(try_propagates_into_void_results)
{
    auto rx = flush();
    BOOST_TEST_REQUIRE(rx.has_error());
    BOOST_TEST(fmt::format("{}", rx.assume_error()) == "disk is full");
}

BOOST_AUTO_TEST_CASE(value_throws_the_error)
{
    auto rx = append_record(2048);

    try
    {
        (void)rx.value();
    }
    catch (mishap::error_exception const &exc)
    {
        BOOST_TEST(exc.error().is<disk_full>());
        BOOST_TEST(std::string_view{exc.what()}.starts_with("disk is full\n"));
        return;
    }
    BOOST_FAIL("value() didn't throw an error_exception");
}

BOOST_AUTO_TEST_CASE(error_of_a_success_throws)
{
    auto rx = append_record(1);
    BOOST_CHECK_THROW((void)rx.error(), mishap::outcome::bad_result_access);
}

BOOST_AUTO_TEST_CASE(exception_what_is_the_diagnostic_information)
{
    mishap::error_exception const exc{mishap::error(write_failed{disk_full{}})};

    auto const expected = fmt::format("failed to write the journal\n"
                                      "\n"
                                      "caused by:\n"
                                      "\t0: disk is full\n"
                                      "\n"
                                      "{}",
                                      disabled_backtrace_notice);
    BOOST_TEST(std::string_view{exc.what()} == expected);
    // cached
    BOOST_TEST(exc.what() == exc.what());
}

BOOST_AUTO_TEST_CASE(exception_releases_the_error)
{
    mishap::error_exception exc{mishap::error(disk_full{3})};

    mishap::error e = std::move(exc).error();
    BOOST_TEST(e.is<disk_full>());
    BOOST_TEST(std::string_view{exc.what()}.starts_with("<error_exception|"));
}

BOOST_AUTO_TEST_SUITE_END()
