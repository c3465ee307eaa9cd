#include "mishap/error/system_failure.hpp"

#include <cerrno>
#include <cstring>
#include <string_view>
#include <utility>

#include <boost/outcome/experimental/status-code/posix_code.hpp>

#include "boost-unit-test.hpp"
#include "test-utils.hpp"

namespace system_error = mishap::system_error;

static_assert(mishap::error_type<mishap::system_failure>);

namespace
{

class sync_failed
{
public:
    explicit sync_failed(mishap::system_failure cause) noexcept
        : mCause(std::move(cause))
    {
    }

    [[nodiscard]] auto source() const noexcept -> mishap::error_ref
    {
        return mCause;
    }

private:
    mishap::system_failure mCause;
};

} // namespace

template <>
struct fmt::formatter<sync_failed> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(sync_failed const &, FormatContext &ctx) const
    {
        return fmt::formatter<std::string_view>::format(
                "failed to sync the journal", ctx);
    }
};

BOOST_FIXTURE_TEST_SUITE(system_failure_tests,
                         mishap_tests::backtrace_toggle_fixture)

BOOST_AUTO_TEST_CASE(display_names_the_api)
{
    mishap::system_failure const failure{
            system_error::posix_code(ENOENT), "open"};

    BOOST_TEST(failure.api() == "open");
    BOOST_TEST(fmt::format("{}", failure)
               == "open() failed: No such file or directory");
}

BOOST_AUTO_TEST_CASE(display_without_api)
{
    mishap::system_failure const failure{system_error::posix_code(EACCES)};

    BOOST_TEST(fmt::format("{}", failure) == "Permission denied");
}

BOOST_AUTO_TEST_CASE(collect_the_last_error)
{
    errno = ENOENT;
    mishap::error e = mishap::collect_system_error("open");

    BOOST_TEST_REQUIRE(e.is<mishap::system_failure>());
    auto const *failure = e.try_get<mishap::system_failure>();
    BOOST_TEST((failure->code() == system_error::posix_code(ENOENT)));
    BOOST_TEST(!e.as_ref().source());
    BOOST_TEST(fmt::format("{}", e)
               == "open() failed: No such file or directory");
}

BOOST_AUTO_TEST_CASE(as_cause_of_another_error)
{
    errno = EIO;
    mishap::error e = sync_failed{mishap::collect_system_error("fsync")};

    auto const expected = fmt::format("failed to sync the journal\n"
                                      "\n"
                                      "caused by:\n"
                                      "\t0: fsync() failed: {}\n"
                                      "\n"
                                      "{}",
                                      std::strerror(EIO),
                                      mishap_tests::disabled_backtrace_notice);
    BOOST_TEST(fmt::format("{:v}", e) == expected);
}

BOOST_AUTO_TEST_SUITE_END()
