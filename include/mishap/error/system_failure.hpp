#pragma once

#include <string_view>
#include <utility>

#include <boost/outcome/experimental/status-code/system_code.hpp>

#include <fmt/format.h>

#include <mishap/error/error_ref.hpp>

namespace mishap
{
namespace system_error = BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE;

/**
 * @brief An error reported by the operating system.
 *
 * The api name is expected to have static storage duration, usually it is a
 * literal naming the failed function.
 */
class system_failure final
{
public:
    explicit system_failure(system_error::system_code code,
                            std::string_view api = {}) noexcept
        : mCode(std::move(code))
        , mApi(api)
    {
    }

    [[nodiscard]] auto code() const noexcept -> system_error::system_code const &
    {
        return mCode;
    }
    [[nodiscard]] auto api() const noexcept -> std::string_view
    {
        return mApi;
    }

    [[nodiscard]] auto source() const noexcept -> error_ref
    {
        return {};
    }

private:
    system_error::system_code mCode;
    std::string_view mApi;
};

/**
 * @brief Wraps the calling thread's last system error (errno or
 *        GetLastError()).
 */
auto collect_system_error(std::string_view api = {}) noexcept
        -> system_failure;

} // namespace mishap

namespace fmt
{
template <>
struct formatter<mishap::system_failure>
{
    constexpr auto parse(format_parse_context &ctx) noexcept
    {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(mishap::system_failure const &failure, FormatContext &ctx) const
    {
        auto const message = failure.code().message();
        std::string_view const messageView{message.c_str(), message.size()};
        if (failure.api().empty())
        {
            return fmt::format_to(ctx.out(), FMT_STRING("{}"), messageView);
        }
        return fmt::format_to(ctx.out(), FMT_STRING("{}() failed: {}"),
                              failure.api(), messageView);
    }
};
} // namespace fmt
