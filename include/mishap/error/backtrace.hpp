#pragma once

#include <algorithm>
#include <string>
#include <string_view>

#include <boost/stacktrace/stacktrace.hpp>

#include <fmt/format.h>

#include <mishap/error/fwd.hpp>

namespace mishap
{
/**
 * @brief A snapshot of the call stack together with the reason why it may
 *        be empty.
 *
 * Capturing is gated by the process wide toggle which is initialized from
 * the `MISHAP_BACKTRACE` environment variable on first use. Unset, empty or
 * `0` disables capturing, every other value enables it.
 */
class backtrace final
{
public:
    using frames_type = boost::stacktrace::stacktrace;

    static constexpr std::string_view environment_variable = "MISHAP_BACKTRACE";

    /**
     * @brief Captures the current call stack if capturing is enabled,
     *        otherwise returns a disabled backtrace.
     */
    static auto capture() noexcept -> backtrace;
    /**
     * @brief Captures the current call stack regardless of the toggle.
     */
    static auto force_capture() noexcept -> backtrace;
    static auto disabled() noexcept -> backtrace;
    // what capture() yields on platforms without stack walking support
    static auto unsupported() noexcept -> backtrace;

    static auto capture_enabled() noexcept -> bool;
    static void set_capture_enabled(bool enabled) noexcept;

    backtrace(backtrace const &) = default;
    backtrace(backtrace &&) noexcept = default;
    auto operator=(backtrace const &) -> backtrace & = default;
    auto operator=(backtrace &&) noexcept -> backtrace & = default;
    ~backtrace() noexcept = default;

    [[nodiscard]] auto status() const noexcept -> backtrace_status
    {
        return mStatus;
    }
    [[nodiscard]] auto frames() const noexcept -> frames_type const &
    {
        return mFrames;
    }

    // one line per frame, empty unless captured
    [[nodiscard]] auto to_string() const -> std::string;

private:
    backtrace(backtrace_status status, frames_type frames) noexcept;

    backtrace_status mStatus;
    frames_type mFrames;
};
} // namespace mishap

namespace fmt
{
template <>
struct formatter<mishap::backtrace_status>
{
    constexpr auto parse(format_parse_context &ctx) noexcept
    {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(mishap::backtrace_status status, FormatContext &ctx) const
    {
        using namespace std::string_view_literals;

        std::string_view name = "unsupported"sv;
        switch (status)
        {
        case mishap::backtrace_status::captured:
            name = "captured"sv;
            break;
        case mishap::backtrace_status::disabled:
            name = "disabled"sv;
            break;
        case mishap::backtrace_status::unsupported:
            break;
        }
        return fmt::format_to(ctx.out(), "{}", name);
    }
};

template <>
struct formatter<mishap::backtrace>
{
    constexpr auto parse(format_parse_context &ctx) noexcept
    {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(mishap::backtrace const &bt, FormatContext &ctx) const
    {
        auto const str = bt.to_string();
        return std::copy(str.cbegin(), str.cend(), ctx.out());
    }
};
} // namespace fmt
