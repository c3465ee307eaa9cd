#include <mishap/error/backtrace.hpp>

#include <atomic>
#include <cstdlib>
#include <limits>

#include <boost/config.hpp>

namespace mishap
{

namespace
{

enum class capture_toggle : int
{
    unknown,
    disabled,
    enabled,
};

std::atomic<capture_toggle> captureToggle{capture_toggle::unknown};

auto read_capture_toggle() noexcept -> capture_toggle
{
    using namespace std::string_view_literals;

    // environment_variable is a literal, therefore null terminated
    char const *const value = std::getenv(backtrace::environment_variable.data());
    if (value == nullptr)
    {
        return capture_toggle::disabled;
    }
    std::string_view const valueView{value};
    return valueView.empty() || valueView == "0"sv ? capture_toggle::disabled
                                                   : capture_toggle::enabled;
}

constexpr auto all_frames = std::numeric_limits<std::size_t>::max();

} // namespace

backtrace::backtrace(backtrace_status status, frames_type frames) noexcept
    : mStatus(status)
    , mFrames(std::move(frames))
{
}

auto backtrace::capture_enabled() noexcept -> bool
{
    auto toggle = captureToggle.load(std::memory_order_relaxed);
    if (toggle == capture_toggle::unknown)
    {
        // an override or another reader may have won the race, keep theirs
        auto const fromEnvironment = read_capture_toggle();
        if (captureToggle.compare_exchange_strong(toggle, fromEnvironment,
                                                  std::memory_order_relaxed))
        {
            toggle = fromEnvironment;
        }
    }
    return toggle == capture_toggle::enabled;
}

void backtrace::set_capture_enabled(bool enabled) noexcept
{
    captureToggle.store(enabled ? capture_toggle::enabled
                                : capture_toggle::disabled,
                        std::memory_order_relaxed);
}

BOOST_NOINLINE auto backtrace::capture() noexcept -> backtrace
{
    if (!capture_enabled())
    {
        return disabled();
    }

    // skip this function
    frames_type frames(1U, all_frames);
    auto const status = frames.empty() ? backtrace_status::unsupported
                                       : backtrace_status::captured;
    return backtrace{status, std::move(frames)};
}

BOOST_NOINLINE auto backtrace::force_capture() noexcept -> backtrace
{
    frames_type frames(1U, all_frames);
    auto const status = frames.empty() ? backtrace_status::unsupported
                                       : backtrace_status::captured;
    return backtrace{status, std::move(frames)};
}

auto backtrace::disabled() noexcept -> backtrace
{
    return backtrace{backtrace_status::disabled, frames_type(0U, 0U)};
}

auto backtrace::unsupported() noexcept -> backtrace
{
    return backtrace{backtrace_status::unsupported, frames_type(0U, 0U)};
}

auto backtrace::to_string() const -> std::string
{
    if (mStatus != backtrace_status::captured)
    {
        return std::string{};
    }
    return boost::stacktrace::to_string(mFrames);
}

} // namespace mishap
