#include <mishap/error.hpp>

#include <cstdio>
#include <exception>
#include <iterator>
#include <new>

#include <boost/config.hpp>

#include <mishap/error/error_exception.hpp>

namespace mishap
{

namespace
{

[[noreturn]] BOOST_NOINLINE void
report_invariant_violation(std::string_view what) noexcept
{
    try
    {
        fmt::print(stderr, FMT_STRING("mishap invariant violated: {}\n"), what);
    }
    catch (std::exception const &)
    {
        // nothing left to report with
    }
    std::terminate();
}

void format_backtrace_section(mishap::backtrace const &bt, format_buffer &out)
{
    using namespace std::string_view_literals;

    switch (bt.status())
    {
    case backtrace_status::captured:
    {
        auto const frames = bt.to_string();
        out.push_back('\n');
        out.append(frames.data(), frames.data() + frames.size());
        if (frames.empty() || frames.back() != '\n')
        {
            out.push_back('\n');
        }
        break;
    }
    case backtrace_status::disabled:
    {
        constexpr auto notice
                = "\nbacktrace disabled; run with MISHAP_BACKTRACE=1 "
                  "environment variable to display a backtrace\n"sv;
        out.append(notice.data(), notice.data() + notice.size());
        break;
    }
    case backtrace_status::unsupported:
        break;
    }
}

} // namespace

error_ref::error_ref(error const &e) noexcept
    : error_ref(e.as_ref())
{
}

auto error::backtrace() const noexcept -> mishap::backtrace const &
{
    if (auto const &captured = mRecord->captured_backtrace(); captured)
    {
        return *captured;
    }
    if (auto const *own = as_ref().backtrace(); own != nullptr)
    {
        return *own;
    }
    report_invariant_violation(
            "the error neither captured nor carries a backtrace");
}

void error::format_debug(format_buffer &out) const
{
    auto const root = as_ref();
    root.format(out);
    out.push_back('\n');

    if (auto cause = root.source(); cause)
    {
        fmt::format_to(std::back_inserter(out), FMT_STRING("\ncaused by:\n"));
        for (int n = 0; cause; cause = cause.source(), ++n)
        {
            fmt::format_to(std::back_inserter(out), FMT_STRING("\t{}: {}\n"), n,
                           cause);
        }
    }

    format_backtrace_section(backtrace(), out);
}

auto error::diagnostic_information(error_message_format format) const
        -> std::string
{
    format_buffer buffer;
    if (format == error_message_format::simple)
    {
        this->format(buffer);
    }
    else
    {
        format_debug(buffer);
    }
    return fmt::to_string(buffer);
}

void error::throw_exception() &&
{
    throw error_exception(std::move(*this));
}

void error::throw_exception() const &
{
    throw error_exception(error::adhoc(
            diagnostic_information(error_message_format::simple)));
}

auto error_exception::what() const noexcept -> char const *
{
    if (mErr.empty())
    {
        return "<error_exception|the error has been moved out of the "
               "exception>";
    }
    if (mErrDesc.empty())
    {
        try
        {
            mErrDesc = mErr.diagnostic_information(
                    error_message_format::with_diagnostics);
        }
        catch (std::bad_alloc const &)
        {
            return "<error_exception|failed to allocate the diagnostic "
                   "information string>";
        }
        catch (std::exception const &)
        {
            return "<error_exception|failed to format the diagnostic "
                   "information of the error>";
        }
    }
    return mErrDesc.c_str();
}

} // namespace mishap
