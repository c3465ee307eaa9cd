#pragma once

#include <concepts>
#include <iterator>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

#include <mishap/error/error_traits.hpp>

namespace mishap
{
template <typename M>
concept error_message = std::is_object_v<M> && !std::is_array_v<M>
                        && std::same_as<M, std::remove_cv_t<M>>
                        && std::move_constructible<M>
                        && std::is_nothrow_destructible_v<M>
                        && fmt::is_formattable<M>::value;

namespace detail
{
/**
 * @brief Turns a displayable value into an error without a cause.
 */
template <typename M>
class message_error final
{
public:
    using message_type = M;

    explicit message_error(M &&message) noexcept(
            std::is_nothrow_move_constructible_v<M>)
        : mMessage(std::move(message))
    {
    }
    explicit message_error(M const &message) noexcept(
            std::is_nothrow_copy_constructible_v<M>)
        : mMessage(message)
    {
    }

    auto message() noexcept -> M &
    {
        return mMessage;
    }
    [[nodiscard]] auto message() const noexcept -> M const &
    {
        return mMessage;
    }

    void format_debug(format_buffer &out) const
    {
        fmt::format_to(std::back_inserter(out), FMT_STRING("{}"), mMessage);
    }

private:
    M mMessage;
};
} // namespace detail

template <typename M>
inline constexpr bool enable_error<detail::message_error<M>> = true;

} // namespace mishap

template <typename M>
struct fmt::formatter<mishap::detail::message_error<M>>
{
    constexpr auto parse(format_parse_context &ctx) noexcept
    {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(mishap::detail::message_error<M> const &e,
                FormatContext &ctx) const
    {
        return fmt::format_to(ctx.out(), FMT_STRING("{}"), e.message());
    }
};
