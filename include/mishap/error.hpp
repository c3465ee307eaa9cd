#pragma once

#include <algorithm>
#include <concepts>
#include <memory>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>

#include <fmt/format.h>

#include <mishap/error/backtrace.hpp>
#include <mishap/error/error_chain.hpp>
#include <mishap/error/error_record.hpp>
#include <mishap/error/error_ref.hpp>
#include <mishap/error/error_traits.hpp>
#include <mishap/error/fwd.hpp>
#include <mishap/error/message_error.hpp>
#include <mishap/error/result_policy.hpp>

namespace mishap
{
/**
 * @brief Owns an error value of any error_type behind a single pointer.
 *
 * On construction the value is moved into a heap record together with its
 * type identity and, unless the value carries its own, a freshly captured
 * backtrace. Afterwards the value can be displayed, its cause chain walked
 * and the original type recovered by downcasting.
 *
 * Errors are move only. A default constructed or moved-from error is empty,
 * all member functions except empty(), assignment and destruction require a
 * non empty error.
 */
class error final
{
public:
    error() noexcept = default;

    template <typename E>
        requires error_type<std::remove_cvref_t<E>>
                 && std::constructible_from<std::remove_cvref_t<E>, E>
    error(E &&value) noexcept;

    /**
     * @brief Creates an error from a displayable message without a cause.
     *
     * The error identifies as the (decayed) message type, e.g. a string
     * literal can be downcast to `char const *`.
     */
    template <typename M>
        requires error_message<std::decay_t<M>>
    static auto adhoc(M &&message) noexcept -> error;

    error(error const &) = delete;
    error(error &&) noexcept = default;
    auto operator=(error const &) -> error & = delete;
    auto operator=(error &&) noexcept -> error & = default;
    ~error() noexcept = default;

    [[nodiscard]] auto empty() const noexcept -> bool
    {
        return mRecord == nullptr;
    }

    // ad hoc messages are viewed through their message_error wrapper
    [[nodiscard]] auto as_ref() const noexcept -> error_ref
    {
        return mRecord->view();
    }

    /**
     * @brief The backtrace captured on construction or, if the value brought
     *        its own, the one supplied by the value.
     */
    [[nodiscard]] auto backtrace() const noexcept -> mishap::backtrace const &;

    /**
     * @brief Iterates the error and its causes, the root comes first.
     */
    [[nodiscard]] auto chain() const noexcept -> error_chain
    {
        return error_chain{as_ref()};
    }

    template <downcast_target T>
    [[nodiscard]] auto is() const noexcept -> bool
    {
        return mRecord->type() == typeid(T);
    }

    template <downcast_target T>
    [[nodiscard]] auto try_get() const noexcept -> T const *
    {
        return is<T>() ? static_cast<T const *>(mRecord->target()) : nullptr;
    }
    template <downcast_target T>
    [[nodiscard]] auto try_get() noexcept -> T *
    {
        return is<T>() ? static_cast<T *>(mRecord->target()) : nullptr;
    }

    /**
     * @brief Moves the value out if it is a T.
     *
     * On success the error is left empty, otherwise it is handed back
     * unchanged as the failure.
     */
    template <downcast_target T>
    [[nodiscard]] auto downcast() && -> result<T>;

    void format(format_buffer &out) const
    {
        as_ref().format(out);
    }
    void format_debug(format_buffer &out) const;

    [[nodiscard]] auto diagnostic_information(
            error_message_format format
            = error_message_format::with_diagnostics) const -> std::string;

    [[noreturn]] void throw_exception() &&;
    // throws a copy of the display, the value itself can't be moved out
    [[noreturn]] void throw_exception() const &;

private:
    std::unique_ptr<detail::error_record_base> mRecord;
};

static_assert(sizeof(error) == sizeof(void *));
static_assert(std::is_nothrow_move_constructible_v<error>);
static_assert(!std::is_copy_constructible_v<error>);

template <typename E>
    requires error_type<std::remove_cvref_t<E>>
             && std::constructible_from<std::remove_cvref_t<E>, E>
inline error::error(E &&value) noexcept
    : mRecord(detail::make_error_record<std::remove_cvref_t<E>>(
            typeid(std::remove_cvref_t<E>), std::forward<E>(value)))
{
}

template <typename M>
    requires error_message<std::decay_t<M>>
inline auto error::adhoc(M &&message) noexcept -> error
{
    using message_type = std::decay_t<M>;
    using erased_type = detail::message_error<message_type>;

    error e;
    e.mRecord = detail::make_error_record<erased_type>(
            typeid(message_type),
            erased_type{message_type(std::forward<M>(message))});
    return e;
}

template <downcast_target T>
inline auto error::downcast() && -> result<T>
{
    if (!is<T>())
    {
        return outcome::failure(std::move(*this));
    }

    result<T> rx{outcome::success(
            std::move(*static_cast<T *>(mRecord->target())))};
    // destroys the moved-from shell and releases the allocation
    mRecord.reset();
    return rx;
}

} // namespace mishap

namespace fmt
{
/**
 * @brief Formats the display of an error by default, `{:v}` selects the
 *        diagnostic form with causes and backtrace, `{:!v}` forces the
 *        display.
 */
template <>
struct formatter<mishap::error>
{
    constexpr auto parse(format_parse_context &ctx)
            -> format_parse_context::iterator
    {
        constexpr auto errfmt = "invalid mishap::error format specification";

        auto it = ctx.begin();
        auto const end = ctx.end();
        if (it != end && *it == '!')
        {
            ++it;
            if (it == end || *it != 'v')
            {
                ctx.on_error(errfmt);
            }
            verbose = false;
            ++it;
        }
        else if (it != end && *it == 'v')
        {
            verbose = true;
            ++it;
        }
        if (it != end && *it != '}')
        {
            ctx.on_error(errfmt);
        }
        return it;
    }

    template <typename FormatContext>
    auto format(mishap::error const &e, FormatContext &ctx) const
    {
        mishap::format_buffer buffer;
        if (verbose)
        {
            e.format_debug(buffer);
        }
        else
        {
            e.format(buffer);
        }
        return std::copy(buffer.begin(), buffer.end(), ctx.out());
    }

    bool verbose = false;
};
} // namespace fmt
