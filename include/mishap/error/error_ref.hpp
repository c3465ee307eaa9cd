#pragma once

#include <algorithm>
#include <iterator>
#include <memory>
#include <typeinfo>

#include <boost/core/demangle.hpp>

#include <fmt/format.h>

#include <mishap/error/error_traits.hpp>
#include <mishap/error/fwd.hpp>

namespace mishap
{
namespace detail
{
/**
 * @brief The behaviour of one concrete error type applied to erased objects.
 *
 * There is exactly one instance per type (behavior_of<E>), all operations
 * expect `object` to point to an instance of that type.
 */
class error_behavior
{
public:
    error_behavior(error_behavior const &) = delete;
    auto operator=(error_behavior const &) -> error_behavior & = delete;

    [[nodiscard]] virtual auto type() const noexcept
            -> std::type_info const & = 0;

    virtual void format(void const *object, format_buffer &out) const = 0;
    virtual void format_debug(void const *object,
                              format_buffer &out) const = 0;

    [[nodiscard]] virtual auto source(void const *object) const noexcept
            -> error_ref = 0;
    [[nodiscard]] virtual auto backtrace(void const *object) const noexcept
            -> mishap::backtrace const * = 0;

protected:
    constexpr error_behavior() noexcept = default;
    ~error_behavior() = default;
};

template <error_type E>
class error_behavior_impl;
} // namespace detail

/**
 * @brief A non owning view of an error value of any type.
 *
 * This is what an error reports as its cause. An empty view signals the end
 * of a cause chain. The viewed object must outlive the view.
 */
class error_ref final
{
public:
    constexpr error_ref() noexcept = default;

    template <error_type E>
    error_ref(E const &e) noexcept;
    template <error_type E>
    error_ref(E const &&e) = delete;

    // views the value stored by the error, defined in error.cpp
    error_ref(error const &e) noexcept;
    error_ref(error const &&e) = delete;

    explicit operator bool() const noexcept
    {
        return mObject != nullptr;
    }

    [[nodiscard]] auto type() const noexcept -> std::type_info const &
    {
        return mBehavior->type();
    }

    void format(format_buffer &out) const
    {
        mBehavior->format(mObject, out);
    }
    void format_debug(format_buffer &out) const
    {
        mBehavior->format_debug(mObject, out);
    }

    [[nodiscard]] auto source() const noexcept -> error_ref;
    [[nodiscard]] auto backtrace() const noexcept -> mishap::backtrace const *
    {
        return mBehavior->backtrace(mObject);
    }

    template <downcast_target T>
    [[nodiscard]] auto is() const noexcept -> bool
    {
        return type() == typeid(T);
    }
    template <downcast_target T>
    [[nodiscard]] auto try_get() const noexcept -> T const *
    {
        return is<T>() ? static_cast<T const *>(mObject) : nullptr;
    }

    [[nodiscard]] auto address() const noexcept -> void const *
    {
        return mObject;
    }

private:
    void const *mObject{nullptr};
    detail::error_behavior const *mBehavior{nullptr};
};

/**
 * @brief Dispatches the optional error capabilities of E.
 */
template <error_type E>
struct error_traits
{
    static auto source(E const &e) noexcept -> error_ref
    {
        if constexpr (detail::has_error_source<E>)
        {
            return e.source();
        }
        else
        {
            return error_ref{};
        }
    }

    static auto backtrace(E const &e) noexcept -> mishap::backtrace const *
    {
        if constexpr (detail::has_error_backtrace<E>)
        {
            return e.backtrace();
        }
        else
        {
            (void)e;
            return nullptr;
        }
    }

    static void format(E const &e, format_buffer &out)
    {
        fmt::format_to(std::back_inserter(out), FMT_STRING("{}"), e);
    }

    static void format_debug(E const &e, format_buffer &out)
    {
        if constexpr (detail::has_format_debug<E>)
        {
            e.format_debug(out);
        }
        else
        {
            fmt::format_to(std::back_inserter(out), FMT_STRING("{}: {}"),
                           boost::core::demangle(typeid(E).name()), e);
        }
    }
};

namespace detail
{
template <error_type E>
class error_behavior_impl final : public error_behavior
{
    using traits = error_traits<E>;

public:
    constexpr error_behavior_impl() noexcept = default;

    [[nodiscard]] auto type() const noexcept -> std::type_info const & override
    {
        return typeid(E);
    }

    void format(void const *object, format_buffer &out) const override
    {
        traits::format(*static_cast<E const *>(object), out);
    }
    void format_debug(void const *object, format_buffer &out) const override
    {
        traits::format_debug(*static_cast<E const *>(object), out);
    }

    [[nodiscard]] auto source(void const *object) const noexcept
            -> error_ref override
    {
        return traits::source(*static_cast<E const *>(object));
    }
    [[nodiscard]] auto backtrace(void const *object) const noexcept
            -> mishap::backtrace const * override
    {
        return traits::backtrace(*static_cast<E const *>(object));
    }
};

template <error_type E>
inline constexpr error_behavior_impl<E> behavior_of{};
} // namespace detail

template <error_type E>
inline error_ref::error_ref(E const &e) noexcept
    : mObject(std::addressof(e))
    , mBehavior(&detail::behavior_of<E>)
{
}

inline auto error_ref::source() const noexcept -> error_ref
{
    return mBehavior->source(mObject);
}

} // namespace mishap

namespace fmt
{
template <>
struct formatter<mishap::error_ref>
{
    constexpr auto parse(format_parse_context &ctx) noexcept
    {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(mishap::error_ref const &e, FormatContext &ctx) const
    {
        mishap::format_buffer buffer;
        e.format(buffer);
        return std::copy(buffer.begin(), buffer.end(), ctx.out());
    }
};
} // namespace fmt
