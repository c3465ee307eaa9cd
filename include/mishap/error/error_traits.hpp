#pragma once

#include <concepts>
#include <type_traits>

#include <fmt/format.h>

#include <mishap/error/fwd.hpp>

namespace mishap
{
using format_buffer
        = fmt::basic_memory_buffer<char, detail::error_format_stack_buffer_size>;

namespace detail
{
template <typename E>
concept has_error_source = requires(E const &e) {
    {
        e.source()
    } -> std::convertible_to<error_ref>;
};

template <typename E>
concept has_error_backtrace = requires(E const &e) {
    {
        e.backtrace()
    } -> std::convertible_to<backtrace const *>;
};

template <typename E>
concept has_format_debug
        = requires(E const &e, format_buffer &out) { e.format_debug(out); };
} // namespace detail

/**
 * @brief A value which can be erased into a mishap::error.
 *
 * The value is stored by the error, therefore it must be an object type
 * which neither is const nor refers to some other storage. It needs to be
 * displayable via fmt and must opt in by either reporting a cause via a
 * `source() const` member or by specializing enable_error.
 *
 * Errors may be moved to other threads, so the type must not share mutable
 * state without synchronization. This can't be checked.
 */
template <typename E>
concept error_type
        = !std::same_as<E, error> && !std::same_as<E, error_ref>
          && std::is_class_v<E> && !std::is_const_v<E> && !std::is_volatile_v<E>
          && std::move_constructible<E> && std::is_nothrow_destructible_v<E>
          && (enable_error<E> || detail::has_error_source<E>)
          && fmt::is_formattable<E>::value;

/**
 * @brief A type an error can be queried and downcast for.
 */
template <typename T>
concept downcast_target = std::is_object_v<T> && !std::is_array_v<T>
                          && std::same_as<T, std::remove_cv_t<T>>;

} // namespace mishap
