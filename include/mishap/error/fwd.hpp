#pragma once

#include <cstddef>
#include <cstdint>

#include <type_traits>

namespace mishap
{
class error;
class error_ref;
class error_chain;
class error_exception;
class backtrace;

enum class error_message_format
{
    simple,
    with_diagnostics,
};

enum class backtrace_status
{
    unsupported,
    disabled,
    captured,
};

/**
 * @brief Opt-in for error types which don't report a cause.
 *
 * Types with a `source() const` member are errors without specializing this.
 */
template <typename T>
inline constexpr bool enable_error = false;

namespace detail
{
constexpr std::size_t error_format_stack_buffer_size = 1024;

class error_behavior;
class error_record_base;

template <typename E>
class error_record;

template <typename M>
class message_error;
} // namespace detail
} // namespace mishap
