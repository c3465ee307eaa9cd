#pragma once

#include <memory>
#include <optional>
#include <typeinfo>
#include <utility>

#include <mishap/error/backtrace.hpp>
#include <mishap/error/error_ref.hpp>
#include <mishap/error/message_error.hpp>

namespace mishap::detail
{
/**
 * @brief The heap allocation owned by a mishap::error.
 *
 * Holds the identity token, the backtrace captured on construction (if the
 * value didn't bring its own) and, in the derived error_record<E>, the value
 * itself as the trailing member. The vtable ties all of it to E.
 */
class error_record_base
{
public:
    error_record_base(error_record_base const &) = delete;
    error_record_base(error_record_base &&) = delete;
    auto operator=(error_record_base const &) -> error_record_base & = delete;
    auto operator=(error_record_base &&) -> error_record_base & = delete;

    virtual ~error_record_base() noexcept = default;

    // a view of the stored value
    [[nodiscard]] virtual auto view() const noexcept -> error_ref = 0;
    // the object whose type is identified by type()
    [[nodiscard]] virtual auto target() noexcept -> void * = 0;

    [[nodiscard]] auto type() const noexcept -> std::type_info const &
    {
        return *mType;
    }
    [[nodiscard]] auto captured_backtrace() const noexcept
            -> std::optional<backtrace> const &
    {
        return mBacktrace;
    }

protected:
    error_record_base(std::type_info const &type,
                      std::optional<backtrace> &&bt) noexcept
        : mType(&type)
        , mBacktrace(std::move(bt))
    {
    }

private:
    std::type_info const *mType;
    std::optional<backtrace> mBacktrace;
};

template <typename E>
inline auto target_of(E &value) noexcept -> void *
{
    return std::addressof(value);
}
template <typename M>
inline auto target_of(message_error<M> &value) noexcept -> void *
{
    return std::addressof(value.message());
}

template <typename E>
class error_record final : public error_record_base
{
public:
    template <typename U>
    error_record(std::type_info const &type,
                 std::optional<backtrace> &&bt,
                 U &&value)
        : error_record_base(type, std::move(bt))
        , mValue(std::forward<U>(value))
    {
    }

    [[nodiscard]] auto view() const noexcept -> error_ref override
    {
        return error_ref(mValue);
    }
    [[nodiscard]] auto target() noexcept -> void * override
    {
        return target_of(mValue);
    }

private:
    E mValue;
};

/**
 * @brief Moves value into a new record.
 *
 * Captures a backtrace unless the value carries one already. Allocation
 * failure is not recoverable, the caller is expected to be noexcept.
 */
template <error_type E, typename U>
inline auto make_error_record(std::type_info const &type, U &&value)
        -> std::unique_ptr<error_record_base>
{
    std::optional<backtrace> bt;
    if (error_traits<E>::backtrace(value) == nullptr)
    {
        bt.emplace(backtrace::capture());
    }
    return std::make_unique<error_record<E>>(type, std::move(bt),
                                             std::forward<U>(value));
}
} // namespace mishap::detail
