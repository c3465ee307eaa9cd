#pragma once

#include <exception>
#include <string>
#include <utility>

#include <mishap/error.hpp>

namespace mishap
{
class error_exception final : public std::exception
{
public:
    error_exception() = delete;
    explicit error_exception(mishap::error err) noexcept;

    auto what() const noexcept -> char const * override;

    auto error() const & noexcept -> mishap::error const &
    {
        return mErr;
    }
    auto error() && noexcept -> mishap::error &&
    {
        return std::move(mErr);
    }

private:
    mishap::error mErr;
    mutable std::string mErrDesc;
};

inline error_exception::error_exception(mishap::error err) noexcept
    : mErr{std::move(err)}
    , mErrDesc{}
{
}
} // namespace mishap
