#pragma once

#include <boost/iterator/iterator_facade.hpp>

#include <mishap/error/error_ref.hpp>

namespace mishap
{
/**
 * @brief Walks the cause chain of an error, starting with the error itself.
 *
 * The walk is lazy and single pass: iterating advances the chain object
 * itself, therefore a partially consumed chain can't be restarted. Ask the
 * error for a new chain instead. A chain must not outlive the error it has
 * been obtained from.
 *
 * Cyclic cause chains are not detected and iterate forever.
 */
class error_chain
{
public:
    class iterator;

    explicit error_chain(error_ref root) noexcept
        : mNext(root)
    {
    }

    auto begin() noexcept -> iterator;
    auto end() noexcept -> iterator;

private:
    error_ref mNext;
};

class error_chain::iterator
    : public boost::iterator_facade<error_chain::iterator,
                                    error_ref,
                                    boost::single_pass_traversal_tag,
                                    error_ref>
{
    friend class boost::iterator_core_access;

public:
    iterator() noexcept = default;
    explicit iterator(error_chain &owner) noexcept
        : mOwner(&owner)
    {
    }

private:
    [[nodiscard]] auto equal(iterator const &other) const noexcept -> bool
    {
        return exhausted() == other.exhausted();
    }

    [[nodiscard]] auto dereference() const noexcept -> error_ref
    {
        return mOwner->mNext;
    }
    void increment() noexcept
    {
        mOwner->mNext = mOwner->mNext.source();
    }

    [[nodiscard]] auto exhausted() const noexcept -> bool
    {
        return mOwner == nullptr || !mOwner->mNext;
    }

    error_chain *mOwner{nullptr};
};

inline auto error_chain::begin() noexcept -> iterator
{
    return iterator{*this};
}
inline auto error_chain::end() noexcept -> iterator
{
    return iterator{};
}

} // namespace mishap
