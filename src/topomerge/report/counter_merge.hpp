/**
 * @file counter_merge.hpp
 * @brief Merge primitives for optional 64-bit counters.
 */
#pragma once
#include "topomerge/common/common.hpp"

namespace topomerge
{

/**
 * @brief A 64-bit counter that may be absent.
 *
 * @details
 * Absent means the probe did not measure the field; it is distinct from a
 * measured zero. Absent merges as "take the other side unchanged".
 */
using OptionalCounter = std::optional<std::uint64_t>;

/**
 * @brief Addition reducer for traffic counters.
 * @note Wraps silently on overflow.
 */
struct SumReducer
{
    constexpr std::uint64_t operator()(std::uint64_t dst, std::uint64_t src) const noexcept
    {
        return dst + src;
    }
};

/**
 * @brief Maximum reducer for high-water marks.
 */
struct MaxReducer
{
    constexpr std::uint64_t operator()(std::uint64_t dst, std::uint64_t src) const noexcept
    {
        return dst > src ? dst : src;
    }
};

/**
 * @brief Combine two optional counters with a reducer.
 *
 * @details
 * - `src` absent: the result is `dst` unchanged (absent stays absent).
 * - `src` present, `dst` absent: the result is `src`.
 * - Both present: the result is `op(*dst, *src)`.
 *
 * Absence acts as the identity element of the reducer, so both `SumReducer`
 * and `MaxReducer` are commutative, associative and (for max) idempotent over
 * optional values.
 *
 * @tparam Reducer A callable with signature `uint64_t(uint64_t, uint64_t)`.
 */
template <typename Reducer>
OptionalCounter merge_counter(const OptionalCounter& dst, const OptionalCounter& src, Reducer op)
{
    static_assert(std::is_invocable_r_v<std::uint64_t, Reducer&, std::uint64_t, std::uint64_t>,
        "Reducer must be callable as uint64_t(uint64_t, uint64_t)");
    if (!src)
    {
        return dst;
    }
    if (!dst)
    {
        return src;
    }
    return op(*dst, *src);
}

} // namespace topomerge
