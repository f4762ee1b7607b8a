#pragma once
#include <algorithm>

namespace cancor_core {
namespace optimization {

/**
 * @brief One step of a bracketing bisection for a monotone root-finding problem.
 *
 * The problem must be set up so that a larger parameter yields a larger function value.
 * The bracket [lower, upper] is tightened in place using the current point.
 * The caller owns the stopping rule.
 *
 * @param current       current parameter value.
 * @param previous      previous parameter value.
 * @param current_val   function value at current.
 * @param previous_val  function value at previous.
 *                      On the first step, pass current_val.
 * @param lower         largest parameter known to give a function value <= 0.
 * @param upper         smallest parameter known to give a function value > 0.
 * @return next parameter candidate.
 */
template <class ValueType>
inline
ValueType bin_search(
    ValueType current,
    ValueType previous,
    ValueType current_val,
    ValueType previous_val,
    ValueType& lower,
    ValueType& upper
)
{
    ValueType next;
    if (current_val <= 0) {
        // root lies above current
        next = (previous_val <= 0) ? (current + upper) / 2 : (current + previous) / 2;
        lower = std::max(lower, current);
    } else {
        next = (previous_val > 0) ? (current + lower) / 2 : (current + previous) / 2;
        upper = std::min(upper, current);
    }
    return next;
}

} // namespace optimization 
} // namespace cancor_core
