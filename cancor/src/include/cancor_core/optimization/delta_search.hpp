#pragma once
#include <cmath>
#include <cancor_core/configs.hpp>
#include <cancor_core/optimization/bisect.hpp>
#include <cancor_core/optimization/proximal.hpp>
#include <cancor_core/util/types.hpp>

namespace cancor_core {
namespace optimization {

/**
 * @brief Calibrates a soft-threshold level so that the thresholded, 
 * L2-normalized weights have L1 norm equal to c (Witten et al. 2009).
 *
 * The input is first normalized to unit L2 norm.
 * The threshold is bisected on [0, Configs::delta_upper] starting from init.
 * Terminates when the L1 norm is within Configs::bisect_tol of c,
 * the bracket width drops below Configs::bisect_width_tol,
 * or after Configs::bisect_max_iters steps.
 *
 * @param w         weights after one power iteration.
 * @param c         target L1 norm.
 * @param positive  if true, thresholding also clamps negative entries to zero.
 * @param out       calibrated weights with unit L2 norm.
 * @param init      initial threshold.
 * @return number of bisection steps taken.
 */
template <class WType, class ValueType, class OutType>
inline
size_t delta_search(
    const WType& w,
    ValueType c,
    bool positive,
    OutType&& out,
    ValueType init=0
)
{
    using value_t = ValueType;
    using vec_value_t = util::rowvec_type<value_t>;

    const vec_value_t w_unit = w / w.matrix().norm();

    value_t lower = 0;
    value_t upper = Configs::delta_upper;
    value_t current = init;
    value_t previous = current;
    value_t previous_val = 0;

    size_t iters = 0;
    while (true) {
        ++iters;
        soft_threshold(w_unit, current, positive, out);
        const value_t out_norm = out.matrix().norm();
        if (out_norm > 0) out /= out_norm;
        const value_t current_val = c - out.matrix().template lpNorm<1>();
        if (iters == 1) previous_val = current_val;
        const auto next = bin_search(current, previous, current_val, previous_val, lower, upper);
        previous = current;
        current = next;
        previous_val = current_val;
        if (
            (std::abs(current_val) < Configs::bisect_tol) ||
            (std::abs(upper - lower) < Configs::bisect_width_tol) ||
            (iters >= Configs::bisect_max_iters)
        ) break;
    }
    return iters;
}

} // namespace optimization
} // namespace cancor_core
