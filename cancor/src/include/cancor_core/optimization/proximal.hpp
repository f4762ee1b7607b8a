#pragma once
#include <cancor_core/util/types.hpp>

namespace cancor_core {
namespace optimization {

/**
 * @brief Elementwise soft-thresholding sign(x) * max(|x| - threshold, 0).
 *
 * @param x         input array.
 * @param threshold non-negative threshold.
 * @param positive  if true, negative outputs are set to zero.
 * @param out       output array of the same size as x (may alias x).
 */
template <class XType, class ValueType, class OutType>
inline
void soft_threshold(
    const XType& x,
    ValueType threshold,
    bool positive,
    OutType&& out
)
{
    out = x.sign() * (x.abs() - threshold).max(0);
    if (positive) out = out.max(0);
}

/**
 * @brief Proximal map of the L1 term in gradient-shifted coordinates (Suo et al. 2017).
 *
 * Computes elementwise
 *
 *      x + mu (g - tau)    if x + mu g >  mu tau,
 *      x + mu (g + tau)    if x + mu g < -mu tau,
 *      0                   otherwise.
 *
 * @param x     current point.
 * @param mu    step size.
 * @param g     linear (gradient) term.
 * @param tau   L1 penalty.
 * @param out   output array. Must not alias x or g.
 */
template <class XType, class ValueType, class GType, class OutType>
inline
void prox_mu_f(
    const XType& x,
    ValueType mu,
    const GType& g,
    ValueType tau,
    OutType&& out
)
{
    const auto shifted = x + mu * g;
    out = (shifted > mu * tau).select(
        x + mu * (g - tau),
        (shifted < -mu * tau).select(
            x + mu * (g + tau),
            ValueType(0)
        )
    );
}

/**
 * @brief Projection onto the unit L2 ball.
 *
 * @param x     input array.
 * @param out   output array (may alias x).
 */
template <class XType, class OutType>
inline
void prox_lam_g(
    const XType& x,
    OutType&& out
)
{
    const auto norm = x.matrix().norm();
    if (norm < 1) {
        out = x;
    } else {
        out = x / norm;
    }
}

} // namespace optimization
} // namespace cancor_core
