#pragma once
#include <cancor_core/util/types.hpp>

namespace cancor_core {
namespace innerloop {

/**
 * @brief Objective shared by the elastic and ADMM inner loops.
 *
 *      sum_i  K ||X_i w_i - t||^2 / (2n) + c_i r_i ||w_i||_1 + c_i (1-r_i) ||w_i||_2
 *
 * where K is the number of views and t is the mean of all views' scores.
 *
 * @param state     inner loop state.
 * @param c         penalty per view.
 * @param l1_ratio  L1 fraction r_i per view.
 */
template <class StateType, class CType, class RatioType>
inline typename StateType::value_t elastic_objective(
    const StateType& state,
    const CType& c,
    const RatioType& l1_ratio
)
{
    using value_t = typename StateType::value_t;
    using vec_value_t = typename StateType::vec_value_t;

    const auto n_views = state.n_views();
    const value_t n = state.n_samples();
    const vec_value_t target = state.scores.colwise().mean().array();

    vec_value_t resid(state.n_samples());
    value_t total = 0;
    for (size_t i = 0; i < n_views; ++i) {
        const auto& w = state.weights[i];
        const value_t l1 = c[i] * l1_ratio[i];
        const value_t l2 = c[i] * (1 - l1_ratio[i]);
        resid.matrix() = w.matrix() * state.views[i].transpose();
        resid -= target;
        total += (
            n_views * resid.square().sum() / (2 * n) +
            l1 * w.abs().sum() + 
            l2 * w.matrix().norm()
        );
    }
    return total;
}

} // namespace innerloop
} // namespace cancor_core
