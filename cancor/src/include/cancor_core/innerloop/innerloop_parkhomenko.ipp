#pragma once
#include <cancor_core/configs.hpp>
#include <cancor_core/innerloop/innerloop_parkhomenko.hpp>
#include <cancor_core/innerloop/utils.hpp>
#include <cancor_core/optimization/proximal.hpp>

namespace cancor_core {
namespace innerloop {

CANCOR_CORE_INNERLOOP_PARKHOMENKO_TP
CANCOR_CORE_INNERLOOP_PARKHOMENKO::InnerLoopParkhomenko(
    size_t max_iter,
    value_t tol,
    bool generalized,
    const string_t& initialization,
    const dyn_vec_value_t& c,
    size_t seed
):
    base_t("InnerLoopParkhomenko", max_iter, tol, generalized, initialization, seed),
    _c_init(c)
{}

CANCOR_CORE_INNERLOOP_PARKHOMENKO_TP
void
CANCOR_CORE_INNERLOOP_PARKHOMENKO::check_params(state_t& state)
{
    _c = process_parameter<value_t>("c", _c_init, Configs::parkhomenko_c_def, state.n_views());
    for (size_t i = 0; i < _c.size(); ++i) {
        if (_c[i] <= 0) {
            throw util::cancor_core_config_error(
                "All regularisation parameters should be above 0. "
                "c=" + util::format_list(_c) + 
                " (view " + std::to_string(i) + ")."
            );
        }
    }
}

CANCOR_CORE_INNERLOOP_PARKHOMENKO_TP
void
CANCOR_CORE_INNERLOOP_PARKHOMENKO::update_view(state_t& state, size_t view_idx)
{
    const auto& X = state.views[view_idx];
    auto& w = state.weights[view_idx];

    vec_value_t target;
    sum_others(state.scores, view_idx, target);
    w.matrix() = target.matrix() * X;
    check_converged_weights(w, view_idx);
    w /= w.matrix().norm();
    optimization::soft_threshold(w, _c[view_idx] / 2, false, w);
    check_converged_weights(w, view_idx);
    w /= w.matrix().norm();
    state.scores.row(view_idx) = w.matrix() * X.transpose();
}

CANCOR_CORE_INNERLOOP_PARKHOMENKO_TP
bool
CANCOR_CORE_INNERLOOP_PARKHOMENKO::early_stop(const state_t& state) const
{
    return scores_converged(state.scores, state.old_scores, base_t::tol);
}

} // namespace innerloop
} // namespace cancor_core
