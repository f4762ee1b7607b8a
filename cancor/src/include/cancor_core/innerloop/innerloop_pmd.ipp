#pragma once
#include <cmath>
#include <cancor_core/innerloop/innerloop_pmd.hpp>
#include <cancor_core/innerloop/utils.hpp>
#include <cancor_core/optimization/delta_search.hpp>

namespace cancor_core {
namespace innerloop {

CANCOR_CORE_INNERLOOP_PMD_TP
CANCOR_CORE_INNERLOOP_PMD::InnerLoopPMD(
    size_t max_iter,
    value_t tol,
    bool generalized,
    const string_t& initialization,
    const dyn_vec_value_t& c,
    const dyn_vec_bool_t& positive,
    size_t seed
):
    base_t("InnerLoopPMD", max_iter, tol, generalized, initialization, seed),
    _c_init(c),
    _positive_init(positive)
{}

CANCOR_CORE_INNERLOOP_PMD_TP
void
CANCOR_CORE_INNERLOOP_PMD::check_params(state_t& state)
{
    const auto n_views = state.n_views();
    _c = process_parameter<value_t>("c", _c_init, 1, n_views);
    for (size_t i = 0; i < n_views; ++i) {
        if (_c[i] < 1) {
            throw util::cancor_core_config_error(
                "All regularisation parameters should be at least 1. "
                "c=" + util::format_list(_c) + 
                " (view " + std::to_string(i) + ")."
            );
        }
    }
    dyn_vec_value_t shape_sqrts(n_views);
    for (size_t i = 0; i < n_views; ++i) {
        shape_sqrts[i] = std::sqrt(static_cast<value_t>(state.views[i].cols()));
    }
    for (size_t i = 0; i < n_views; ++i) {
        if (_c[i] > shape_sqrts[i]) {
            throw util::cancor_core_config_error(
                "All regularisation parameters should be less than "
                "the square root of number of the respective view. "
                "c=" + util::format_list(_c) + 
                ", limit of each view: " + util::format_list(shape_sqrts) +
                " (view " + std::to_string(i) + ")."
            );
        }
    }
    _positive = process_parameter<bool>("positive", _positive_init, false, n_views);
}

CANCOR_CORE_INNERLOOP_PMD_TP
void
CANCOR_CORE_INNERLOOP_PMD::update_view(state_t& state, size_t view_idx)
{
    const auto& X = state.views[view_idx];
    auto& w = state.weights[view_idx];

    vec_value_t target;
    sum_others(state.scores, view_idx, target);
    vec_value_t w_raw(X.cols());
    w_raw.matrix() = target.matrix() * X;
    w.resize(X.cols());
    optimization::delta_search(
        w_raw, _c[view_idx], _positive[view_idx], w
    );
    check_converged_weights(w, view_idx);
    state.scores.row(view_idx) = w.matrix() * X.transpose();
}

CANCOR_CORE_INNERLOOP_PMD_TP
bool
CANCOR_CORE_INNERLOOP_PMD::early_stop(const state_t& state) const
{
    return scores_converged(state.scores, state.old_scores, base_t::tol);
}

} // namespace innerloop
} // namespace cancor_core
