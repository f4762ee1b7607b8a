#pragma once
#include <cmath>
#include <cancor_core/configs.hpp>
#include <cancor_core/innerloop/innerloop_elastic.hpp>
#include <cancor_core/innerloop/objective.hpp>
#include <cancor_core/innerloop/utils.hpp>
#include <cancor_core/optimization/bisect.hpp>
#include <cancor_core/regression/regression_factory.hpp>

namespace cancor_core {
namespace innerloop {

CANCOR_CORE_INNERLOOP_ELASTIC_TP
CANCOR_CORE_INNERLOOP_ELASTIC::InnerLoopElastic(
    size_t max_iter,
    value_t tol,
    bool generalized,
    const string_t& initialization,
    const dyn_vec_value_t& c,
    const dyn_vec_value_t& l1_ratio,
    bool constrained,
    bool stochastic,
    const dyn_vec_bool_t& positive,
    size_t seed
):
    base_t("InnerLoopElastic", max_iter, tol, generalized, initialization, seed),
    constrained(constrained),
    stochastic(stochastic),
    _c_init(c),
    _l1_ratio_init(l1_ratio),
    _positive_init(positive)
{}

CANCOR_CORE_INNERLOOP_ELASTIC_TP
void
CANCOR_CORE_INNERLOOP_ELASTIC::check_params(state_t& state)
{
    const auto n_views = state.n_views();
    _c = process_parameter<value_t>("c", _c_init, 0, n_views);
    _l1_ratio = process_parameter<value_t>("l1_ratio", _l1_ratio_init, 0, n_views);
    _positive = process_parameter<bool>("positive", _positive_init, false, n_views);
    for (size_t i = 0; i < n_views; ++i) {
        if (_c[i] < 0) {
            throw util::cancor_core_config_error(
                "All regularisation parameters should be at least 0. "
                "c=" + util::format_list(_c) + 
                " (view " + std::to_string(i) + ")."
            );
        }
        if (_l1_ratio[i] < 0 || _l1_ratio[i] > 1) {
            throw util::cancor_core_config_error(
                "All l1_ratio parameters should be in [0,1]. "
                "l1_ratio=" + util::format_list(_l1_ratio) + 
                " (view " + std::to_string(i) + ")."
            );
        }
    }

    _gamma.assign(n_views, 0);
    _regressions.clear();
    for (size_t i = 0; i < n_views; ++i) {
        _regressions.emplace_back(
            regression::make_regression<value_t>(
                _c[i] / n_views, 
                _l1_ratio[i], 
                _positive[i], 
                stochastic, 
                base_t::tol, 
                base_t::seed + i
            )
        );
    }
}

CANCOR_CORE_INNERLOOP_ELASTIC_TP
void
CANCOR_CORE_INNERLOOP_ELASTIC::update_view(state_t& state, size_t view_idx)
{
    const auto n_views = state.n_views();
    const auto& X = state.views[view_idx];
    auto& w = state.weights[view_idx];

    vec_value_t target;
    if (state.generalized) {
        sum_others(state.scores, view_idx, target);
        target /= static_cast<value_t>(n_views - 1);
    } else {
        target = state.scores.row((view_idx + n_views - 1) % n_views).array();
    }

    if (constrained) {
        elastic_solver_constrained(state, target, view_idx);
    } else {
        elastic_solver(state, target, view_idx);
    }
    check_converged_weights(w, view_idx);
    state.scores.row(view_idx) = w.matrix() * X.transpose();
}

CANCOR_CORE_INNERLOOP_ELASTIC_TP
void
CANCOR_CORE_INNERLOOP_ELASTIC::elastic_solver(
    state_t& state,
    const Eigen::Ref<const vec_value_t>& target,
    size_t view_idx
)
{
    const auto& X = state.views[view_idx];
    auto& w = state.weights[view_idx];
    auto& regression = *_regressions[view_idx];

    regression.fit(X, target);
    w = regression.coef();
    w /= (w.matrix() * X.transpose()).norm();
}

CANCOR_CORE_INNERLOOP_ELASTIC_TP
void
CANCOR_CORE_INNERLOOP_ELASTIC::elastic_solver_constrained(
    state_t& state,
    const Eigen::Ref<const vec_value_t>& target,
    size_t view_idx
)
{
    const auto& X = state.views[view_idx];
    auto& regression = *_regressions[view_idx];
    auto& gamma = _gamma[view_idx];

    value_t lower = -1;
    value_t upper = 1;
    value_t previous = gamma;
    value_t previous_val = 0;

    colmat_value_t X_scaled(X.rows(), X.cols());
    vec_value_t y_scaled(X.rows());
    vec_value_t coef;

    size_t iters = 0;
    while (true) {
        ++iters;
        const auto scale = std::sqrt(gamma + 1);
        X_scaled = scale * X;
        y_scaled = target / scale;
        regression.fit(X_scaled, y_scaled);
        coef = regression.coef();
        const value_t current_val = 1 - (coef.matrix() * X.transpose()).norm();
        if (iters == 1) previous_val = current_val;
        const auto next = optimization::bin_search(gamma, previous, current_val, previous_val, lower, upper);
        previous = gamma;
        gamma = next;
        previous_val = current_val;
        if (
            (std::abs(current_val) < Configs::bisect_tol) ||
            (std::abs(upper - lower) < Configs::bisect_width_tol) ||
            (iters >= Configs::bisect_max_iters)
        ) break;
    }
    state.weights[view_idx] = coef;
}

CANCOR_CORE_INNERLOOP_ELASTIC_TP
typename CANCOR_CORE_INNERLOOP_ELASTIC::value_t
CANCOR_CORE_INNERLOOP_ELASTIC::objective(const state_t& state) const
{
    return elastic_objective(state, _c, _l1_ratio);
}

CANCOR_CORE_INNERLOOP_ELASTIC_TP
bool
CANCOR_CORE_INNERLOOP_ELASTIC::early_stop(const state_t& state) const
{
    return scores_converged(state.scores, state.old_scores, base_t::tol);
}

} // namespace innerloop
} // namespace cancor_core
