#pragma once
#include <cancor_core/innerloop/innerloop_admm.hpp>
#include <cancor_core/innerloop/objective.hpp>
#include <cancor_core/innerloop/utils.hpp>
#include <cancor_core/optimization/proximal.hpp>

namespace cancor_core {
namespace innerloop {

CANCOR_CORE_INNERLOOP_ADMM_TP
CANCOR_CORE_INNERLOOP_ADMM::InnerLoopADMM(
    size_t max_iter,
    value_t tol,
    bool generalized,
    const string_t& initialization,
    const dyn_vec_value_t& mu,
    const dyn_vec_value_t& lam,
    const dyn_vec_value_t& c,
    const dyn_vec_value_t& eta,
    size_t seed
):
    base_t("InnerLoopADMM", max_iter, tol, generalized, initialization, seed),
    _mu_init(mu),
    _lam_init(lam),
    _c_init(c),
    _eta_init(eta)
{}

CANCOR_CORE_INNERLOOP_ADMM_TP
void
CANCOR_CORE_INNERLOOP_ADMM::check_params(state_t& state)
{
    const auto& views = state.views;
    const auto n_views = state.n_views();

    _c = process_parameter<value_t>("c", _c_init, 0, n_views);
    _lam = process_parameter<value_t>("lam", _lam_init, 1, n_views);
    if (_mu_init.empty()) {
        _mu.resize(n_views);
        for (size_t i = 0; i < n_views; ++i) {
            _mu[i] = _lam[i] / views[i].squaredNorm();
        }
    } else {
        _mu = process_parameter<value_t>("mu", _mu_init, 0, n_views);
    }
    const auto eta = process_parameter<value_t>("eta", _eta_init, 0, n_views);

    for (size_t i = 0; i < n_views; ++i) {
        if (_mu[i] <= 0) {
            throw util::cancor_core_config_error(
                "At least one mu is less than or equal to zero. "
                "mu=" + util::format_list(_mu) + 
                " (view " + std::to_string(i) + ")."
            );
        }
    }

    std::vector<size_t> failed;
    for (size_t i = 0; i < n_views; ++i) {
        if (_mu[i] < _lam[i] / views[i].squaredNorm()) failed.push_back(i);
    }
    if (!failed.empty()) {
        throw util::cancor_core_config_error(
            "mu, lam, view not matching condition specified from Parikh 2014 "
            "(mu<lam/frobenius(view)**2). "
            "Index of view(s) not meeting the condition: " + util::format_list(failed) + "."
        );
    }

    const auto n = state.n_samples();
    _eta.clear();
    _z.clear();
    for (size_t i = 0; i < n_views; ++i) {
        _eta.emplace_back(vec_value_t::Constant(n, eta[i]));
        _z.emplace_back(vec_value_t::Zero(n));
    }
    _l1_ratio.assign(n_views, 1);
}

CANCOR_CORE_INNERLOOP_ADMM_TP
void
CANCOR_CORE_INNERLOOP_ADMM::update_view(state_t& state, size_t view_idx)
{
    const auto& X = state.views[view_idx];
    auto& w = state.weights[view_idx];
    auto& z = _z[view_idx];
    auto& eta = _eta[view_idx];
    const auto mu = _mu[view_idx];
    const auto lam = _lam[view_idx];
    const auto n = X.rows();
    const auto p = X.cols();

    // penalty is scaled by n so that c is comparable across the sparse inner loops
    const value_t tau = n * _c[view_idx];

    vec_value_t target;
    sum_others(state.scores, view_idx, target);
    vec_value_t grad(p);
    grad.matrix() = target.matrix() * X;

    vec_value_t Xw(n);
    vec_value_t resid(n);
    vec_value_t w_step(p);
    for (size_t it = 0; it < base_t::max_iter; ++it) {
        Xw.matrix() = w.matrix() * X.transpose();
        resid = Xw - z + eta;
        w_step.matrix() = resid.matrix() * X;
        w_step = w - (mu / lam) * w_step;
        optimization::prox_mu_f(w_step, mu, grad, tau, w);

        Xw.matrix() = w.matrix() * X.transpose();
        optimization::prox_lam_g(Xw + eta, z);
        eta += Xw - z;
    }

    check_converged_weights(w, view_idx);
    state.scores.row(view_idx) = w.matrix() * X.transpose();
}

CANCOR_CORE_INNERLOOP_ADMM_TP
typename CANCOR_CORE_INNERLOOP_ADMM::value_t
CANCOR_CORE_INNERLOOP_ADMM::objective(const state_t& state) const
{
    return elastic_objective(state, _c, _l1_ratio);
}

CANCOR_CORE_INNERLOOP_ADMM_TP
bool
CANCOR_CORE_INNERLOOP_ADMM::early_stop(const state_t& state) const
{
    return scores_converged(state.scores, state.old_scores, base_t::tol);
}

} // namespace innerloop
} // namespace cancor_core
