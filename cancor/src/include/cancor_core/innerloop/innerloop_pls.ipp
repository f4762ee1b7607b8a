#pragma once
#include <cancor_core/innerloop/innerloop_pls.hpp>
#include <cancor_core/innerloop/utils.hpp>

namespace cancor_core {
namespace innerloop {

CANCOR_CORE_INNERLOOP_PLS_TP
CANCOR_CORE_INNERLOOP_PLS::InnerLoopPLS(
    size_t max_iter,
    value_t tol,
    bool generalized,
    const string_t& initialization,
    size_t seed
):
    base_t("InnerLoopPLS", max_iter, tol, generalized, initialization, seed)
{}

CANCOR_CORE_INNERLOOP_PLS_TP
void
CANCOR_CORE_INNERLOOP_PLS::update_view(state_t& state, size_t view_idx)
{
    const auto& X = state.views[view_idx];
    auto& w = state.weights[view_idx];

    vec_value_t target;
    sum_others(state.scores, view_idx, target);
    w.matrix() = target.matrix() * X;
    w /= w.matrix().norm();
    state.scores.row(view_idx) = w.matrix() * X.transpose();
}

CANCOR_CORE_INNERLOOP_PLS_TP
bool
CANCOR_CORE_INNERLOOP_PLS::early_stop(const state_t& state) const
{
    return scores_converged(state.scores, state.old_scores, base_t::tol);
}

} // namespace innerloop
} // namespace cancor_core
