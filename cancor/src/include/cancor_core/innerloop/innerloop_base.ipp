#pragma once
#include <cmath>
#include <cancor_core/innerloop/innerloop_base.hpp>
#include <cancor_core/innerloop/innerloop_pls.hpp>
#include <cancor_core/util/format.hpp>
#include <cancor_core/util/logger.hpp>
#include <cancor_core/util/stopwatch.hpp>

namespace cancor_core {
namespace innerloop {

CANCOR_CORE_INNERLOOP_BASE_TP
CANCOR_CORE_INNERLOOP_BASE::InnerLoopBase(
    const string_t& name,
    size_t max_iter,
    value_t tol,
    bool generalized,
    const string_t& initialization,
    size_t seed
):
    name(name),
    max_iter(max_iter),
    tol(tol),
    generalized(generalized),
    initialization(util::convert_initialization(initialization)),
    seed(seed),
    _state(),
    _gen(seed)
{
    if (tol < 0) {
        throw util::cancor_core_config_error("tol must be >= 0.");
    }
}

CANCOR_CORE_INNERLOOP_BASE_TP
void
CANCOR_CORE_INNERLOOP_BASE::check_params(state_t&)
{}

CANCOR_CORE_INNERLOOP_BASE_TP
void
CANCOR_CORE_INNERLOOP_BASE::initialize(state_t& state)
{
    std::uniform_real_distribution<value_t> unif(0, 1);
    const auto n_views = state.n_views();
    const auto n = state.n_samples();

    switch (initialization) {
        case util::initialization_type::_random: {
            state.scores = rowmat_value_t::NullaryExpr(
                n_views, n, [&]() { return unif(_gen); }
            );
            break;
        }
        case util::initialization_type::_uniform: {
            state.scores.setOnes(n_views, n);
            state.scores /= std::sqrt(static_cast<value_t>(n));
            break;
        }
        case util::initialization_type::_unregularized: {
            InnerLoopPLS<value_t> pls(100, 1e-5, state.generalized, "random", seed);
            state.scores = pls.fit(state.views).scores;
            const vec_value_t norms = state.scores.rowwise().norm().transpose().array();
            for (size_t k = 0; k < n_views; ++k) {
                state.scores.row(k) /= norms[k];
            }
            break;
        }
    }

    for (size_t k = 0; k < n_views; ++k) {
        state.weights[k] = vec_value_t::NullaryExpr(
            state.views[k].cols(), [&]() { return unif(_gen); }
        );
    }
}

CANCOR_CORE_INNERLOOP_BASE_TP
void
CANCOR_CORE_INNERLOOP_BASE::inner_iteration(state_t& state)
{
    for (size_t i = 0; i < state.n_views(); ++i) {
        update_view(state, i);
    }
}

CANCOR_CORE_INNERLOOP_BASE_TP
const typename CANCOR_CORE_INNERLOOP_BASE::state_t&
CANCOR_CORE_INNERLOOP_BASE::fit(const dyn_vec_colmat_t& views)
{
    _state.reset();

    if (views.size() < 2) {
        throw util::cancor_core_config_error(
            util::format(
                "%s: at least 2 views are required (got %d).",
                name.c_str(), static_cast<int>(views.size())
            )
        );
    }
    const auto n = views[0].rows();
    for (size_t k = 1; k < views.size(); ++k) {
        if (views[k].rows() != n) {
            throw util::cancor_core_config_error(
                util::format(
                    "%s: all views must have the same number of rows "
                    "(view 0 has %d, view %d has %d).",
                    name.c_str(), static_cast<int>(n), 
                    static_cast<int>(k), static_cast<int>(views[k].rows())
                )
            );
        }
    }

    auto state = std::make_unique<state_t>(views, generalized);
    if (state->n_views() > 2 && !state->generalized) {
        state->generalized = true;
        state->generalized_forced = true;
        util::logger()->warn(
            "{}: for more than 2 views require generalized=True (got {} views); "
            "using generalized mode.",
            name, state->n_views()
        );
    }

    _gen.seed(seed);
    check_params(*state);
    initialize(*state);

    util::Stopwatch sw;
    for (size_t it = 0; it < max_iter; ++it) {
        inner_iteration(*state);
        state->objective.push_back(objective(*state));
        state->iters = it + 1;
        if (it > 0 && early_stop(*state)) {
            state->converged = true;
            break;
        }
        state->old_scores = state->scores;
    }
    state->time_elapsed = sw.elapsed();

    util::logger()->debug(
        "{}: {} iterations ({}converged), objective={}",
        name, state->iters, state->converged ? "" : "not ", 
        state->objective.empty() ? value_t(0) : state->objective.back()
    );

    _state = std::move(state);
    return *_state;
}

CANCOR_CORE_INNERLOOP_BASE_TP
typename CANCOR_CORE_INNERLOOP_BASE::value_t
CANCOR_CORE_INNERLOOP_BASE::objective(const state_t& state) const
{
    const auto& scores = state.scores;
    value_t obj = 0;
    for (Eigen::Index i = 0; i < scores.rows(); ++i) {
        for (Eigen::Index j = i+1; j < scores.rows(); ++j) {
            obj += scores.row(i).dot(scores.row(j));
        }
    }
    return obj;
}

CANCOR_CORE_INNERLOOP_BASE_TP
bool
CANCOR_CORE_INNERLOOP_BASE::early_stop(const state_t&) const
{
    return false;
}

CANCOR_CORE_INNERLOOP_BASE_TP
const typename CANCOR_CORE_INNERLOOP_BASE::state_t&
CANCOR_CORE_INNERLOOP_BASE::state() const
{
    if (!_state) {
        throw util::cancor_core_error(name + ": fit() has not been called.");
    }
    return *_state;
}

} // namespace innerloop
} // namespace cancor_core
