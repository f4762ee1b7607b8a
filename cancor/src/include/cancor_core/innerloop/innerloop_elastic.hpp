#pragma once
#include <memory>
#include <vector>
#include <cancor_core/innerloop/innerloop_base.hpp>
#include <cancor_core/regression/regression_base.hpp>

#ifndef CANCOR_CORE_INNERLOOP_ELASTIC_TP
#define CANCOR_CORE_INNERLOOP_ELASTIC_TP \
    template <class ValueType>
#endif
#ifndef CANCOR_CORE_INNERLOOP_ELASTIC
#define CANCOR_CORE_INNERLOOP_ELASTIC \
    InnerLoopElastic<ValueType>
#endif

namespace cancor_core {
namespace innerloop {

/**
 * Elastic net regularized CCA by alternating regressions (Waaijenborg et al. 2008).
 *
 * Each view's weights are the coefficients of a penalized regression of 
 * the target scores on the view, rescaled so that the view's scores have unit norm.
 * The target is the mean of the other views' scores in generalized mode,
 * and otherwise the scores of the preceding view (cyclically).
 * With constrained=true the unit-norm condition is instead enforced 
 * through a multiplier gamma found by bisection.
 */
template <class ValueType>
class InnerLoopElastic: public InnerLoopBase<ValueType>
{
public:
    using base_t = InnerLoopBase<ValueType>;
    using typename base_t::value_t;
    using typename base_t::string_t;
    using typename base_t::state_t;
    using typename base_t::vec_value_t;
    using typename base_t::colmat_value_t;
    using typename base_t::dyn_vec_value_t;
    using dyn_vec_bool_t = std::vector<bool>;
    using regression_t = regression::RegressionBase<value_t>;
    using dyn_vec_regression_t = std::vector<std::unique_ptr<regression_t>>;

    const bool constrained;
    const bool stochastic;

private:
    const dyn_vec_value_t _c_init;
    const dyn_vec_value_t _l1_ratio_init;
    const dyn_vec_bool_t _positive_init;

    dyn_vec_value_t _c;
    dyn_vec_value_t _l1_ratio;
    dyn_vec_bool_t _positive;
    dyn_vec_value_t _gamma;
    dyn_vec_regression_t _regressions;

    void elastic_solver(
        state_t& state,
        const Eigen::Ref<const vec_value_t>& target,
        size_t view_idx
    );

    void elastic_solver_constrained(
        state_t& state,
        const Eigen::Ref<const vec_value_t>& target,
        size_t view_idx
    );

protected:
    void check_params(state_t& state) override;
    void update_view(state_t& state, size_t view_idx) override;

public:
    explicit InnerLoopElastic(
        size_t max_iter=100,
        value_t tol=1e-5,
        bool generalized=false,
        const string_t& initialization="unregularized",
        const dyn_vec_value_t& c={},
        const dyn_vec_value_t& l1_ratio={},
        bool constrained=false,
        bool stochastic=false,
        const dyn_vec_bool_t& positive={},
        size_t seed=0
    );

    value_t objective(const state_t& state) const override;
    bool early_stop(const state_t& state) const override;

    const dyn_vec_value_t& c() const { return _c; }
    const dyn_vec_value_t& l1_ratio() const { return _l1_ratio; }
    const dyn_vec_value_t& gamma() const { return _gamma; }
    const dyn_vec_regression_t& regressions() const { return _regressions; }
};

} // namespace innerloop
} // namespace cancor_core
