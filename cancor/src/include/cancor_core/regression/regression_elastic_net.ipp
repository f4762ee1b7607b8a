#pragma once
#include <cancor_core/configs.hpp>
#include <cancor_core/optimization/elnet_full.hpp>
#include <cancor_core/regression/regression_elastic_net.hpp>
#include <cancor_core/util/logger.hpp>

namespace cancor_core {
namespace regression {
namespace elastic_net {

/*
 * Coordinate descent on the Gram form of the elastic net.
 * coef holds the warm start on entry and the solution on exit.
 * Hitting the iteration cap is not an error: the current iterate is kept.
 */
template <class ValueType>
inline void coordinate_descent(
    const Eigen::Ref<const util::colmat_type<ValueType>>& X,
    const Eigen::Ref<const util::rowvec_type<ValueType>>& y,
    ValueType l1,
    ValueType l2,
    bool positive,
    Eigen::Ref<util::rowvec_type<ValueType>> coef
)
{
    using value_t = ValueType;
    using vec_value_t = util::rowvec_type<value_t>;
    using colmat_value_t = util::colmat_type<value_t>;

    const value_t n = X.rows();
    const auto p = X.cols();

    colmat_value_t quad = (X.transpose() * X) / n;
    quad.diagonal().array() += l2;
    vec_value_t grad(p);
    grad.matrix() = y.matrix() * X / n - coef.matrix() * quad;
    const vec_value_t penalty = vec_value_t::Constant(p, l1);
    const value_t tol = Configs::regression_tol * y.square().sum() / n;

    optimization::StateElnetFull<colmat_value_t> state(
        quad, penalty, positive, Configs::regression_max_iters, tol, coef, grad
    );
    try {
        state.solve();
    } catch (const util::max_iters_error& e) {
        util::logger()->debug("{} (objective may not have converged)", e.what());
    }
}

} // namespace elastic_net

CANCOR_CORE_REGRESSION_ELASTIC_NET_TP
CANCOR_CORE_REGRESSION_ELASTIC_NET::RegressionElasticNet(
    value_t alpha,
    value_t l1_ratio,
    bool positive,
    bool warm_start,
    const string_t& name
):
    base_t(name),
    _alpha(alpha),
    _l1_ratio(l1_ratio),
    _positive(positive),
    _warm_start(warm_start)
{
    if (alpha < 0) {
        throw util::cancor_core_config_error("alpha must be >= 0.");
    }
    if (l1_ratio < 0 || l1_ratio > 1) {
        throw util::cancor_core_config_error("l1_ratio must be in [0,1].");
    }
}

CANCOR_CORE_REGRESSION_ELASTIC_NET_TP
void
CANCOR_CORE_REGRESSION_ELASTIC_NET::fit(
    const Eigen::Ref<const colmat_value_t>& X,
    const Eigen::Ref<const vec_value_t>& y
)
{
    base_t::check_fit(X, y);
    if (!_warm_start) _coef.resize(0);
    base_t::prepare_coef(X.cols());
    elastic_net::coordinate_descent<value_t>(
        X, y, 
        _alpha * _l1_ratio, 
        _alpha * (1 - _l1_ratio), 
        _positive, 
        _coef
    );
}

} // namespace regression
} // namespace cancor_core
