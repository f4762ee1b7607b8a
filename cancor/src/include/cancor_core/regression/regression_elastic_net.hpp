#pragma once
#include <cancor_core/regression/regression_base.hpp>

#ifndef CANCOR_CORE_REGRESSION_ELASTIC_NET_TP
#define CANCOR_CORE_REGRESSION_ELASTIC_NET_TP \
    template <class ValueType>
#endif
#ifndef CANCOR_CORE_REGRESSION_ELASTIC_NET
#define CANCOR_CORE_REGRESSION_ELASTIC_NET \
    RegressionElasticNet<ValueType>
#endif

namespace cancor_core {
namespace regression {

/**
 * Elastic net regression
 *
 *      minimize_w  1/(2n) ||y - X w||^2 + alpha l1_ratio ||w||_1 + alpha (1-l1_ratio)/2 ||w||^2
 *
 * solved by coordinate descent, warm-started from the previous coefficients.
 * The lasso is the special case l1_ratio = 1.
 */
template <class ValueType>
class RegressionElasticNet: public RegressionBase<ValueType>
{
public:
    using base_t = RegressionBase<ValueType>;
    using typename base_t::value_t;
    using typename base_t::string_t;
    using typename base_t::vec_value_t;
    using typename base_t::colmat_value_t;

private:
    using base_t::_coef;

    const value_t _alpha;
    const value_t _l1_ratio;
    const bool _positive;
    const bool _warm_start;

public:
    explicit RegressionElasticNet(
        value_t alpha,
        value_t l1_ratio,
        bool positive,
        bool warm_start=true,
        const string_t& name="elastic_net"
    );

    void fit(
        const Eigen::Ref<const colmat_value_t>& X,
        const Eigen::Ref<const vec_value_t>& y
    ) override;
};

} // namespace regression
} // namespace cancor_core
