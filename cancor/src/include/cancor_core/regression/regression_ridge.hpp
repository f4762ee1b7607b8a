#pragma once
#include <cancor_core/regression/regression_base.hpp>

#ifndef CANCOR_CORE_REGRESSION_RIDGE_TP
#define CANCOR_CORE_REGRESSION_RIDGE_TP \
    template <class ValueType>
#endif
#ifndef CANCOR_CORE_REGRESSION_RIDGE
#define CANCOR_CORE_REGRESSION_RIDGE \
    RegressionRidge<ValueType>
#endif

namespace cancor_core {
namespace regression {

/**
 * Ridge regression
 *
 *      minimize_w  ||y - X w||^2 + alpha ||w||^2
 *
 * solved in closed form.
 */
template <class ValueType>
class RegressionRidge: public RegressionBase<ValueType>
{
public:
    using base_t = RegressionBase<ValueType>;
    using typename base_t::value_t;
    using typename base_t::vec_value_t;
    using typename base_t::colmat_value_t;

private:
    using base_t::_coef;

    const value_t _alpha;

public:
    explicit RegressionRidge(
        value_t alpha
    );

    void fit(
        const Eigen::Ref<const colmat_value_t>& X,
        const Eigen::Ref<const vec_value_t>& y
    ) override;
};

} // namespace regression
} // namespace cancor_core
