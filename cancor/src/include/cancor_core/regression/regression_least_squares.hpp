#pragma once
#include <cancor_core/regression/regression_base.hpp>

#ifndef CANCOR_CORE_REGRESSION_LEAST_SQUARES_TP
#define CANCOR_CORE_REGRESSION_LEAST_SQUARES_TP \
    template <class ValueType>
#endif
#ifndef CANCOR_CORE_REGRESSION_LEAST_SQUARES
#define CANCOR_CORE_REGRESSION_LEAST_SQUARES \
    RegressionLeastSquares<ValueType>
#endif

namespace cancor_core {
namespace regression {

/**
 * Ordinary least squares. 
 * Returns the minimum-norm solution when X is rank deficient.
 * If positive is true, solves the non-negative least squares problem instead.
 */
template <class ValueType>
class RegressionLeastSquares: public RegressionBase<ValueType>
{
public:
    using base_t = RegressionBase<ValueType>;
    using typename base_t::value_t;
    using typename base_t::vec_value_t;
    using typename base_t::colmat_value_t;

private:
    using base_t::_coef;

    const bool _positive;

public:
    explicit RegressionLeastSquares(
        bool positive
    );

    void fit(
        const Eigen::Ref<const colmat_value_t>& X,
        const Eigen::Ref<const vec_value_t>& y
    ) override;
};

} // namespace regression
} // namespace cancor_core
