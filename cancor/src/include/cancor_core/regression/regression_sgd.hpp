#pragma once
#include <random>
#include <cancor_core/regression/regression_base.hpp>

#ifndef CANCOR_CORE_REGRESSION_SGD_TP
#define CANCOR_CORE_REGRESSION_SGD_TP \
    template <class ValueType>
#endif
#ifndef CANCOR_CORE_REGRESSION_SGD
#define CANCOR_CORE_REGRESSION_SGD \
    RegressionSGD<ValueType>
#endif

namespace cancor_core {
namespace regression {

/**
 * Online linear regression by stochastic gradient descent on
 *
 *      1/n sum_i 1/2 (y_i - x_i^T w)^2 + alpha R(w)
 *
 * where R is 1/2 ||w||^2 (l2), ||w||_1 (l1), 
 * or l1_ratio ||w||_1 + (1-l1_ratio)/2 ||w||^2 (elasticnet).
 * The step size follows the inverse scaling schedule eta0 / t^power_t.
 * The L1 part is applied by truncation after each step.
 * Samples are visited in a shuffled order drawn from a seeded generator.
 * Successive calls to fit() warm-start from the previous coefficients.
 */
template <class ValueType>
class RegressionSGD: public RegressionBase<ValueType>
{
public:
    using base_t = RegressionBase<ValueType>;
    using typename base_t::value_t;
    using typename base_t::vec_value_t;
    using typename base_t::colmat_value_t;

private:
    using base_t::_coef;

    const util::sgd_penalty_type _penalty;
    const value_t _alpha;
    const value_t _l1_ratio;
    const value_t _tol;
    std::mt19937 _gen;

    size_t _epochs = 0;

public:
    explicit RegressionSGD(
        const std::string& penalty,
        value_t alpha,
        value_t l1_ratio,
        value_t tol,
        size_t seed
    );

    void fit(
        const Eigen::Ref<const colmat_value_t>& X,
        const Eigen::Ref<const vec_value_t>& y
    ) override;

    /* number of epochs run by the last call to fit() */
    size_t epochs() const { return _epochs; }
};

} // namespace regression
} // namespace cancor_core
