#pragma once
#include <memory>
#include <cancor_core/regression/regression_base.hpp>
#include <cancor_core/regression/regression_elastic_net.hpp>
#include <cancor_core/regression/regression_least_squares.hpp>
#include <cancor_core/regression/regression_ridge.hpp>
#include <cancor_core/regression/regression_sgd.hpp>

namespace cancor_core {
namespace regression {

/**
 * @brief Chooses the regression solver for a penalty configuration.
 *
 *  - stochastic:       SGD (any penalty).
 *  - alpha == 0:       least squares (non-negative if positive).
 *  - l1_ratio == 0:    ridge, or elastic net with l1_ratio = 0 if positive.
 *  - l1_ratio == 1:    lasso.
 *  - otherwise:        elastic net.
 */
template <class ValueType>
inline util::regression_type select_regression(
    ValueType alpha,
    ValueType l1_ratio,
    bool positive,
    bool stochastic
)
{
    if (stochastic) return util::regression_type::_sgd;
    if (alpha == 0) return util::regression_type::_least_squares;
    if (l1_ratio == 0) {
        return positive ? util::regression_type::_elastic_net : util::regression_type::_ridge;
    }
    if (l1_ratio == 1) return util::regression_type::_lasso;
    return util::regression_type::_elastic_net;
}

/**
 * @brief Constructs the regression solver chosen by select_regression().
 *
 * @param alpha         overall penalty strength.
 * @param l1_ratio      fraction of the penalty on the L1 norm.
 * @param positive      constrain coefficients to be non-negative
 *                      (ignored by the stochastic solver).
 * @param stochastic    use the online SGD solver.
 * @param tol           stopping tolerance of the stochastic solver.
 * @param seed          seed of the stochastic solver's sample order.
 */
template <class ValueType>
std::unique_ptr<RegressionBase<ValueType>> make_regression(
    ValueType alpha,
    ValueType l1_ratio,
    bool positive,
    bool stochastic,
    ValueType tol,
    size_t seed
)
{
    using value_t = ValueType;
    using base_t = RegressionBase<value_t>;

    const auto type = select_regression<value_t>(alpha, l1_ratio, positive, stochastic);
    std::unique_ptr<base_t> out;
    switch (type) {
        case util::regression_type::_sgd: {
            const auto penalty = (
                (l1_ratio == 0) ? "l2" : (
                (l1_ratio == 1) ? "l1" : "elasticnet"
                )
            );
            out = std::make_unique<RegressionSGD<value_t>>(penalty, alpha, l1_ratio, tol, seed);
            break;
        }
        case util::regression_type::_least_squares: {
            out = std::make_unique<RegressionLeastSquares<value_t>>(positive);
            break;
        }
        case util::regression_type::_ridge: {
            out = std::make_unique<RegressionRidge<value_t>>(alpha);
            break;
        }
        case util::regression_type::_lasso: {
            out = std::make_unique<RegressionElasticNet<value_t>>(alpha, 1, positive, true, "lasso");
            break;
        }
        case util::regression_type::_elastic_net: {
            out = std::make_unique<RegressionElasticNet<value_t>>(alpha, l1_ratio, positive);
            break;
        }
    }
    return out;
}

} // namespace regression
} // namespace cancor_core
