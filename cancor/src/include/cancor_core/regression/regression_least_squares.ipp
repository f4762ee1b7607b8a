#pragma once
#include <Eigen/QR>
#include <cancor_core/regression/regression_elastic_net.ipp>
#include <cancor_core/regression/regression_least_squares.hpp>

namespace cancor_core {
namespace regression {

CANCOR_CORE_REGRESSION_LEAST_SQUARES_TP
CANCOR_CORE_REGRESSION_LEAST_SQUARES::RegressionLeastSquares(
    bool positive
):
    base_t("least_squares"),
    _positive(positive)
{}

CANCOR_CORE_REGRESSION_LEAST_SQUARES_TP
void
CANCOR_CORE_REGRESSION_LEAST_SQUARES::fit(
    const Eigen::Ref<const colmat_value_t>& X,
    const Eigen::Ref<const vec_value_t>& y
)
{
    base_t::check_fit(X, y);

    if (_positive) {
        // NNLS by coordinate descent starting from zero
        _coef.setZero(X.cols());
        elastic_net::coordinate_descent<value_t>(X, y, 0, 0, true, _coef);
        return;
    }

    const Eigen::CompleteOrthogonalDecomposition<colmat_value_t> cod(X);
    _coef = cod.solve(y.matrix().transpose()).transpose().array();
}

} // namespace regression
} // namespace cancor_core
