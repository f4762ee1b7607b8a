#pragma once
#include <Eigen/Cholesky>
#include <cancor_core/regression/regression_ridge.hpp>

namespace cancor_core {
namespace regression {

CANCOR_CORE_REGRESSION_RIDGE_TP
CANCOR_CORE_REGRESSION_RIDGE::RegressionRidge(
    value_t alpha
):
    base_t("ridge"),
    _alpha(alpha)
{
    if (alpha <= 0) {
        throw util::cancor_core_config_error("alpha must be > 0.");
    }
}

CANCOR_CORE_REGRESSION_RIDGE_TP
void
CANCOR_CORE_REGRESSION_RIDGE::fit(
    const Eigen::Ref<const colmat_value_t>& X,
    const Eigen::Ref<const vec_value_t>& y
)
{
    base_t::check_fit(X, y);

    colmat_value_t quad = X.transpose() * X;
    quad.diagonal().array() += _alpha;
    const Eigen::LDLT<colmat_value_t> ldlt(quad);
    _coef = ldlt.solve(X.transpose() * y.matrix().transpose()).transpose().array();
}

} // namespace regression
} // namespace cancor_core
