#pragma once
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <vector>
#include <cancor_core/configs.hpp>
#include <cancor_core/optimization/proximal.hpp>
#include <cancor_core/regression/regression_sgd.hpp>
#include <cancor_core/util/logger.hpp>

namespace cancor_core {
namespace regression {

CANCOR_CORE_REGRESSION_SGD_TP
CANCOR_CORE_REGRESSION_SGD::RegressionSGD(
    const std::string& penalty,
    value_t alpha,
    value_t l1_ratio,
    value_t tol,
    size_t seed
):
    base_t("sgd"),
    _penalty(util::convert_sgd_penalty(penalty)),
    _alpha(alpha),
    _l1_ratio(
        (_penalty == util::sgd_penalty_type::_l2) ? 0 : (
        (_penalty == util::sgd_penalty_type::_l1) ? 1 : l1_ratio
        )
    ),
    _tol(tol),
    _gen(seed)
{
    if (alpha < 0) {
        throw util::cancor_core_config_error("alpha must be >= 0.");
    }
    if (_l1_ratio < 0 || _l1_ratio > 1) {
        throw util::cancor_core_config_error("l1_ratio must be in [0,1].");
    }
}

CANCOR_CORE_REGRESSION_SGD_TP
void
CANCOR_CORE_REGRESSION_SGD::fit(
    const Eigen::Ref<const colmat_value_t>& X,
    const Eigen::Ref<const vec_value_t>& y
)
{
    base_t::check_fit(X, y);
    base_t::prepare_coef(X.cols());

    const auto n = X.rows();
    const value_t l1 = _alpha * _l1_ratio;
    const value_t l2 = _alpha * (1 - _l1_ratio);

    std::vector<Eigen::Index> order(n);
    std::iota(order.begin(), order.end(), 0);

    value_t best_loss = std::numeric_limits<value_t>::infinity();
    size_t n_no_change = 0;
    size_t t = 1;

    _epochs = 0;
    while (_epochs < Configs::sgd_max_epochs) {
        ++_epochs;
        std::shuffle(order.begin(), order.end(), _gen);
        value_t sum_loss = 0;
        for (const auto i : order) {
            const value_t eta = Configs::sgd_eta0 / std::pow(static_cast<value_t>(t), Configs::sgd_power_t);
            const value_t resid = (X.row(i).array() * _coef).sum() - y[i];
            sum_loss += 0.5 * resid * resid;
            _coef *= (1 - eta * l2);
            _coef -= (eta * resid) * X.row(i).array();
            if (l1 > 0) optimization::soft_threshold(_coef, eta * l1, false, _coef);
            ++t;
        }
        n_no_change = (sum_loss > best_loss - _tol * n) ? (n_no_change + 1) : 0;
        best_loss = std::min(best_loss, sum_loss);
        if (n_no_change >= Configs::sgd_n_iter_no_change) return;
    }

    util::logger()->debug(
        "RegressionSGD: max epochs ({}) reached; consider increasing Configs::sgd_max_epochs.",
        Configs::sgd_max_epochs
    );
}

} // namespace regression
} // namespace cancor_core
