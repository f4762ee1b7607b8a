#pragma once
#include <cancor_core/regression/regression_base.hpp>
#include <cancor_core/regression/regression_elastic_net.hpp>
#include <cancor_core/regression/regression_factory.hpp>
#include <cancor_core/regression/regression_least_squares.hpp>
#include <cancor_core/regression/regression_ridge.hpp>
#include <cancor_core/regression/regression_sgd.hpp>

extern template class cancor_core::regression::RegressionBase<float>;
extern template class cancor_core::regression::RegressionBase<double>;

extern template class cancor_core::regression::RegressionElasticNet<float>;
extern template class cancor_core::regression::RegressionElasticNet<double>;

extern template class cancor_core::regression::RegressionLeastSquares<float>;
extern template class cancor_core::regression::RegressionLeastSquares<double>;

extern template class cancor_core::regression::RegressionRidge<float>;
extern template class cancor_core::regression::RegressionRidge<double>;

extern template class cancor_core::regression::RegressionSGD<float>;
extern template class cancor_core::regression::RegressionSGD<double>;
