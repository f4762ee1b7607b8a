#include <tools/eigen_wrap.hpp>
#include <cancor_core/regression/regression_ridge.ipp>

template class cancor_core::regression::RegressionRidge<float>;
template class cancor_core::regression::RegressionRidge<double>;
