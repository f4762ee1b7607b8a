#include <tools/eigen_wrap.hpp>
#include <cancor_core/regression/regression_sgd.ipp>

template class cancor_core::regression::RegressionSGD<float>;
template class cancor_core::regression::RegressionSGD<double>;
