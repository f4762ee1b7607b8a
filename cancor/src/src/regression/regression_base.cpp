#include <tools/eigen_wrap.hpp>
#include <cancor_core/regression/regression_base.hpp>

template class cancor_core::regression::RegressionBase<float>;
template class cancor_core::regression::RegressionBase<double>;
