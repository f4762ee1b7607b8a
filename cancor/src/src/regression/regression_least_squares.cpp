#include <tools/eigen_wrap.hpp>
#include <cancor_core/regression/regression_least_squares.ipp>

template class cancor_core::regression::RegressionLeastSquares<float>;
template class cancor_core::regression::RegressionLeastSquares<double>;
