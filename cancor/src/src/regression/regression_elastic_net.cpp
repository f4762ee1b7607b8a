#include <tools/eigen_wrap.hpp>
#include <cancor_core/regression/regression_elastic_net.ipp>

template class cancor_core::regression::RegressionElasticNet<float>;
template class cancor_core::regression::RegressionElasticNet<double>;
