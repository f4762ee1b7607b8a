#include <tools/eigen_wrap.hpp>
#include <cancor_core/innerloop/innerloop_parkhomenko.ipp>

template class cancor_core::innerloop::InnerLoopParkhomenko<float>;
template class cancor_core::innerloop::InnerLoopParkhomenko<double>;
