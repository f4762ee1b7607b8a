#include <tools/eigen_wrap.hpp>
#include <cancor_core/innerloop/innerloop_pls.ipp>

template class cancor_core::innerloop::InnerLoopPLS<float>;
template class cancor_core::innerloop::InnerLoopPLS<double>;
