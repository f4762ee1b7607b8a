#include <tools/eigen_wrap.hpp>
#include <cancor_core/innerloop/innerloop_base.ipp>

template class cancor_core::innerloop::InnerLoopBase<float>;
template class cancor_core::innerloop::InnerLoopBase<double>;
