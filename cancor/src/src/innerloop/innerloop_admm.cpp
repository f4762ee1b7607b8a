#include <tools/eigen_wrap.hpp>
#include <cancor_core/innerloop/innerloop_admm.ipp>

template class cancor_core::innerloop::InnerLoopADMM<float>;
template class cancor_core::innerloop::InnerLoopADMM<double>;
