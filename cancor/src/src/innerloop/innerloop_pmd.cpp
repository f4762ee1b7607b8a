#include <tools/eigen_wrap.hpp>
#include <cancor_core/innerloop/innerloop_pmd.ipp>

template class cancor_core::innerloop::InnerLoopPMD<float>;
template class cancor_core::innerloop::InnerLoopPMD<double>;
