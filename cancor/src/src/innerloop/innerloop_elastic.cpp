#include <tools/eigen_wrap.hpp>
#include <cancor_core/innerloop/innerloop_elastic.ipp>

template class cancor_core::innerloop::InnerLoopElastic<float>;
template class cancor_core::innerloop::InnerLoopElastic<double>;
