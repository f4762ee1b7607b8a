#pragma once
#include <cancor_core/innerloop/innerloop_admm.hpp>
#include <cancor_core/innerloop/innerloop_base.hpp>
#include <cancor_core/innerloop/innerloop_elastic.hpp>
#include <cancor_core/innerloop/innerloop_parkhomenko.hpp>
#include <cancor_core/innerloop/innerloop_pls.hpp>
#include <cancor_core/innerloop/innerloop_pmd.hpp>

extern template class cancor_core::innerloop::InnerLoopBase<float>;
extern template class cancor_core::innerloop::InnerLoopBase<double>;

extern template class cancor_core::innerloop::InnerLoopPLS<float>;
extern template class cancor_core::innerloop::InnerLoopPLS<double>;

extern template class cancor_core::innerloop::InnerLoopPMD<float>;
extern template class cancor_core::innerloop::InnerLoopPMD<double>;

extern template class cancor_core::innerloop::InnerLoopParkhomenko<float>;
extern template class cancor_core::innerloop::InnerLoopParkhomenko<double>;

extern template class cancor_core::innerloop::InnerLoopElastic<float>;
extern template class cancor_core::innerloop::InnerLoopElastic<double>;

extern template class cancor_core::innerloop::InnerLoopADMM<float>;
extern template class cancor_core::innerloop::InnerLoopADMM<double>;
