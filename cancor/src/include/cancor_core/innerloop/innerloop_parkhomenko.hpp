#pragma once
#include <cancor_core/innerloop/innerloop_base.hpp>

#ifndef CANCOR_CORE_INNERLOOP_PARKHOMENKO_TP
#define CANCOR_CORE_INNERLOOP_PARKHOMENKO_TP \
    template <class ValueType>
#endif
#ifndef CANCOR_CORE_INNERLOOP_PARKHOMENKO
#define CANCOR_CORE_INNERLOOP_PARKHOMENKO \
    InnerLoopParkhomenko<ValueType>
#endif

namespace cancor_core {
namespace innerloop {

/**
 * Sparse CCA of Parkhomenko et al. (2009).
 * The normalized power iteration step is soft-thresholded at c/2 and renormalized.
 */
template <class ValueType>
class InnerLoopParkhomenko: public InnerLoopBase<ValueType>
{
public:
    using base_t = InnerLoopBase<ValueType>;
    using typename base_t::value_t;
    using typename base_t::string_t;
    using typename base_t::state_t;
    using typename base_t::vec_value_t;
    using typename base_t::dyn_vec_value_t;

private:
    const dyn_vec_value_t _c_init;

    dyn_vec_value_t _c;

protected:
    void check_params(state_t& state) override;
    void update_view(state_t& state, size_t view_idx) override;

public:
    explicit InnerLoopParkhomenko(
        size_t max_iter=100,
        value_t tol=1e-5,
        bool generalized=false,
        const string_t& initialization="unregularized",
        const dyn_vec_value_t& c={},
        size_t seed=0
    );

    bool early_stop(const state_t& state) const override;

    const dyn_vec_value_t& c() const { return _c; }
};

} // namespace innerloop
} // namespace cancor_core
