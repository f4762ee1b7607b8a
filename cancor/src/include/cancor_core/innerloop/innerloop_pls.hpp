#pragma once
#include <cancor_core/innerloop/innerloop_base.hpp>

#ifndef CANCOR_CORE_INNERLOOP_PLS_TP
#define CANCOR_CORE_INNERLOOP_PLS_TP \
    template <class ValueType>
#endif
#ifndef CANCOR_CORE_INNERLOOP_PLS
#define CANCOR_CORE_INNERLOOP_PLS \
    InnerLoopPLS<ValueType>
#endif

namespace cancor_core {
namespace innerloop {

/**
 * Unregularized alternating power iteration (PLS).
 * Each view's weights are the normalized projection of the sum of the other views' scores.
 */
template <class ValueType>
class InnerLoopPLS: public InnerLoopBase<ValueType>
{
public:
    using base_t = InnerLoopBase<ValueType>;
    using typename base_t::value_t;
    using typename base_t::string_t;
    using typename base_t::state_t;
    using typename base_t::vec_value_t;

protected:
    void update_view(state_t& state, size_t view_idx) override;

public:
    explicit InnerLoopPLS(
        size_t max_iter=100,
        value_t tol=1e-5,
        bool generalized=false,
        const string_t& initialization="unregularized",
        size_t seed=0
    );

    bool early_stop(const state_t& state) const override;
};

} // namespace innerloop
} // namespace cancor_core
