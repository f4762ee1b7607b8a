#pragma once
#include <vector>
#include <cancor_core/innerloop/innerloop_base.hpp>

#ifndef CANCOR_CORE_INNERLOOP_PMD_TP
#define CANCOR_CORE_INNERLOOP_PMD_TP \
    template <class ValueType>
#endif
#ifndef CANCOR_CORE_INNERLOOP_PMD
#define CANCOR_CORE_INNERLOOP_PMD \
    InnerLoopPMD<ValueType>
#endif

namespace cancor_core {
namespace innerloop {

/**
 * Penalized matrix decomposition (Witten et al. 2009).
 * Each power iteration step is followed by a soft-thresholding calibrated
 * so that the weights have unit L2 norm and L1 norm c.
 * c must lie in [1, sqrt(p)] for every view.
 */
template <class ValueType>
class InnerLoopPMD: public InnerLoopBase<ValueType>
{
public:
    using base_t = InnerLoopBase<ValueType>;
    using typename base_t::value_t;
    using typename base_t::string_t;
    using typename base_t::state_t;
    using typename base_t::vec_value_t;
    using typename base_t::dyn_vec_value_t;
    using dyn_vec_bool_t = std::vector<bool>;

private:
    const dyn_vec_value_t _c_init;
    const dyn_vec_bool_t _positive_init;

    dyn_vec_value_t _c;
    dyn_vec_bool_t _positive;

protected:
    void check_params(state_t& state) override;
    void update_view(state_t& state, size_t view_idx) override;

public:
    explicit InnerLoopPMD(
        size_t max_iter=100,
        value_t tol=1e-5,
        bool generalized=false,
        const string_t& initialization="unregularized",
        const dyn_vec_value_t& c={},
        const dyn_vec_bool_t& positive={},
        size_t seed=0
    );

    bool early_stop(const state_t& state) const override;

    const dyn_vec_value_t& c() const { return _c; }
    const dyn_vec_bool_t& positive() const { return _positive; }
};

} // namespace innerloop
} // namespace cancor_core
