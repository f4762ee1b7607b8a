#pragma once
#include <vector>
#include <cancor_core/innerloop/innerloop_base.hpp>

#ifndef CANCOR_CORE_INNERLOOP_ADMM_TP
#define CANCOR_CORE_INNERLOOP_ADMM_TP \
    template <class ValueType>
#endif
#ifndef CANCOR_CORE_INNERLOOP_ADMM
#define CANCOR_CORE_INNERLOOP_ADMM \
    InnerLoopADMM<ValueType>
#endif

namespace cancor_core {
namespace innerloop {

/**
 * Sparse CCA by linearized ADMM (Suo et al. 2017).
 *
 * Each view update runs max_iter ADMM iterations (no early exit) on 
 *
 *      minimize_w  -g^T w + n c ||w||_1    s.t.  ||X w||_2 <= 1
 *
 * where g is the projection of the other views' scores onto the view.
 * The auxiliary variable z and the scaled dual eta persist across outer iterations.
 * mu and lam must satisfy mu >= lam / ||X||_F^2 for every view (Parikh and Boyd 2014).
 */
template <class ValueType>
class InnerLoopADMM: public InnerLoopBase<ValueType>
{
public:
    using base_t = InnerLoopBase<ValueType>;
    using typename base_t::value_t;
    using typename base_t::string_t;
    using typename base_t::state_t;
    using typename base_t::vec_value_t;
    using typename base_t::dyn_vec_value_t;
    using dyn_vec_vec_value_t = std::vector<vec_value_t>;

private:
    const dyn_vec_value_t _mu_init;
    const dyn_vec_value_t _lam_init;
    const dyn_vec_value_t _c_init;
    const dyn_vec_value_t _eta_init;

    dyn_vec_value_t _mu;
    dyn_vec_value_t _lam;
    dyn_vec_value_t _c;
    dyn_vec_value_t _l1_ratio;
    dyn_vec_vec_value_t _eta;
    dyn_vec_vec_value_t _z;

protected:
    void check_params(state_t& state) override;
    void update_view(state_t& state, size_t view_idx) override;

public:
    explicit InnerLoopADMM(
        size_t max_iter=100,
        value_t tol=1e-5,
        bool generalized=false,
        const string_t& initialization="unregularized",
        const dyn_vec_value_t& mu={},
        const dyn_vec_value_t& lam={},
        const dyn_vec_value_t& c={},
        const dyn_vec_value_t& eta={},
        size_t seed=0
    );

    value_t objective(const state_t& state) const override;
    bool early_stop(const state_t& state) const override;

    const dyn_vec_value_t& mu() const { return _mu; }
    const dyn_vec_value_t& lam() const { return _lam; }
    const dyn_vec_value_t& c() const { return _c; }
    const dyn_vec_vec_value_t& eta() const { return _eta; }
    const dyn_vec_vec_value_t& z() const { return _z; }
};

} // namespace innerloop
} // namespace cancor_core
