#pragma once
#include <memory>
#include <random>
#include <string>
#include <vector>
#include <cancor_core/innerloop/state_innerloop.hpp>
#include <cancor_core/util/exceptions.hpp>
#include <cancor_core/util/types.hpp>

#ifndef CANCOR_CORE_INNERLOOP_BASE_TP
#define CANCOR_CORE_INNERLOOP_BASE_TP \
    template <class ValueType>
#endif
#ifndef CANCOR_CORE_INNERLOOP_BASE
#define CANCOR_CORE_INNERLOOP_BASE \
    InnerLoopBase<ValueType>
#endif

namespace cancor_core {
namespace innerloop {

/**
 * Base class of the alternating inner loops.
 *
 * fit() runs the following:
 *  1. normalize the configuration (more than two views forces generalized mode),
 *  2. check_params() validates the strategy's hyperparameters against the views,
 *  3. initialize() sets the initial scores and weights,
 *  4. up to max_iter outer iterations, each updating every view in index order
 *     via update_view(), recording objective(), and checking early_stop()
 *     from the second iteration on.
 */
template <class ValueType>
class InnerLoopBase
{
public:
    using value_t = ValueType;
    using string_t = std::string;
    using state_t = StateInnerLoop<value_t>;
    using vec_value_t = typename state_t::vec_value_t;
    using colmat_value_t = typename state_t::colmat_value_t;
    using rowmat_value_t = typename state_t::rowmat_value_t;
    using dyn_vec_colmat_t = typename state_t::dyn_vec_colmat_t;
    using dyn_vec_value_t = std::vector<value_t>;
    using gen_t = std::mt19937;

    const string_t name;
    const size_t max_iter;
    const value_t tol;
    const bool generalized;
    const util::initialization_type initialization;
    const size_t seed;

protected:
    std::unique_ptr<state_t> _state;
    gen_t _gen;

    /*
     * Validates and normalizes hyperparameters for the given views.
     * Must throw util::cancor_core_config_error on invalid input.
     */
    virtual void check_params(state_t& state);

    virtual void initialize(state_t& state);

    /*
     * Updates state.weights[view_idx] and state.scores.row(view_idx).
     */
    virtual void update_view(state_t& state, size_t view_idx) =0;

    void inner_iteration(state_t& state);

public:
    explicit InnerLoopBase(
        const string_t& name,
        size_t max_iter,
        value_t tol,
        bool generalized,
        const string_t& initialization,
        size_t seed
    );

    virtual ~InnerLoopBase() {}

    /**
     * @brief Fits the inner loop on two or more views sharing the number of rows.
     * 
     * @param views     list of (n, p_i) matrices.
     * @return fitted state. Valid until the next call to fit().
     */
    const state_t& fit(const dyn_vec_colmat_t& views);

    /**
     * @brief Sum of the inner products of the scores over all pairs of views.
     */
    virtual value_t objective(const state_t& state) const;

    virtual bool early_stop(const state_t& state) const;

    bool is_fitted() const { return static_cast<bool>(_state); }

    const state_t& state() const;
};

} // namespace innerloop
} // namespace cancor_core
