#pragma once
#include <vector>
#include <cancor_core/util/types.hpp>

namespace cancor_core {
namespace innerloop {

/**
 * Per-fit state of an inner loop.
 * Created at the start of InnerLoopBase::fit() and returned by it.
 */
template <class ValueType>
struct StateInnerLoop
{
    using value_t = ValueType;
    using vec_value_t = util::rowvec_type<value_t>;
    using colmat_value_t = util::colmat_type<value_t>;
    using rowmat_value_t = util::rowmat_type<value_t>;
    using dyn_vec_colmat_t = std::vector<colmat_value_t>;
    using dyn_vec_vec_value_t = std::vector<vec_value_t>;
    using dyn_vec_value_t = std::vector<value_t>;

    /* static states */
    const dyn_vec_colmat_t views;

    /* configurations */
    bool generalized;
    bool generalized_forced = false;

    /* dynamic states */
    dyn_vec_vec_value_t weights;
    rowmat_value_t scores;          // (n_views, n)
    rowmat_value_t old_scores;      // scores at the start of the current iteration
    dyn_vec_value_t objective;      // one value per outer iteration
    size_t iters = 0;
    bool converged = false;

    double time_elapsed = 0;

    explicit StateInnerLoop(
        const dyn_vec_colmat_t& views,
        bool generalized
    ):
        views(views),
        generalized(generalized),
        weights(views.size())
    {}

    size_t n_views() const { return views.size(); }
    Eigen::Index n_samples() const { return views.empty() ? 0 : views[0].rows(); }
};

} // namespace innerloop
} // namespace cancor_core
