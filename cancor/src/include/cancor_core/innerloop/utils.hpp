#pragma once
#include <string>
#include <vector>
#include <cancor_core/util/exceptions.hpp>
#include <cancor_core/util/format.hpp>
#include <cancor_core/util/types.hpp>

namespace cancor_core {
namespace innerloop {

/**
 * @brief Expands a hyperparameter into one value per view.
 *
 * An empty parameter takes the default for every view,
 * a single value is broadcast to every view,
 * and a list must have exactly one value per view.
 *
 * @param name          name of the parameter (used in error messages).
 * @param parameter     user-supplied values.
 * @param default_value value used when parameter is empty.
 * @param n_views       number of views.
 */
template <class T>
inline std::vector<T> process_parameter(
    const std::string& name,
    const std::vector<T>& parameter,
    T default_value,
    size_t n_views
)
{
    if (parameter.empty()) return std::vector<T>(n_views, default_value);
    if (parameter.size() == 1) return std::vector<T>(n_views, parameter[0]);
    if (parameter.size() != n_views) {
        throw util::cancor_core_config_error(
            util::format(
                "number of views passed should match number of parameter %s "
                "(len(views)=%d and len(%s)=%d).",
                name.c_str(), static_cast<int>(n_views), 
                name.c_str(), static_cast<int>(parameter.size())
            )
        );
    }
    return parameter;
}

/**
 * @brief Throws a degenerate error if the weights are all zero or non-finite.
 */
template <class WType>
inline void check_converged_weights(
    const WType& w,
    int view_idx
)
{
    if (!w.allFinite() || !(w.matrix().norm() > 0)) {
        throw util::cancor_core_degenerate_error(view_idx);
    }
}

template <class AType, class BType>
inline auto cosine_similarity(
    const AType& a,
    const BType& b
)
{
    return (a * b).sum() / (a.matrix().norm() * b.matrix().norm());
}

/**
 * @brief True if every view's scores point (up to tol) in the same direction as before.
 *
 * @param scores        (n_views, n) current scores.
 * @param old_scores    (n_views, n) scores at the start of the iteration.
 * @param tol           tolerance on 1 - cosine similarity.
 */
template <class ScoresType, class ValueType>
inline bool scores_converged(
    const ScoresType& scores,
    const ScoresType& old_scores,
    ValueType tol
)
{
    if (old_scores.rows() != scores.rows()) return false;
    for (Eigen::Index k = 0; k < scores.rows(); ++k) {
        const auto sim = cosine_similarity(scores.row(k).array(), old_scores.row(k).array());
        if (!(sim > 1 - tol)) return false;
    }
    return true;
}

/**
 * @brief Sum of the scores of every view except view_idx.
 */
template <class ScoresType, class OutType>
inline void sum_others(
    const ScoresType& scores,
    Eigen::Index view_idx,
    OutType& out
)
{
    out.setZero(scores.cols());
    for (Eigen::Index k = 0; k < scores.rows(); ++k) {
        if (k == view_idx) continue;
        out += scores.row(k).array();
    }
}

} // namespace innerloop
} // namespace cancor_core
