#pragma once
#include <algorithm>
#include <cmath>
#include <type_traits>
#include <cancor_core/util/exceptions.hpp>
#include <cancor_core/util/types.hpp>

namespace cancor_core {
namespace optimization {

/**
 * Solves the (optionally sign-constrained) elastic net in covariance form
 *
 *      minimize_x  1/2 x^T Q x - v^T x + omega^T |x|     (s.t. x >= 0 if positive)
 *
 * by cyclic coordinate descent, where Q is a dense positive semi-definite matrix
 * that already includes any ridge term on its diagonal.
 * The gradient grad = v - Q x must be consistent with x on entry
 * and is kept consistent on exit.
 */
template <class MatrixType>
struct StateElnetFull
{
    using matrix_t = MatrixType;
    using value_t = typename std::decay_t<MatrixType>::Scalar;
    using vec_value_t = util::rowvec_type<value_t>;
    using map_vec_value_t = Eigen::Map<vec_value_t>;
    using map_cvec_value_t = Eigen::Map<const vec_value_t>;
    using map_cmatrix_t = Eigen::Map<const matrix_t>;

    const map_cmatrix_t quad;
    const map_cvec_value_t penalty;
    const bool positive;

    const size_t max_iters;
    const value_t tol;

    size_t iters = 0;
    map_vec_value_t x;      
    map_vec_value_t grad;

    explicit StateElnetFull(
        const Eigen::Ref<const matrix_t>& quad,
        const Eigen::Ref<const vec_value_t>& penalty,
        bool positive,
        size_t max_iters,
        value_t tol,
        Eigen::Ref<vec_value_t> x,
        Eigen::Ref<vec_value_t> grad
    ):
        quad(quad.data(), quad.rows(), quad.cols()),
        penalty(penalty.data(), penalty.size()),
        positive(positive),
        max_iters(max_iters),
        tol(tol),
        x(x.data(), x.size()),
        grad(grad.data(), grad.size())
    {
        const auto d = quad.rows();

        if (quad.cols() != d) {
            throw util::cancor_core_solver_error(
                "quad must be (d, d). "
            );
        }
        if (penalty.size() != d) {
            throw util::cancor_core_solver_error(
                "penalty must be (d,) where quad is (d, d). "
            );
        }
        if (tol < 0) {
            throw util::cancor_core_solver_error(
                "tol must be >= 0."
            );
        }
        if (x.size() != d) {
            throw util::cancor_core_solver_error(
                "x must be (d,) where quad is (d, d). "
            );
        }
        if (grad.size() != d) {
            throw util::cancor_core_solver_error(
                "grad must be (d,) where quad is (d, d). "
            );
        }
    }

    void solve()
    {
        const auto n = x.size();

        iters = 0;

        while (iters < max_iters) {
            value_t convg_measure = 0;
            ++iters;
            for (int i = 0; i < n; ++i) {
                const auto qii = quad(i,i);
                const auto pi = penalty[i];
                auto& xi = x[i];
                const auto gi = grad[i];
                const auto xi_old = xi;
                if (qii <= 0) {
                    // zero column contributes nothing
                    xi = 0;
                } else {
                    const auto gi0 = gi + qii * xi_old;
                    const auto gi0_abs = std::abs(gi0);
                    if (positive) {
                        xi = (gi0 <= pi) ? 0 : (gi0 - pi) / qii;
                    } else {
                        xi = (gi0_abs <= pi) ? 0 : std::copysign((gi0_abs - pi) / qii, gi0);
                    }
                }
                const auto del = xi - xi_old;
                if (del == 0) continue;
                const auto scaled_del_sq = qii * del * del; 
                convg_measure = std::max<value_t>(convg_measure, scaled_del_sq);
                if constexpr (matrix_t::IsRowMajor) {
                    grad -= del * quad.array().row(i);
                } else {
                    grad -= del * quad.array().col(i).transpose();
                }
            }
            if (convg_measure < tol) return;
        }

        throw util::max_iters_error("StateElnetFull");
    }
};

} // namespace optimization
} // namespace cancor_core
