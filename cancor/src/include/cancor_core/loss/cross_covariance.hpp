#pragma once
#include <cmath>
#include <cancor_core/configs.hpp>
#include <cancor_core/util/exceptions.hpp>
#include <cancor_core/util/format.hpp>
#include <cancor_core/util/types.hpp>

namespace cancor_core {
namespace loss {

template <class ValueType>
struct CrossCovarianceLoss
{
    using value_t = ValueType;

    value_t objective;
    value_t invariance;
    value_t covariance;
};

/**
 * @brief Standardizes each column to mean zero and (biased) variance one.
 *
 * @param z     (n, d) embeddings.
 * @param eps   added to the variance before taking the square root.
 * @param out   (n, d) standardized embeddings.
 */
template <class ZType, class ValueType, class OutType>
inline void batch_normalize(
    const ZType& z,
    ValueType eps,
    OutType& out
)
{
    const auto n = z.rows();
    out = z.rowwise() - z.colwise().mean();
    const util::rowvec_type<ValueType> var = out.array().square().colwise().sum() / static_cast<ValueType>(n);
    out.array().rowwise() /= (var + eps).sqrt();
}

/**
 * @brief Redundancy-reduction loss between two batch-normalized embeddings
 * (Zbontar et al. 2021).
 *
 * With C = z1^T z2 / n computed on the batch-normalized embeddings,
 * invariance = sum_k (1 - C_kk)^2 and covariance = sum_{k != l} C_kl^2.
 *
 * @param z1    (n, d) embeddings of the first view.
 * @param z2    (n, d) embeddings of the second view.
 */
template <class ValueType>
CrossCovarianceLoss<ValueType> cross_covariance_loss(
    const Eigen::Ref<const util::colmat_type<ValueType>>& z1,
    const Eigen::Ref<const util::colmat_type<ValueType>>& z2
)
{
    using value_t = ValueType;
    using colmat_value_t = util::colmat_type<value_t>;

    if (z1.rows() != z2.rows() || z1.cols() != z2.cols()) {
        throw util::cancor_core_config_error(
            util::format(
                "cross_covariance_loss() is given inconsistent inputs! "
                "(z1=(%d, %d), z2=(%d, %d))",
                static_cast<int>(z1.rows()), static_cast<int>(z1.cols()),
                static_cast<int>(z2.rows()), static_cast<int>(z2.cols())
            )
        );
    }

    const value_t eps = Configs::batch_norm_eps;
    colmat_value_t z1_bn, z2_bn;
    batch_normalize(z1, eps, z1_bn);
    batch_normalize(z2, eps, z2_bn);

    const colmat_value_t cross_cov = (z1_bn.transpose() * z2_bn) / static_cast<value_t>(z1.rows());
    const value_t invariance = (1 - cross_cov.diagonal().array()).square().sum();
    const value_t covariance = cross_cov.array().square().sum() - cross_cov.diagonal().array().square().sum();

    return {invariance + covariance, invariance, covariance};
}

} // namespace loss
} // namespace cancor_core
