#include <gtest/gtest.h>
#include <initializer_list>
#include <random>
#include <cancor_core/configs.hpp>
#include <regression/regression.hpp>

namespace cc = cancor_core;

namespace {

using vec_t = cc::util::rowvec_type<double>;
using colmat_t = cc::util::colmat_type<double>;

struct RegressionData
{
    colmat_t X;
    vec_t w;
    vec_t y;
};

/*
 * y = X w (+ noise) with standard normal X.
 */
RegressionData make_data(
    Eigen::Index n, 
    const vec_t& w, 
    double noise,
    size_t seed
)
{
    std::mt19937 gen(seed);
    std::normal_distribution<double> norm(0, 1);
    RegressionData data;
    data.X = colmat_t::NullaryExpr(n, w.size(), [&]() { return norm(gen); });
    data.w = w;
    data.y.resize(n);
    data.y.matrix() = w.matrix() * data.X.transpose();
    data.y += noise * vec_t::NullaryExpr(n, [&]() { return norm(gen); });
    return data;
}

vec_t make_vec(std::initializer_list<double> l)
{
    vec_t out(l.size());
    Eigen::Index i = 0;
    for (auto x : l) out[i++] = x;
    return out;
}

} // namespace

TEST(RegressionLeastSquares, recovers_exact_fit)
{
    const auto data = make_data(50, make_vec({1, -2, 0.5, 3}), 0, 0);
    cc::regression::RegressionLeastSquares<double> reg(false);
    reg.fit(data.X, data.y);
    EXPECT_TRUE(reg.coef().isApprox(data.w, 1e-8));
}

TEST(RegressionLeastSquares, normal_equations)
{
    const auto data = make_data(40, make_vec({0.3, 0, -1, 2, 0.1}), 0.5, 1);
    cc::regression::RegressionLeastSquares<double> reg(false);
    reg.fit(data.X, data.y);
    const vec_t resid = data.y - (reg.coef().matrix() * data.X.transpose()).array();
    const vec_t grad = (resid.matrix() * data.X).array();
    EXPECT_LT(grad.abs().maxCoeff(), 1e-8);
}

TEST(RegressionLeastSquares, rank_deficient)
{
    auto data = make_data(30, make_vec({1, 1, 1}), 0, 2);
    // duplicate column: minimum-norm solution splits the weight evenly
    data.X.col(2) = data.X.col(1);
    data.y.matrix() = data.w.matrix() * data.X.transpose();
    cc::regression::RegressionLeastSquares<double> reg(false);
    reg.fit(data.X, data.y);
    EXPECT_NEAR(reg.coef()[0], 1, 1e-8);
    EXPECT_NEAR(reg.coef()[1], 1, 1e-8);
    EXPECT_NEAR(reg.coef()[2], 1, 1e-8);
}

TEST(RegressionLeastSquares, non_negative)
{
    const auto data = make_data(60, make_vec({1, -2, 0.5, 0}), 0.1, 3);
    cc::regression::RegressionLeastSquares<double> reg(true);
    reg.fit(data.X, data.y);
    EXPECT_TRUE((reg.coef() >= 0.0).all());
    // the negative coefficient is clamped
    EXPECT_DOUBLE_EQ(reg.coef()[1], 0);
    EXPECT_GT(reg.coef()[0], 0);
}

TEST(RegressionRidge, stationarity)
{
    const auto data = make_data(40, make_vec({1, -1, 2}), 0.2, 4);
    const double alpha = 3;
    cc::regression::RegressionRidge<double> reg(alpha);
    reg.fit(data.X, data.y);
    const auto& w = reg.coef();
    const vec_t resid = (w.matrix() * data.X.transpose()).array() - data.y;
    const vec_t grad = (resid.matrix() * data.X).array() + alpha * w;
    EXPECT_LT(grad.abs().maxCoeff(), 1e-8);
}

TEST(RegressionRidge, shrinks)
{
    const auto data = make_data(40, make_vec({1, -1, 2}), 0.2, 5);
    cc::regression::RegressionRidge<double> small(1e-3);
    cc::regression::RegressionRidge<double> large(1e3);
    small.fit(data.X, data.y);
    large.fit(data.X, data.y);
    EXPECT_LT(large.coef().matrix().norm(), small.coef().matrix().norm());
}

TEST(RegressionRidge, invalid_alpha)
{
    EXPECT_THROW(cc::regression::RegressionRidge<double>(0), cc::util::cancor_core_config_error);
}

TEST(RegressionElasticNet, large_penalty_is_zero)
{
    const auto data = make_data(50, make_vec({1, -2, 0.5}), 0.1, 6);
    const double n = data.X.rows();
    const double alpha_max = (data.y.matrix() * data.X).array().abs().maxCoeff() / n;
    cc::regression::RegressionElasticNet<double> reg(1.1 * alpha_max, 1, false);
    reg.fit(data.X, data.y);
    EXPECT_TRUE((reg.coef() == 0.0).all());
}

TEST(RegressionElasticNet, lasso_selects)
{
    const auto data = make_data(100, make_vec({3, 0, 0, -3, 0}), 0.1, 7);
    cc::regression::RegressionElasticNet<double> reg(0.5, 1, false);
    reg.fit(data.X, data.y);
    const auto& w = reg.coef();
    EXPECT_GT(w[0], 1);
    EXPECT_LT(w[3], -1);
    EXPECT_EQ((w != 0.0).count(), 2);
}

TEST(RegressionElasticNet, positive)
{
    const auto data = make_data(60, make_vec({1, -2, 0.5}), 0.1, 8);
    cc::regression::RegressionElasticNet<double> reg(0.01, 0.5, true);
    reg.fit(data.X, data.y);
    EXPECT_TRUE((reg.coef() >= 0.0).all());
    EXPECT_DOUBLE_EQ(reg.coef()[1], 0);
}

TEST(RegressionElasticNet, warm_start_is_consistent)
{
    const auto data = make_data(60, make_vec({1, -2, 0.5}), 0.1, 9);
    cc::regression::RegressionElasticNet<double> warm(0.05, 0.5, false, true);
    cc::regression::RegressionElasticNet<double> cold(0.05, 0.5, false, false);
    warm.fit(data.X, data.y);
    warm.fit(data.X, data.y);
    cold.fit(data.X, data.y);
    EXPECT_TRUE(warm.coef().isApprox(cold.coef(), 5e-2));
}

TEST(RegressionElasticNet, inconsistent_inputs)
{
    const auto data = make_data(20, make_vec({1, 2}), 0, 10);
    cc::regression::RegressionElasticNet<double> reg(0.1, 0.5, false);
    const vec_t y = vec_t::Zero(19);
    EXPECT_THROW(reg.fit(data.X, y), cc::util::cancor_core_error);
}

TEST(RegressionSGD, fits_signal)
{
    const auto data = make_data(50, make_vec({1, -0.5, 0.25}), 0.05, 11);
    cc::regression::RegressionSGD<double> reg("l2", 1e-4, 0, 1e-3, 0);
    reg.fit(data.X, data.y);
    EXPECT_GE(reg.epochs(), 1u);
    EXPECT_LE(reg.epochs(), cc::Configs::sgd_max_epochs);
    EXPECT_TRUE(reg.coef().allFinite());
    const vec_t pred = (reg.coef().matrix() * data.X.transpose()).array();
    const double cos = (pred * data.y).sum() / (pred.matrix().norm() * data.y.matrix().norm());
    EXPECT_GT(cos, 0.9);
}

TEST(RegressionSGD, seeded)
{
    const auto data = make_data(30, make_vec({1, 2}), 0.1, 12);
    cc::regression::RegressionSGD<double> r1("elasticnet", 0.01, 0.5, 1e-3, 42);
    cc::regression::RegressionSGD<double> r2("elasticnet", 0.01, 0.5, 1e-3, 42);
    r1.fit(data.X, data.y);
    r2.fit(data.X, data.y);
    EXPECT_EQ(r1.epochs(), r2.epochs());
    EXPECT_TRUE((r1.coef() == r2.coef()).all());
}

TEST(RegressionSGD, invalid_penalty)
{
    EXPECT_THROW(
        cc::regression::RegressionSGD<double>("l3", 0.1, 0, 1e-3, 0), 
        cc::util::cancor_core_config_error
    );
}

TEST(RegressionFactory, select)
{
    using cc::util::regression_type;
    EXPECT_EQ(cc::regression::select_regression<double>(0.1, 0.5, false, true), regression_type::_sgd);
    EXPECT_EQ(cc::regression::select_regression<double>(0, 0.5, false, false), regression_type::_least_squares);
    EXPECT_EQ(cc::regression::select_regression<double>(0.1, 0, false, false), regression_type::_ridge);
    EXPECT_EQ(cc::regression::select_regression<double>(0.1, 0, true, false), regression_type::_elastic_net);
    EXPECT_EQ(cc::regression::select_regression<double>(0.1, 1, false, false), regression_type::_lasso);
    EXPECT_EQ(cc::regression::select_regression<double>(0.1, 0.3, false, false), regression_type::_elastic_net);
}

TEST(RegressionFactory, make)
{
    EXPECT_EQ(cc::regression::make_regression<double>(0, 0, false, false, 1e-3, 0)->name, "least_squares");
    EXPECT_EQ(cc::regression::make_regression<double>(0.1, 0, false, false, 1e-3, 0)->name, "ridge");
    EXPECT_EQ(cc::regression::make_regression<double>(0.1, 1, false, false, 1e-3, 0)->name, "lasso");
    EXPECT_EQ(cc::regression::make_regression<double>(0.1, 0.5, false, false, 1e-3, 0)->name, "elastic_net");
    EXPECT_EQ(cc::regression::make_regression<double>(0.1, 0.5, false, true, 1e-3, 0)->name, "sgd");
    EXPECT_EQ(cc::util::to_string(cc::util::regression_type::_ridge), "ridge");
}
