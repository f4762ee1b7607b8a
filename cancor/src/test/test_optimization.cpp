#include <gtest/gtest.h>
#include <cmath>
#include <random>
#include <cancor_core/configs.hpp>
#include <cancor_core/optimization/bisect.hpp>
#include <cancor_core/optimization/delta_search.hpp>
#include <cancor_core/optimization/elnet_full.hpp>
#include <cancor_core/optimization/proximal.hpp>
#include <cancor_core/util/types.hpp>

namespace cc = cancor_core;

namespace {

using vec_t = cc::util::rowvec_type<double>;
using colmat_t = cc::util::colmat_type<double>;

vec_t random_vec(size_t p, size_t seed)
{
    std::mt19937 gen(seed);
    std::normal_distribution<double> norm(0, 1);
    return vec_t::NullaryExpr(p, [&]() { return norm(gen); });
}

} // namespace

TEST(BinSearch, step)
{
    double lower = 0, upper = 10;

    // negative value: move up towards upper
    auto next = cc::optimization::bin_search<double>(5, 5, -1, -1, lower, upper);
    EXPECT_DOUBLE_EQ(next, 7.5);
    EXPECT_DOUBLE_EQ(lower, 5);
    EXPECT_DOUBLE_EQ(upper, 10);

    // sign change: midpoint with the previous point
    next = cc::optimization::bin_search<double>(7.5, 5, 1, -1, lower, upper);
    EXPECT_DOUBLE_EQ(next, 6.25);
    EXPECT_DOUBLE_EQ(lower, 5);
    EXPECT_DOUBLE_EQ(upper, 7.5);

    // positive value twice: move down towards lower
    next = cc::optimization::bin_search<double>(6.25, 7.5, 1, 1, lower, upper);
    EXPECT_DOUBLE_EQ(next, 5.625);
    EXPECT_DOUBLE_EQ(upper, 6.25);
}

TEST(BinSearch, finds_root)
{
    const double root = 3.3;
    double lower = 0, upper = 10;
    double current = 0, previous = 0, previous_val = 0;
    for (int i = 0; i < 60; ++i) {
        const double val = current - root;
        if (i == 0) previous_val = val;
        const auto next = cc::optimization::bin_search(current, previous, val, previous_val, lower, upper);
        previous = current;
        previous_val = val;
        current = next;
    }
    EXPECT_NEAR(current, root, 1e-10);
    EXPECT_LE(lower, root);
    EXPECT_GE(upper, root);
}

TEST(SoftThreshold, basic)
{
    vec_t x(5);
    x << -3, -0.5, 0, 0.5, 3;
    vec_t out(5);
    cc::optimization::soft_threshold(x, 1.0, false, out);
    EXPECT_DOUBLE_EQ(out[0], -2);
    EXPECT_DOUBLE_EQ(out[1], 0);
    EXPECT_DOUBLE_EQ(out[2], 0);
    EXPECT_DOUBLE_EQ(out[3], 0);
    EXPECT_DOUBLE_EQ(out[4], 2);

    cc::optimization::soft_threshold(x, 1.0, true, out);
    EXPECT_DOUBLE_EQ(out[0], 0);
    EXPECT_DOUBLE_EQ(out[4], 2);
    EXPECT_TRUE((out >= 0.0).all());
}

TEST(SoftThreshold, in_place)
{
    vec_t x(3);
    x << -2, 0.25, 4;
    cc::optimization::soft_threshold(x, 0.5, false, x);
    EXPECT_DOUBLE_EQ(x[0], -1.5);
    EXPECT_DOUBLE_EQ(x[1], 0);
    EXPECT_DOUBLE_EQ(x[2], 3.5);
}

TEST(ProxMuF, regions)
{
    vec_t x(3), g(3), out(3);
    x << 1, 0, -1;
    g << 2, 0.1, -2;
    cc::optimization::prox_mu_f(x, 0.5, g, 1.0, out);
    EXPECT_DOUBLE_EQ(out[0], 1.5);
    EXPECT_DOUBLE_EQ(out[1], 0);
    EXPECT_DOUBLE_EQ(out[2], -1.5);

    // no penalty is a plain gradient step
    cc::optimization::prox_mu_f(x, 0.5, g, 0.0, out);
    EXPECT_DOUBLE_EQ(out[0], 2);
    EXPECT_DOUBLE_EQ(out[1], 0.05);
    EXPECT_DOUBLE_EQ(out[2], -2);
}

TEST(ProxLamG, projection)
{
    vec_t x(2), out(2);
    x << 3, 4;
    cc::optimization::prox_lam_g(x, out);
    EXPECT_DOUBLE_EQ(out[0], 0.6);
    EXPECT_DOUBLE_EQ(out[1], 0.8);

    // already inside the ball
    x << 0.3, 0.4;
    cc::optimization::prox_lam_g(x, out);
    EXPECT_DOUBLE_EQ(out[0], 0.3);
    EXPECT_DOUBLE_EQ(out[1], 0.4);
}

TEST(ProxLamG, idempotent)
{
    const vec_t x = 10 * random_vec(7, 3);
    vec_t once(7), twice(7);
    cc::optimization::prox_lam_g(x, once);
    cc::optimization::prox_lam_g(once, twice);
    EXPECT_NEAR(once.matrix().norm(), 1, 1e-12);
    EXPECT_TRUE(once.isApprox(twice, 1e-12));
}

TEST(DeltaSearch, l1_matches_c)
{
    const vec_t w = random_vec(20, 0);
    vec_t out(20);
    for (double c : {1.5, 2.0, 3.0}) {
        const auto iters = cc::optimization::delta_search(w, c, false, out);
        EXPECT_LE(iters, cc::Configs::bisect_max_iters);
        EXPECT_NEAR(out.matrix().norm(), 1, 1e-10);
        EXPECT_NEAR(out.abs().sum(), c, 1e-4);
    }
}

TEST(DeltaSearch, monotone_in_c)
{
    const vec_t w = random_vec(30, 1);
    vec_t out(30);
    cc::optimization::delta_search(w, 1.5, false, out);
    const auto nnz_small = (out != 0.0).count();
    const double l1_small = out.abs().sum();
    cc::optimization::delta_search(w, 4.0, false, out);
    const auto nnz_large = (out != 0.0).count();
    const double l1_large = out.abs().sum();
    EXPECT_LE(nnz_small, nnz_large);
    EXPECT_LT(l1_small, l1_large);
}

TEST(DeltaSearch, no_threshold_when_c_is_loose)
{
    const vec_t w = random_vec(10, 2);
    vec_t out(10);
    // the L1 norm of a unit vector never exceeds sqrt(p)
    cc::optimization::delta_search(w, std::sqrt(10.0), false, out);
    const vec_t expected = w / w.matrix().norm();
    EXPECT_TRUE(out.isApprox(expected, 1e-12));
}

TEST(DeltaSearch, positive)
{
    const vec_t w = random_vec(20, 4);
    vec_t out(20);
    cc::optimization::delta_search(w, 1.5, true, out);
    EXPECT_TRUE((out >= 0.0).all());
    EXPECT_NEAR(out.matrix().norm(), 1, 1e-10);
}

TEST(StateElnetFull, lasso_identity)
{
    const colmat_t quad = colmat_t::Identity(2, 2);
    vec_t penalty(2), x(2), grad(2);
    penalty << 1, 1;
    x.setZero();
    grad << 3, -0.5;

    cc::optimization::StateElnetFull<colmat_t> state(
        quad, penalty, false, 100, 1e-12, x, grad
    );
    state.solve();
    EXPECT_DOUBLE_EQ(x[0], 2);
    EXPECT_DOUBLE_EQ(x[1], 0);
    EXPECT_DOUBLE_EQ(grad[0], 1);
    EXPECT_DOUBLE_EQ(grad[1], -0.5);
}

TEST(StateElnetFull, positive)
{
    const colmat_t quad = colmat_t::Identity(2, 2);
    vec_t penalty(2), x(2), grad(2);
    penalty << 1, 1;
    x.setZero();
    grad << -3, 2;

    cc::optimization::StateElnetFull<colmat_t> state(
        quad, penalty, true, 100, 1e-12, x, grad
    );
    state.solve();
    EXPECT_DOUBLE_EQ(x[0], 0);
    EXPECT_DOUBLE_EQ(x[1], 1);
}

TEST(StateElnetFull, max_iters)
{
    colmat_t quad(2, 2);
    quad << 1, 0.9,
            0.9, 1;
    vec_t penalty = vec_t::Zero(2);
    vec_t x = vec_t::Zero(2);
    vec_t grad(2);
    grad << 1, -1;

    cc::optimization::StateElnetFull<colmat_t> state(
        quad, penalty, false, 1, 0, x, grad
    );
    EXPECT_THROW(state.solve(), cc::util::max_iters_error);
}

TEST(StateElnetFull, invalid_shapes)
{
    const colmat_t quad = colmat_t::Identity(2, 2);
    vec_t penalty(3), x(2), grad(2);
    EXPECT_THROW(
        (cc::optimization::StateElnetFull<colmat_t>(quad, penalty, false, 1, 0, x, grad)),
        cc::util::cancor_core_solver_error
    );
}
