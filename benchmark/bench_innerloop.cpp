#include <benchmark/benchmark.h>
#include <random>
#include <vector>
#include <innerloop/innerloop.hpp>
#include <cancor_core/optimization/delta_search.hpp>

namespace cc = cancor_core;

static std::vector<cc::util::colmat_type<double>> make_views(
    Eigen::Index n, 
    Eigen::Index p
)
{
    std::mt19937 gen(0);
    std::normal_distribution<double> norm(0, 1);
    const cc::util::rowvec_type<double> z = cc::util::rowvec_type<double>::NullaryExpr(
        n, [&]() { return norm(gen); }
    );
    std::vector<cc::util::colmat_type<double>> views;
    for (int k = 0; k < 2; ++k) {
        const cc::util::rowvec_type<double> a = cc::util::rowvec_type<double>::NullaryExpr(
            p, [&]() { return norm(gen); }
        );
        cc::util::colmat_type<double> X = z.matrix().transpose() * a.matrix();
        X += cc::util::colmat_type<double>::NullaryExpr(n, p, [&]() { return norm(gen); });
        views.emplace_back(std::move(X));
    }
    return views;
}

static void BM_delta_search(benchmark::State& state) {
    const auto p = state.range(0);
    cc::util::rowvec_type<double> w(p); w.setRandom();
    cc::util::rowvec_type<double> out(p);

    for (auto _ : state) {
        const auto iters = cc::optimization::delta_search(w, 2.0, false, out);
        benchmark::DoNotOptimize(iters);
        benchmark::DoNotOptimize(out);
    }
}

BENCHMARK(BM_delta_search)
    -> Args({10})
    -> Args({100})
    -> Args({1000})
    -> Args({10000})
    ;

static void BM_pls(benchmark::State& state) {
    const auto n = state.range(0);
    const auto p = state.range(1);
    const auto views = make_views(n, p);
    cc::innerloop::InnerLoopPLS<double> pls(100, 1e-5, false, "random");

    for (auto _ : state) {
        const auto& s = pls.fit(views);
        benchmark::DoNotOptimize(s.scores);
    }
}

BENCHMARK(BM_pls)
    -> Args({100, 10})
    -> Args({1000, 10})
    -> Args({1000, 100})
    -> Args({10000, 100})
    ;

static void BM_pmd(benchmark::State& state) {
    const auto n = state.range(0);
    const auto p = state.range(1);
    const auto views = make_views(n, p);
    cc::innerloop::InnerLoopPMD<double> pmd(100, 1e-5, false, "random", {2});

    for (auto _ : state) {
        const auto& s = pmd.fit(views);
        benchmark::DoNotOptimize(s.scores);
    }
}

BENCHMARK(BM_pmd)
    -> Args({100, 10})
    -> Args({1000, 10})
    -> Args({1000, 100})
    -> Args({10000, 100})
    ;

static void BM_elastic(benchmark::State& state) {
    const auto n = state.range(0);
    const auto p = state.range(1);
    const auto views = make_views(n, p);
    cc::innerloop::InnerLoopElastic<double> elastic(100, 1e-5, false, "random", {0.01}, {0.5});

    for (auto _ : state) {
        const auto& s = elastic.fit(views);
        benchmark::DoNotOptimize(s.scores);
    }
}

BENCHMARK(BM_elastic)
    -> Args({100, 10})
    -> Args({1000, 10})
    -> Args({1000, 100})
    ;
