#pragma once
#include <cstddef>

namespace cancor_core {

struct Configs
{
    static constexpr const size_t bisect_max_iters_def = 50;
    static constexpr const double bisect_tol_def = 1e-5;
    static constexpr const double bisect_width_tol_def = 1e-30;
    static constexpr const double delta_upper_def = 10;
    static constexpr const size_t regression_max_iters_def = 1000;
    static constexpr const double regression_tol_def = 1e-4;
    static constexpr const size_t sgd_max_epochs_def = 1000;
    static constexpr const double sgd_eta0_def = 0.01;
    static constexpr const double sgd_power_t_def = 0.25;
    static constexpr const size_t sgd_n_iter_no_change_def = 5;
    static constexpr const double parkhomenko_c_def = 1e-4;
    static constexpr const double batch_norm_eps_def = 1e-5;

    inline static size_t bisect_max_iters = bisect_max_iters_def;
    inline static double bisect_tol = bisect_tol_def;
    inline static double bisect_width_tol = bisect_width_tol_def;
    inline static double delta_upper = delta_upper_def;
    inline static size_t regression_max_iters = regression_max_iters_def;
    inline static double regression_tol = regression_tol_def;
    inline static size_t sgd_max_epochs = sgd_max_epochs_def;
    inline static double sgd_eta0 = sgd_eta0_def;
    inline static double sgd_power_t = sgd_power_t_def;
    inline static size_t sgd_n_iter_no_change = sgd_n_iter_no_change_def;
    inline static double batch_norm_eps = batch_norm_eps_def;
};

} // namespace cancor_core
