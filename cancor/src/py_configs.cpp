#include "py_decl.hpp"
#include <cancor_core/configs.hpp>

namespace cc = cancor_core;

void configs(py::module_& m)
{
    using configs_t = cc::Configs;
    py::class_<configs_t>(m, "Configs")
        .def_readonly_static("bisect_max_iters_def", &configs_t::bisect_max_iters_def,
        "Default value for ``bisect_max_iters``.")
        .def_readonly_static("bisect_tol_def", &configs_t::bisect_tol_def,
        "Default value for ``bisect_tol``.")
        .def_readonly_static("bisect_width_tol_def", &configs_t::bisect_width_tol_def,
        "Default value for ``bisect_width_tol``.")
        .def_readonly_static("delta_upper_def", &configs_t::delta_upper_def,
        "Default value for ``delta_upper``.")
        .def_readonly_static("regression_max_iters_def", &configs_t::regression_max_iters_def,
        "Default value for ``regression_max_iters``.")
        .def_readonly_static("regression_tol_def", &configs_t::regression_tol_def,
        "Default value for ``regression_tol``.")
        .def_readonly_static("sgd_max_epochs_def", &configs_t::sgd_max_epochs_def,
        "Default value for ``sgd_max_epochs``.")
        .def_readonly_static("sgd_eta0_def", &configs_t::sgd_eta0_def,
        "Default value for ``sgd_eta0``.")
        .def_readonly_static("sgd_power_t_def", &configs_t::sgd_power_t_def,
        "Default value for ``sgd_power_t``.")
        .def_readonly_static("sgd_n_iter_no_change_def", &configs_t::sgd_n_iter_no_change_def,
        "Default value for ``sgd_n_iter_no_change``.")
        .def_readonly_static("parkhomenko_c_def", &configs_t::parkhomenko_c_def,
        "Default regularisation ``c`` of the Parkhomenko inner loop.")
        .def_readonly_static("batch_norm_eps_def", &configs_t::batch_norm_eps_def,
        "Default value for ``batch_norm_eps``.")
        .def_readwrite_static("bisect_max_iters", &configs_t::bisect_max_iters,
        "Maximum number of bisection steps in the threshold and multiplier searches.")
        .def_readwrite_static("bisect_tol", &configs_t::bisect_tol,
        "The bisection stops once the absolute function value is below this tolerance.")
        .def_readwrite_static("bisect_width_tol", &configs_t::bisect_width_tol,
        "The bisection stops once the bracket is narrower than this tolerance.")
        .def_readwrite_static("delta_upper", &configs_t::delta_upper,
        "Upper end of the bracket for the soft-threshold level.")
        .def_readwrite_static("regression_max_iters", &configs_t::regression_max_iters,
        "Maximum number of coordinate descent sweeps of the elastic net solver.")
        .def_readwrite_static("regression_tol", &configs_t::regression_tol, R"delimiter(
        Relative convergence tolerance of the elastic net solver.
        A sweep is converged once every scaled squared coordinate change
        is below ``regression_tol`` times the mean squared response.
        )delimiter")
        .def_readwrite_static("sgd_max_epochs", &configs_t::sgd_max_epochs,
        "Maximum number of epochs of the stochastic solver.")
        .def_readwrite_static("sgd_eta0", &configs_t::sgd_eta0,
        "Initial step size of the stochastic solver.")
        .def_readwrite_static("sgd_power_t", &configs_t::sgd_power_t,
        "Exponent of the inverse scaling step size schedule.")
        .def_readwrite_static("sgd_n_iter_no_change", &configs_t::sgd_n_iter_no_change,
        "Number of epochs without sufficient improvement before the stochastic solver stops.")
        .def_readwrite_static("batch_norm_eps", &configs_t::batch_norm_eps,
        "Added to the variance when batch-normalizing embeddings.")
        ;
}

void register_configs(py::module_& m)
{
    configs(m);
}
